#pragma once

/**
 * @file store.hpp
 * @brief Shared key record store
 *
 * The store is keyed by activation code and shared by the issuer and every
 * engine. It owns the clock used for issuance timestamps and provides the
 * per-key compare-and-swap that makes activation at-most-once.
 */

#include "keygate/keygate.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace keygate {

/**
 * @brief Atomic change to a record's status and binding
 *
 * When expected_status is set the change applies only if the stored status
 * still equals it; otherwise the update fails with ErrorCode::Conflict and
 * carries the current record.
 */
struct KeyUpdate {
    KeyStatus status = KeyStatus::Unused;
    std::optional<Binding> binding;  // std::nullopt clears the binding
    std::optional<KeyStatus> expected_status;

    /// Bind an unused key
    [[nodiscard]] static KeyUpdate bind(Binding binding) {
        return KeyUpdate{KeyStatus::Activated, std::move(binding), KeyStatus::Unused};
    }

    /// Return a key to unused, whatever its current status
    [[nodiscard]] static KeyUpdate clear() { return KeyUpdate{KeyStatus::Unused, std::nullopt, std::nullopt}; }
};

/**
 * @brief Key store interface
 *
 * Every operation is one round-trip. Transport failures surface as
 * ErrorCode::StoreUnavailable and never leave a partial write behind.
 *
 * Change handlers may run on any thread, may see the same record more than
 * once, and may receive the current value right after subscribing; consumers
 * apply them idempotently.
 */
class StoreInterface {
  public:
    virtual ~StoreInterface() = default;

    /// Fetch a record (std::nullopt when the code does not exist)
    [[nodiscard]] virtual Result<std::optional<ActivationKey>> get(const std::string& code) = 0;

    /// Write a record, replacing any existing one; created_at is assigned by the store clock
    [[nodiscard]] virtual Result<ActivationKey> set(const ActivationKey& record) = 0;

    /// Atomically apply an update (ErrorCode::NotFound when the code does not exist)
    [[nodiscard]] virtual Result<ActivationKey> update(const std::string& code,
                                                       const KeyUpdate& update) = 0;

    /// Delete a record; deleting a missing code succeeds
    [[nodiscard]] virtual Result<void> remove(const std::string& code) = 0;

    /// Fetch every record
    [[nodiscard]] virtual Result<std::vector<ActivationKey>> list() = 0;

    /// Watch one record
    virtual Subscription on_change(const std::string& code, RecordHandler handler) = 0;

    /// Watch the whole collection
    virtual Subscription on_any_change(CollectionHandler handler) = 0;
};

/**
 * @brief In-process store
 *
 * Keeps records in memory behind one mutex, stamps created_at with its own
 * clock and notifies subscribers synchronously on the writing thread, after
 * the write and outside the lock. Updates that leave a record unchanged do
 * not notify.
 */
class MemoryStore : public StoreInterface {
  public:
    /// Construct with the store clock (system clock when empty)
    explicit MemoryStore(Clock clock = {});

    [[nodiscard]] Result<std::optional<ActivationKey>> get(const std::string& code) override;
    [[nodiscard]] Result<ActivationKey> set(const ActivationKey& record) override;
    [[nodiscard]] Result<ActivationKey> update(const std::string& code,
                                               const KeyUpdate& update) override;
    [[nodiscard]] Result<void> remove(const std::string& code) override;
    [[nodiscard]] Result<std::vector<ActivationKey>> list() override;

    Subscription on_change(const std::string& code, RecordHandler handler) override;
    Subscription on_any_change(CollectionHandler handler) override;

    /// Simulate losing (or regaining) the connection to the store
    void set_available(bool available);

    /// Number of stored records
    [[nodiscard]] std::size_t size() const;

  private:
    void notify(const std::string& code, const std::optional<ActivationKey>& record);
    void remove_handler(uint64_t id);

    Clock clock_;
    std::map<std::string, ActivationKey> records_;
    std::map<uint64_t, std::pair<std::string, RecordHandler>> record_handlers_;
    std::map<uint64_t, CollectionHandler> collection_handlers_;
    uint64_t next_id_ = 0;
    bool available_ = true;
    mutable std::mutex mutex_;
};

}  // namespace keygate
