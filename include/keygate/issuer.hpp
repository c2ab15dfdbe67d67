#pragma once

/**
 * @file issuer.hpp
 * @brief Key issuer for the admin console
 *
 * The issuing authority: creates, resets, deletes and lists activation-key
 * records in the shared store. It holds no state of its own beyond its
 * configuration; every operation is one store round-trip.
 *
 * Example usage:
 * @code
 * auto store = std::make_shared<keygate::MemoryStore>();
 * keygate::Issuer issuer(store);
 *
 * auto code = issuer.issue({"Acme", "+20 100 000", ""}, 30);
 * if (code.is_ok()) {
 *     std::cout << "Issued " << code.value() << std::endl;
 * }
 * @endcode
 */

#include "keygate/events.hpp"
#include "keygate/keygate.hpp"
#include "keygate/store.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace keygate {

/**
 * @brief Issuer configuration
 */
struct IssuerConfig {
    /// Prefix of generated codes
    std::string code_prefix = "YSK";

    /// Number of random characters at the end of a code (4 or more)
    std::size_t suffix_length = 4;

    /// Time source for the code timestamp (system clock when empty)
    Clock clock;

    /// Enable debug logging
    bool debug = false;
};

using IssueCallback = std::function<void(Result<std::string>)>;
using ResetCallback = std::function<void(Result<ActivationKey>)>;
using RemoveCallback = std::function<void(Result<void>)>;

/**
 * @brief Admin-side key management
 *
 * Thread-safe. Async variants run on a background thread; the issuer waits
 * for them to finish before it is destroyed, so callbacks must not destroy
 * the issuer that invoked them.
 */
class Issuer {
  public:
    /// Construct an issuer writing to the given store
    explicit Issuer(std::shared_ptr<StoreInterface> store, IssuerConfig config = {});

    /// Destructor
    ~Issuer();

    // Non-copyable
    Issuer(const Issuer&) = delete;
    Issuer& operator=(const Issuer&) = delete;

    // Movable
    Issuer(Issuer&&) noexcept;
    Issuer& operator=(Issuer&&) noexcept;

    // ========== Synchronous API ==========

    /// Issue a new unused key
    /// @param client Descriptive client metadata
    /// @param duration_days Validity length once activated (1 to MAX_DURATION_DAYS)
    /// @return The generated code
    [[nodiscard]] Result<std::string> issue(const ClientInfo& client, int duration_days);

    /// Return a key to unused, clearing its device binding
    /// @param code The code to reset
    /// @return The record after the reset (ErrorCode::NotFound if absent)
    [[nodiscard]] Result<ActivationKey> reset(const std::string& code);

    /// Delete a key; deleting a missing code succeeds
    [[nodiscard]] Result<void> remove(const std::string& code);

    /// All keys, newest first
    [[nodiscard]] Result<std::vector<ActivationKey>> list_all();

    /// Keys whose display status matches the filter (std::nullopt for all), newest first
    /// @param filter Status to keep; an activated key past its expiry counts as expired
    /// @param now Time the display status is computed at
    [[nodiscard]] Result<std::vector<ActivationKey>> list(std::optional<KeyStatus> filter,
                                                          Timestamp now);

    // ========== Asynchronous API ==========

    /// Issue a key asynchronously
    void issue_async(const ClientInfo& client, int duration_days, IssueCallback callback);

    /// Reset a key asynchronously
    void reset_async(const std::string& code, ResetCallback callback);

    /// Delete a key asynchronously
    void remove_async(const std::string& code, RemoveCallback callback);

    // ========== Change Notification ==========

    /// Follow every change to the collection (for a live listing)
    /// @return Subscription handle (call cancel() to stop)
    Subscription watch(CollectionHandler handler);

    /// Subscribe to issuer events
    /// @param event Event name (e.g., "issue:success")
    /// @param handler Callback function
    EventSubscription on(const std::string& event, EventHandler handler);

    /// Get the current configuration
    [[nodiscard]] const IssuerConfig& config() const noexcept;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace keygate
