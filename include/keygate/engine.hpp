#pragma once

/**
 * @file engine.hpp
 * @brief Activation engine for the protected application
 *
 * Redeems a code once, binds it to this device, follows remote changes to
 * the bound record and decides whether the application may run. The
 * decision combines the record's validity window with a device-local
 * watermark so that winding the clock back is detected.
 *
 * Example usage:
 * @code
 * keygate::EngineConfig config;
 * config.storage_path = "/var/lib/myapp/keygate";
 *
 * keygate::Engine engine(store, config);
 * engine.on(keygate::events::VERDICT_CHANGED, [](const std::any& data) {
 *     auto verdict = std::any_cast<keygate::Verdict>(data);
 *     std::cout << "verdict: " << keygate::verdict_to_string(verdict) << std::endl;
 * });
 *
 * if (engine.current_verdict() == keygate::Verdict::Inactive) {
 *     auto result = engine.activate(code_from_user);
 * }
 * @endcode
 */

#include "keygate/events.hpp"
#include "keygate/keygate.hpp"
#include "keygate/storage.hpp"
#include "keygate/store.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace keygate {

/**
 * @brief Engine configuration
 */
struct EngineConfig {
    /// Device ID (derived from the machine identifier if empty)
    std::string device_id;

    /// Directory for device-local state (in-memory only if empty)
    std::string storage_path;

    /// Storage prefix for file names
    std::string storage_prefix = "keygate";

    /// Local wall clock (system clock when empty)
    Clock clock;

    /// Enable debug logging
    bool debug = false;
};

using ActivationCallback = std::function<void(Result<ActivationKey>)>;
using RefreshCallback = std::function<void(Result<std::optional<ActivationKey>>)>;

/**
 * @brief Client-side activation and gating
 *
 * Thread-safe. The engine never holds its lock across a store round-trip,
 * so stores may deliver change notifications on the calling thread.
 */
class Engine {
  public:
    /// Construct an engine; storage follows config.storage_path
    explicit Engine(std::shared_ptr<StoreInterface> store, EngineConfig config = {});

    /// Construct an engine with custom device-local storage
    Engine(std::shared_ptr<StoreInterface> store, EngineConfig config,
           std::unique_ptr<StorageInterface> storage);

    /// Destructor
    ~Engine();

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Movable
    Engine(Engine&&) noexcept;
    Engine& operator=(Engine&&) noexcept;

    // ========== Activation ==========

    /// Redeem a code and bind it to a device
    /// @param code The activation code
    /// @param device_id Device to bind (uses the engine's device id if empty)
    /// @param now Activation time (engine clock if not given)
    /// @return The bound record; ErrorCode::AlreadyUsed carries the existing
    ///         record as error_state()
    [[nodiscard]] Result<ActivationKey> activate(const std::string& code,
                                                 const std::string& device_id = "",
                                                 std::optional<Timestamp> now = std::nullopt);

    /// Redeem a code asynchronously
    /// @param code The activation code
    /// @param callback Called when activation completes
    /// @param device_id Device to bind (uses the engine's device id if empty)
    void activate_async(const std::string& code, ActivationCallback callback,
                        const std::string& device_id = "");

    // ========== Gating ==========

    /// Evaluate the remembered record now, advancing the watermark and
    /// applying the tamper/expiry latch. A record that is bound to another
    /// device evaluates as Inactive.
    [[nodiscard]] Verdict current_verdict();

    /// The remembered record (std::nullopt if none or removed)
    [[nodiscard]] std::optional<ActivationKey> current_record() const;

    /// The remembered activation code
    [[nodiscard]] std::optional<std::string> current_code() const;

    /// Latest local time observed on this device
    [[nodiscard]] std::optional<Timestamp> watermark() const;

    // ========== Remote Changes ==========

    /// Follow changes to a record
    /// @param code The code to watch
    /// @param handler Receives each distinct record value, or std::nullopt on removal
    /// @return Subscription handle (call cancel() to stop)
    Subscription subscribe(const std::string& code, RecordHandler handler);

    /// Re-fetch the remembered record from the store
    [[nodiscard]] Result<std::optional<ActivationKey>> refresh();

    /// Re-fetch the remembered record asynchronously
    void refresh_async(RefreshCallback callback);

    /// Drop the remembered code and record; the watermark is kept
    void forget();

    // ========== Events & State ==========

    /// Subscribe to engine events
    /// @param event Event name (e.g., "verdict:changed")
    /// @param handler Callback function
    EventSubscription on(const std::string& event, EventHandler handler);

    /// Get the current configuration
    [[nodiscard]] const EngineConfig& config() const noexcept;

    /// Get the device ID (derived if not in config)
    [[nodiscard]] const std::string& device_id() const noexcept;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace keygate
