#pragma once

/**
 * @file events.hpp
 * @brief Event bus for keygate lifecycle notifications
 *
 * The issuer and the engine publish what they do here; the admin console and
 * the application shell subscribe to react (toasts, screen changes, logging).
 */

#include <algorithm>
#include <any>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace keygate {

/// Event data type - can hold any value
using EventData = std::any;

/// Event handler callback type
using EventHandler = std::function<void(const EventData&)>;

/// Receives exceptions thrown by event handlers
using HandlerErrorSink = std::function<void(const std::string& event, const std::exception& error)>;

/// Internal subscription handle for EventBus
class EventSubscription {
  public:
    EventSubscription() = default;
    explicit EventSubscription(std::function<void()> unsubscribe) : unsubscribe_(std::move(unsubscribe)) {}

    /// Cancel this subscription
    void cancel() {
        if (unsubscribe_) {
            unsubscribe_();
            unsubscribe_ = nullptr;
        }
    }

    /// Check if subscription is active
    [[nodiscard]] bool is_active() const { return unsubscribe_ != nullptr; }

  private:
    std::function<void()> unsubscribe_;
};

/**
 * @brief Event bus for keygate events
 *
 * Handlers run on the emitting thread, outside the bus lock. A handler that
 * throws does not stop the remaining handlers; the exception is passed to the
 * error sink when one is installed.
 *
 * Events (see the `events` namespace below):
 * - "issue:success" / "issue:error" - Key issuance
 * - "reset:success" / "reset:error" - Admin reset
 * - "remove:success" / "remove:error" - Admin deletion
 * - "activation:start" / "activation:success" / "activation:error"
 * - "verdict:changed" - The gating verdict changed
 * - "tamper:detected" - The device clock moved behind the watermark
 * - "record:changed" - A pushed record update was applied
 * - "record:removed" - The watched record was deleted remotely
 * - "store:unavailable" - A store round-trip failed
 * - "engine:forgotten" - The remembered code was dropped
 */
class EventBus {
  public:
    EventBus() = default;
    ~EventBus() = default;

    // Non-copyable
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Not movable (contains mutex)
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    /**
     * @brief Subscribe to an event
     *
     * @param event Event name
     * @param handler Callback function
     * @return Subscription handle to unsubscribe
     */
    EventSubscription on(const std::string& event, EventHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto id = next_id_++;
        handlers_[event].push_back({id, std::move(handler)});

        return EventSubscription([this, event, id]() { this->remove_handler(event, id); });
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * @param event Event name
     * @param data Event data (optional)
     */
    void emit(const std::string& event, const EventData& data = {}) {
        std::vector<EventHandler> handlers_copy;
        HandlerErrorSink sink;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(event);
            if (it != handlers_.end()) {
                for (const auto& entry : it->second) {
                    handlers_copy.push_back(entry.handler);
                }
            }
            sink = error_sink_;
        }

        // Call handlers outside the lock to prevent deadlocks
        for (const auto& handler : handlers_copy) {
            try {
                handler(data);
            } catch (const std::exception& e) {
                if (sink) {
                    sink(event, e);
                }
            }
        }
    }

    /// Install the sink receiving handler exceptions
    void set_error_sink(HandlerErrorSink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_sink_ = std::move(sink);
    }

  private:
    struct HandlerEntry {
        uint64_t id;
        EventHandler handler;
    };

    void remove_handler(const std::string& event, uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event);
        if (it != handlers_.end()) {
            auto& vec = it->second;
            vec.erase(std::remove_if(vec.begin(), vec.end(),
                                     [id](const HandlerEntry& e) { return e.id == id; }),
                      vec.end());
        }
    }

    std::unordered_map<std::string, std::vector<HandlerEntry>> handlers_;
    HandlerErrorSink error_sink_;
    std::mutex mutex_;
    uint64_t next_id_ = 0;
};

// Common event names as constants
namespace events {
constexpr const char* ISSUE_SUCCESS = "issue:success";
constexpr const char* ISSUE_ERROR = "issue:error";
constexpr const char* RESET_SUCCESS = "reset:success";
constexpr const char* RESET_ERROR = "reset:error";
constexpr const char* REMOVE_SUCCESS = "remove:success";
constexpr const char* REMOVE_ERROR = "remove:error";
constexpr const char* ACTIVATION_START = "activation:start";
constexpr const char* ACTIVATION_SUCCESS = "activation:success";
constexpr const char* ACTIVATION_ERROR = "activation:error";
constexpr const char* VERDICT_CHANGED = "verdict:changed";
constexpr const char* TAMPER_DETECTED = "tamper:detected";
constexpr const char* RECORD_CHANGED = "record:changed";
constexpr const char* RECORD_REMOVED = "record:removed";
constexpr const char* STORE_UNAVAILABLE = "store:unavailable";
constexpr const char* ENGINE_FORGOTTEN = "engine:forgotten";
}  // namespace events

}  // namespace keygate
