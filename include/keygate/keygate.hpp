#pragma once

/**
 * @file keygate.hpp
 * @brief keygate core types
 *
 * Activation keys, their device binding, the gating verdict and the Result
 * type shared by the issuer (admin side) and the engine (application side).
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace keygate {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Error codes returned by keygate operations
enum class ErrorCode {
    Success = 0,

    // Input errors
    ValidationError,

    // Record errors
    NotFound,
    Conflict,
    AlreadyUsed,

    // Store errors
    StoreUnavailable,
    PermissionDenied,

    // Parse errors
    ParseError,

    // File errors
    FileError,

    Unknown
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::ValidationError:
            return "Validation error";
        case ErrorCode::NotFound:
            return "Activation code not found";
        case ErrorCode::Conflict:
            return "Activation code was activated elsewhere";
        case ErrorCode::AlreadyUsed:
            return "Activation code already used";
        case ErrorCode::StoreUnavailable:
            return "Key store unavailable";
        case ErrorCode::PermissionDenied:
            return "Permission denied";
        case ErrorCode::ParseError:
            return "Parse error";
        case ErrorCode::FileError:
            return "File error";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/// Whether an operation failing with this code may be retried as-is
[[nodiscard]] constexpr bool is_retryable(ErrorCode code) noexcept {
    return code == ErrorCode::StoreUnavailable;
}

/// Record status as stored in the key store
enum class KeyStatus {
    Unused,
    Activated,
    Expired,
    Tampered  // Client-local overlay, never written to the shared store
};

/// Convert key status to its wire string
[[nodiscard]] constexpr const char* key_status_to_string(KeyStatus status) noexcept {
    switch (status) {
        case KeyStatus::Unused:
            return "unused";
        case KeyStatus::Activated:
            return "activated";
        case KeyStatus::Expired:
            return "expired";
        case KeyStatus::Tampered:
            return "tampered";
    }
    return "unused";
}

/// Parse key status from its wire string
[[nodiscard]] inline std::optional<KeyStatus> key_status_from_string(const std::string& str) noexcept {
    if (str == "unused")
        return KeyStatus::Unused;
    if (str == "activated")
        return KeyStatus::Activated;
    if (str == "expired")
        return KeyStatus::Expired;
    if (str == "tampered")
        return KeyStatus::Tampered;
    return std::nullopt;
}

/// Gating decision for the protected application
enum class Verdict {
    Inactive,  // No usable key: show the activation prompt
    Active,    // Run the application
    Expired,   // Locked: validity window elapsed
    Tampered   // Locked: the device clock moved backwards
};

/// Convert verdict to string
[[nodiscard]] constexpr const char* verdict_to_string(Verdict verdict) noexcept {
    switch (verdict) {
        case Verdict::Inactive:
            return "inactive";
        case Verdict::Active:
            return "active";
        case Verdict::Expired:
            return "expired";
        case Verdict::Tampered:
            return "tampered";
    }
    return "inactive";
}

/// Parse verdict from string
[[nodiscard]] inline std::optional<Verdict> verdict_from_string(const std::string& str) noexcept {
    if (str == "inactive")
        return Verdict::Inactive;
    if (str == "active")
        return Verdict::Active;
    if (str == "expired")
        return Verdict::Expired;
    if (str == "tampered")
        return Verdict::Tampered;
    return std::nullopt;
}

/**
 * @brief Result type for operations that can fail
 *
 * An error may carry the state that caused it (e.g. the record that was
 * already bound when an activation was rejected).
 *
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        r.error_ = ErrorCode::Success;
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /// Construct an error result carrying the conflicting state
    static Result error(ErrorCode code, std::string message, T state) {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        r.error_state_ = std::move(state);
        return r;
    }

    /// Check if the result is successful
    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }

    /// Check if the result is an error
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Get the error code
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }

    /// Get the error message
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

    /// Get the state attached to an error (empty for most errors)
    [[nodiscard]] const std::optional<T>& error_state() const noexcept { return error_state_; }

  private:
    Result() = default;
    std::optional<T> value_;
    std::optional<T> error_state_;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Specialization for void results
template <> class Result<void> {
  public:
    static Result ok() {
        Result r;
        r.error_ = ErrorCode::Success;
        return r;
    }

    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Timestamp type used throughout keygate (stored with millisecond precision)
using Timestamp = std::chrono::system_clock::time_point;

/// Time source, injectable for tests
using Clock = std::function<Timestamp()>;

/// Length of one validity day
constexpr std::chrono::hours DAY{24};

/// Longest validity a key may carry (about one hundred years)
constexpr int MAX_DURATION_DAYS = 36500;

/**
 * @brief Descriptive client metadata attached to a key
 *
 * Informational only; never consulted when gating.
 */
struct ClientInfo {
    std::string name;
    std::string phone;
    std::string notes;

    bool operator==(const ClientInfo& other) const {
        return name == other.name && phone == other.phone && notes == other.notes;
    }
    bool operator!=(const ClientInfo& other) const { return !(*this == other); }
};

/**
 * @brief Association of a key with one device and its validity window
 *
 * The three fields are set together on activation and cleared together on
 * reset; a key never holds a partial binding.
 */
struct Binding {
    std::string device_id;
    Timestamp activated_at;
    Timestamp expires_at;

    bool operator==(const Binding& other) const {
        return device_id == other.device_id && activated_at == other.activated_at &&
               expires_at == other.expires_at;
    }
    bool operator!=(const Binding& other) const { return !(*this == other); }
};

/**
 * @brief One issued activation key record
 *
 * `code`, `client`, `duration_days` and `created_at` never change after
 * issuance. Status and binding change only through with_state() and bound(),
 * which return modified copies.
 */
class ActivationKey {
  public:
    ActivationKey() = default;

    /// Full constructor with all fields
    ActivationKey(std::string code, ClientInfo client, int duration_days, KeyStatus status,
                  Timestamp created_at, std::optional<Binding> binding)
        : code_(std::move(code)),
          client_(std::move(client)),
          duration_days_(duration_days),
          status_(status),
          created_at_(created_at),
          binding_(std::move(binding)) {}

    /// Get the activation code
    [[nodiscard]] const std::string& code() const noexcept { return code_; }

    /// Get the client metadata
    [[nodiscard]] const ClientInfo& client() const noexcept { return client_; }

    /// Get the validity length in days
    [[nodiscard]] int duration_days() const noexcept { return duration_days_; }

    /// Get the stored status
    [[nodiscard]] KeyStatus status() const noexcept { return status_; }

    /// Get the issuance timestamp (assigned by the store)
    [[nodiscard]] const Timestamp& created_at() const noexcept { return created_at_; }

    /// Get the device binding, if the key has been activated
    [[nodiscard]] const std::optional<Binding>& binding() const noexcept { return binding_; }

    /// Check if the key has never been activated (or was reset)
    [[nodiscard]] bool is_unused() const noexcept { return status_ == KeyStatus::Unused; }

    /// Check if the key is bound to the given device
    [[nodiscard]] bool is_bound_to(const std::string& device_id) const noexcept {
        return binding_.has_value() && binding_->device_id == device_id;
    }

    /// Check if the binding window has elapsed at the given time
    [[nodiscard]] bool is_expired_at(Timestamp now) const noexcept {
        return binding_.has_value() && now > binding_->expires_at;
    }

    /// Status shown in listings: an activated key past its expiry shows as expired
    [[nodiscard]] KeyStatus display_status(Timestamp now) const noexcept {
        if (status_ == KeyStatus::Activated && is_expired_at(now)) {
            return KeyStatus::Expired;
        }
        return status_;
    }

    /// Copy of this key with the given status and binding
    [[nodiscard]] ActivationKey with_state(KeyStatus status, std::optional<Binding> binding) const {
        ActivationKey copy = *this;
        copy.status_ = status;
        copy.binding_ = std::move(binding);
        return copy;
    }

    /// Copy of this key bound to a device at the given time
    [[nodiscard]] ActivationKey bound(const std::string& device_id, Timestamp now) const {
        return with_state(KeyStatus::Activated,
                          Binding{device_id, now, now + DAY * duration_days_});
    }

    /// Copy of this key with a different creation time (store stamping)
    [[nodiscard]] ActivationKey stamped(Timestamp created_at) const {
        ActivationKey copy = *this;
        copy.created_at_ = created_at;
        return copy;
    }

    bool operator==(const ActivationKey& other) const {
        return code_ == other.code_ && client_ == other.client_ &&
               duration_days_ == other.duration_days_ && status_ == other.status_ &&
               created_at_ == other.created_at_ && binding_ == other.binding_;
    }
    bool operator!=(const ActivationKey& other) const { return !(*this == other); }

  private:
    std::string code_;
    ClientInfo client_;
    int duration_days_ = 0;
    KeyStatus status_ = KeyStatus::Unused;
    Timestamp created_at_;
    std::optional<Binding> binding_;
};

/// Callback receiving a record update, or std::nullopt when the record was removed
using RecordHandler = std::function<void(const std::optional<ActivationKey>&)>;

/// Callback receiving a collection update: the changed code and its new record
using CollectionHandler =
    std::function<void(const std::string& code, const std::optional<ActivationKey>&)>;

/**
 * @brief Subscription handle for change notifications
 */
class Subscription {
  public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe) : unsubscribe_(std::move(unsubscribe)) {}

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

}  // namespace keygate
