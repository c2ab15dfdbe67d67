#include "keygate/issuer.hpp"
#include "keygate/code.hpp"
#include "keygate/json.hpp"

#include "async.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <map>

namespace keygate {

namespace {

constexpr const char* kComponent = "issuer";
const char* const kNoStore = "No key store configured";

}  // namespace

// PIMPL implementation
class Issuer::Impl {
  public:
    Impl(std::shared_ptr<StoreInterface> store, IssuerConfig config)
        : store_(std::move(store)), config_(std::move(config)) {
        if (!config_.clock) {
            config_.clock = [] { return std::chrono::system_clock::now(); };
        }

        bool debug = config_.debug;
        event_bus_.set_error_sink([debug](const std::string& event, const std::exception& error) {
            detail::debug_log(debug, kComponent, "handler for " + event + " threw: " + error.what());
        });
    }

    ~Impl() { tasks_.wait_idle(); }

    // ========== Synchronous API ==========

    Result<std::string> issue(const ClientInfo& client, int duration_days) {
        if (duration_days <= 0 || duration_days > MAX_DURATION_DAYS) {
            return fail<std::string>(events::ISSUE_ERROR, "", ErrorCode::ValidationError,
                                     "Duration must be between 1 and " +
                                         std::to_string(MAX_DURATION_DAYS) + " days");
        }
        if (!store_) {
            return fail<std::string>(events::ISSUE_ERROR, "", ErrorCode::StoreUnavailable, kNoStore);
        }

        Timestamp now = json::truncate_to_millis(config_.clock());
        auto code = code::generate(config_.code_prefix, now, config_.suffix_length);
        if (code.is_error()) {
            return fail<std::string>(events::ISSUE_ERROR, "", code.error_code(), code.error_message());
        }

        ActivationKey record(code.value(), client, duration_days, KeyStatus::Unused, now, std::nullopt);
        auto stored = store_->set(record);
        if (stored.is_error()) {
            return fail<std::string>(events::ISSUE_ERROR, code.value(), stored.error_code(),
                                     stored.error_message());
        }

        detail::debug_log(config_.debug, kComponent,
                          "issued " + code.value() + " for " + std::to_string(duration_days) + " days");
        event_bus_.emit(events::ISSUE_SUCCESS, stored.value());
        return code;
    }

    Result<ActivationKey> reset(const std::string& code) {
        if (code.empty()) {
            return fail<ActivationKey>(events::RESET_ERROR, code, ErrorCode::ValidationError,
                                       "Activation code cannot be empty");
        }
        if (!store_) {
            return fail<ActivationKey>(events::RESET_ERROR, code, ErrorCode::StoreUnavailable, kNoStore);
        }

        auto result = store_->update(code, KeyUpdate::clear());
        if (result.is_error()) {
            return fail<ActivationKey>(events::RESET_ERROR, code, result.error_code(),
                                       result.error_message());
        }

        detail::debug_log(config_.debug, kComponent, "reset " + code);
        event_bus_.emit(events::RESET_SUCCESS, result.value());
        return result;
    }

    Result<void> remove(const std::string& code) {
        if (code.empty()) {
            return fail<void>(events::REMOVE_ERROR, code, ErrorCode::ValidationError,
                              "Activation code cannot be empty");
        }
        if (!store_) {
            return fail<void>(events::REMOVE_ERROR, code, ErrorCode::StoreUnavailable, kNoStore);
        }

        auto result = store_->remove(code);
        if (result.is_error()) {
            return fail<void>(events::REMOVE_ERROR, code, result.error_code(), result.error_message());
        }

        detail::debug_log(config_.debug, kComponent, "removed " + code);
        event_bus_.emit(events::REMOVE_SUCCESS, std::map<std::string, std::string>{{"code", code}});
        return result;
    }

    Result<std::vector<ActivationKey>> list_all() {
        if (!store_) {
            return Result<std::vector<ActivationKey>>::error(ErrorCode::StoreUnavailable, kNoStore);
        }

        auto result = store_->list();
        if (result.is_error()) {
            return result;
        }

        auto records = std::move(result).value();
        std::sort(records.begin(), records.end(), [](const ActivationKey& a, const ActivationKey& b) {
            if (a.created_at() != b.created_at()) {
                return a.created_at() > b.created_at();
            }
            return a.code() > b.code();
        });
        return Result<std::vector<ActivationKey>>::ok(std::move(records));
    }

    Result<std::vector<ActivationKey>> list(std::optional<KeyStatus> filter, Timestamp now) {
        auto result = list_all();
        if (result.is_error() || !filter) {
            return result;
        }

        auto records = std::move(result).value();
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [&](const ActivationKey& record) {
                                         return record.display_status(now) != *filter;
                                     }),
                      records.end());
        return Result<std::vector<ActivationKey>>::ok(std::move(records));
    }

    // ========== Asynchronous API ==========

    void issue_async(const ClientInfo& client, int duration_days, IssueCallback callback) {
        tasks_.run([this, client, duration_days, callback = std::move(callback)]() {
            auto result = this->issue(client, duration_days);
            if (callback) {
                callback(std::move(result));
            }
        });
    }

    void reset_async(const std::string& code, ResetCallback callback) {
        tasks_.run([this, code, callback = std::move(callback)]() {
            auto result = this->reset(code);
            if (callback) {
                callback(std::move(result));
            }
        });
    }

    void remove_async(const std::string& code, RemoveCallback callback) {
        tasks_.run([this, code, callback = std::move(callback)]() {
            auto result = this->remove(code);
            if (callback) {
                callback(std::move(result));
            }
        });
    }

    // ========== Change Notification ==========

    Subscription watch(CollectionHandler handler) {
        if (!store_) {
            return Subscription();
        }
        return store_->on_any_change(std::move(handler));
    }

    EventSubscription on(const std::string& event, EventHandler handler) {
        return event_bus_.on(event, std::move(handler));
    }

    const IssuerConfig& config() const noexcept { return config_; }

  private:
    template <typename T>
    Result<T> fail(const char* event, const std::string& code, ErrorCode error, const std::string& message) {
        detail::debug_log(config_.debug, kComponent,
                          std::string(event) + (code.empty() ? "" : " " + code) + ": " + message);
        event_bus_.emit(event, std::map<std::string, std::string>{
                                   {"code", code}, {"error", error_code_to_string(error)}, {"message", message}});
        if (error == ErrorCode::StoreUnavailable) {
            event_bus_.emit(events::STORE_UNAVAILABLE, std::map<std::string, std::string>{{"error", message}});
        }
        return Result<T>::error(error, message);
    }

    std::shared_ptr<StoreInterface> store_;
    IssuerConfig config_;
    EventBus event_bus_;
    detail::AsyncTracker tasks_;
};

// ==================== Issuer ====================

Issuer::Issuer(std::shared_ptr<StoreInterface> store, IssuerConfig config)
    : impl_(std::make_unique<Impl>(std::move(store), std::move(config))) {}

Issuer::~Issuer() = default;

Issuer::Issuer(Issuer&&) noexcept = default;
Issuer& Issuer::operator=(Issuer&&) noexcept = default;

Result<std::string> Issuer::issue(const ClientInfo& client, int duration_days) {
    return impl_->issue(client, duration_days);
}

Result<ActivationKey> Issuer::reset(const std::string& code) {
    return impl_->reset(code);
}

Result<void> Issuer::remove(const std::string& code) {
    return impl_->remove(code);
}

Result<std::vector<ActivationKey>> Issuer::list_all() {
    return impl_->list_all();
}

Result<std::vector<ActivationKey>> Issuer::list(std::optional<KeyStatus> filter, Timestamp now) {
    return impl_->list(filter, now);
}

void Issuer::issue_async(const ClientInfo& client, int duration_days, IssueCallback callback) {
    impl_->issue_async(client, duration_days, std::move(callback));
}

void Issuer::reset_async(const std::string& code, ResetCallback callback) {
    impl_->reset_async(code, std::move(callback));
}

void Issuer::remove_async(const std::string& code, RemoveCallback callback) {
    impl_->remove_async(code, std::move(callback));
}

Subscription Issuer::watch(CollectionHandler handler) {
    return impl_->watch(std::move(handler));
}

EventSubscription Issuer::on(const std::string& event, EventHandler handler) {
    return impl_->on(event, std::move(handler));
}

const IssuerConfig& Issuer::config() const noexcept {
    return impl_->config();
}

}  // namespace keygate
