#include "keygate/engine.hpp"
#include "keygate/device.hpp"
#include "keygate/json.hpp"
#include "keygate/verdict.hpp"

#include "async.hpp"
#include "log.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace keygate {

namespace {

constexpr const char* kComponent = "engine";
const char* const kNoStore = "No key store configured";

// Last value handed to one subscriber, used to drop repeated notifications
struct DeliveryState {
    std::mutex mutex;
    bool delivered = false;
    std::optional<ActivationKey> last;
};

}  // namespace

// PIMPL implementation
class Engine::Impl {
  public:
    Impl(std::shared_ptr<StoreInterface> store, EngineConfig config,
         std::unique_ptr<StorageInterface> storage)
        : store_(std::move(store)), config_(std::move(config)), storage_(std::move(storage)) {
        if (!config_.clock) {
            config_.clock = [] { return std::chrono::system_clock::now(); };
        }

        bool debug = config_.debug;
        event_bus_.set_error_sink([debug](const std::string& event, const std::exception& error) {
            detail::debug_log(debug, kComponent, "handler for " + event + " threw: " + error.what());
        });

        // Derive the device identifier if not provided
        device_id_ = config_.device_id.empty() ? device::generate_device_id() : config_.device_id;
        if (config_.debug) {
            detail::debug_log(true, kComponent,
                              "device " + device_id_ + " on " + device::get_platform_name() + " (" +
                                  device::get_hostname() + ")");
        }

        if (!storage_) {
            if (!config_.storage_path.empty()) {
                storage_ = std::make_unique<FileStorage>(config_.storage_path, config_.storage_prefix);
            } else {
                storage_ = std::make_unique<MemoryStorage>();
            }
        }

        // Restore device-local state from the previous run
        watermark_ = storage_->get_watermark();
        verdict_ = storage_->get_verdict().value_or(Verdict::Inactive);

        auto cached = storage_->get_activation();
        if (cached) {
            tracked_code_ = cached->code;
            tracked_device_ = cached->device_id.empty() ? device_id_ : cached->device_id;
            cached_ = cached->record;
            detail::debug_log(config_.debug, kComponent,
                              "restored " + cached->code + " (verdict " + verdict_to_string(verdict_) + ")");
            track(cached->code);
        }
    }

    ~Impl() {
        tasks_.wait_idle();
        lifeline_->close();

        Subscription tracking;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tracking = std::exchange(tracking_, Subscription());
            ++generation_;
        }
        tracking.cancel();
    }

    // ========== Activation ==========

    Result<ActivationKey> activate(const std::string& code, const std::string& device_id,
                                   std::optional<Timestamp> now) {
        const std::string& device = device_id.empty() ? device_id_ : device_id;

        event_bus_.emit(events::ACTIVATION_START,
                        std::map<std::string, std::string>{{"code", code}, {"device_id", device}});

        if (code.empty()) {
            return fail_activation(code, ErrorCode::ValidationError, "Activation code cannot be empty");
        }
        if (device.empty()) {
            return fail_activation(code, ErrorCode::ValidationError,
                                   "No device id configured and none could be derived");
        }
        if (!store_) {
            return fail_activation(code, ErrorCode::StoreUnavailable, kNoStore);
        }

        auto existing = store_->get(code);
        if (existing.is_error()) {
            return fail_activation(code, existing.error_code(), existing.error_message());
        }
        if (!existing.value()) {
            return fail_activation(code, ErrorCode::NotFound, "No activation key with code " + code);
        }

        const ActivationKey& record = *existing.value();
        if (!record.is_unused()) {
            // Our own earlier binding (e.g. after local state was wiped): follow it again,
            // together with any verdict latched for it before it was forgotten
            if (record.is_bound_to(device)) {
                remember(code, device, record, true);
                (void)current_verdict();
            }
            return fail_activation(code, ErrorCode::AlreadyUsed,
                                   "Activation code is already " +
                                       std::string(key_status_to_string(record.status())),
                                   record);
        }

        Timestamp at = json::truncate_to_millis(now.value_or(config_.clock()));
        auto updated = store_->update(code, KeyUpdate::bind(*record.bound(device, at).binding()));
        if (updated.is_error()) {
            if (updated.error_code() == ErrorCode::Conflict) {
                return fail_activation(code, ErrorCode::Conflict,
                                       "Activation code was activated by another device",
                                       updated.error_state());
            }
            return fail_activation(code, updated.error_code(), updated.error_message());
        }

        // A fresh binding starts a new lifecycle: drop any latched verdict unless
        // the store already delivered this binding to us
        {
            std::lock_guard<std::mutex> lock(mutex_);
            storage_->clear_held_verdict(code);
            if (tracked_code_ != code) {
                hold_latch_locked();
            }
            if (tracked_code_ != code || cached_ != updated.value()) {
                verdict_ = Verdict::Inactive;
            }
        }
        remember(code, device, updated.value());

        detail::debug_log(config_.debug, kComponent,
                          "activated " + code + " on " + device + " until " +
                              json::format_timestamp(updated.value().binding()->expires_at));
        event_bus_.emit(events::ACTIVATION_SUCCESS, updated.value());

        (void)current_verdict();
        return updated;
    }

    void activate_async(const std::string& code, ActivationCallback callback,
                        const std::string& device_id) {
        tasks_.run([this, code, device_id, callback = std::move(callback)]() {
            auto result = this->activate(code, device_id, std::nullopt);
            if (callback) {
                callback(std::move(result));
            }
        });
    }

    // ========== Gating ==========

    Verdict current_verdict() {
        Verdict previous;
        Verdict latched;
        Timestamp now;
        std::optional<Timestamp> observed;
        std::optional<std::string> code;

        {
            std::lock_guard<std::mutex> lock(mutex_);

            now = config_.clock();
            observed = watermark_;
            code = tracked_code_;

            // A record bound to another device never unlocks this one
            std::optional<ActivationKey> ours = cached_;
            if (ours && ours->binding() && !ours->is_bound_to(tracked_device_)) {
                ours.reset();
            }
            Verdict computed = evaluate(ours, now, watermark_);

            watermark_ = advance_watermark(watermark_, now);
            if (!storage_->set_watermark(*watermark_)) {
                detail::debug_log(config_.debug, kComponent, "failed to persist the watermark");
            }

            previous = verdict_;
            latched = next_verdict(pending_latch_.value_or(previous), computed);
            if (latched != previous) {
                verdict_ = latched;
                if (!storage_->set_verdict(latched)) {
                    detail::debug_log(config_.debug, kComponent, "failed to persist the verdict");
                }
            }
            if (pending_latch_) {
                pending_latch_.reset();
                if (tracked_code_) {
                    storage_->clear_held_verdict(*tracked_code_);
                }
            }
        }

        if (latched != previous) {
            detail::debug_log(config_.debug, kComponent,
                              std::string("verdict ") + verdict_to_string(previous) + " -> " +
                                  verdict_to_string(latched));

            if (latched == Verdict::Tampered) {
                event_bus_.emit(events::TAMPER_DETECTED,
                                std::map<std::string, std::string>{
                                    {"code", code.value_or("")},
                                    {"now", json::format_timestamp(now)},
                                    {"watermark", observed ? json::format_timestamp(*observed) : ""}});
            }
            event_bus_.emit(events::VERDICT_CHANGED, latched);
        }

        return latched;
    }

    std::optional<ActivationKey> current_record() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cached_;
    }

    std::optional<std::string> current_code() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tracked_code_;
    }

    std::optional<Timestamp> watermark() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return watermark_;
    }

    // ========== Remote Changes ==========

    Subscription subscribe(const std::string& code, RecordHandler handler) {
        if (!store_ || !handler || code.empty()) {
            return Subscription();
        }

        auto state = std::make_shared<DeliveryState>();
        return store_->on_change(code, [state, handler](const std::optional<ActivationKey>& record) {
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->delivered && state->last == record) {
                    return;
                }
                state->delivered = true;
                state->last = record;
            }
            handler(record);
        });
    }

    Result<std::optional<ActivationKey>> refresh() {
        std::optional<std::string> code;
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            code = tracked_code_;
            generation = generation_;
        }

        if (!code) {
            return Result<std::optional<ActivationKey>>::ok(std::nullopt);
        }
        if (!store_) {
            return Result<std::optional<ActivationKey>>::error(ErrorCode::StoreUnavailable, kNoStore);
        }

        auto result = store_->get(*code);
        if (result.is_error()) {
            detail::debug_log(config_.debug, kComponent,
                              "refresh of " + *code + " failed: " + result.error_message());
            if (result.error_code() == ErrorCode::StoreUnavailable) {
                event_bus_.emit(events::STORE_UNAVAILABLE,
                                std::map<std::string, std::string>{{"error", result.error_message()}});
            }
            return result;
        }

        apply_remote(*code, generation, result.value());
        (void)current_verdict();
        return result;
    }

    void refresh_async(RefreshCallback callback) {
        tasks_.run([this, callback = std::move(callback)]() {
            auto result = this->refresh();
            if (callback) {
                callback(std::move(result));
            }
        });
    }

    void forget() {
        Subscription tracking;
        std::optional<std::string> code;
        bool verdict_changed = false;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            tracking = std::exchange(tracking_, Subscription());
            ++generation_;

            code = tracked_code_;
            hold_latch_locked();
            tracked_code_.reset();
            tracked_device_.clear();
            cached_.reset();
            pending_latch_.reset();
            storage_->clear_activation();

            verdict_changed = verdict_ != Verdict::Inactive;
            verdict_ = Verdict::Inactive;
            if (!storage_->set_verdict(Verdict::Inactive)) {
                detail::debug_log(config_.debug, kComponent, "failed to persist the verdict");
            }
        }

        tracking.cancel();

        detail::debug_log(config_.debug, kComponent, "forgot " + code.value_or("(nothing)"));
        event_bus_.emit(events::ENGINE_FORGOTTEN,
                        std::map<std::string, std::string>{{"code", code.value_or("")}});
        if (verdict_changed) {
            event_bus_.emit(events::VERDICT_CHANGED, Verdict::Inactive);
        }
    }

    // ========== Events & State ==========

    EventSubscription on(const std::string& event, EventHandler handler) {
        return event_bus_.on(event, std::move(handler));
    }

    const EngineConfig& config() const noexcept { return config_; }

    const std::string& device_id() const noexcept { return device_id_; }

  private:
    Result<ActivationKey> fail_activation(const std::string& code, ErrorCode error,
                                          const std::string& message,
                                          const std::optional<ActivationKey>& state = std::nullopt) {
        detail::debug_log(config_.debug, kComponent, "activation of " + code + " failed: " + message);
        event_bus_.emit(events::ACTIVATION_ERROR,
                        std::map<std::string, std::string>{
                            {"code", code}, {"error", error_code_to_string(error)}, {"message", message}});
        if (error == ErrorCode::StoreUnavailable) {
            event_bus_.emit(events::STORE_UNAVAILABLE,
                            std::map<std::string, std::string>{{"error", message}});
        }

        if (state) {
            return Result<ActivationKey>::error(error, message, *state);
        }
        return Result<ActivationKey>::error(error, message);
    }

    // Make code the remembered activation and follow its changes. With
    // restore_latch, a verdict held for code takes effect on the next evaluation.
    void remember(const std::string& code, const std::string& device, const ActivationKey& record,
                  bool restore_latch = false) {
        bool same_code = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            same_code = tracked_code_ == code;
            if (!same_code) {
                hold_latch_locked();
                if (restore_latch) {
                    pending_latch_ = storage_->get_held_verdict(code).value_or(Verdict::Inactive);
                }
            }
            tracked_code_ = code;
            tracked_device_ = device;
            cached_ = record;
            persist_activation_locked();
        }
        if (!same_code) {
            track(code);
        }
    }

    void track(const std::string& code) {
        Subscription previous;
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            previous = std::exchange(tracking_, Subscription());
            generation = ++generation_;
        }
        previous.cancel();

        if (!store_) {
            return;
        }

        auto subscription = store_->on_change(
            code, [this, lifeline = lifeline_, code, generation](const std::optional<ActivationKey>& record) {
                lifeline->run([&]() { this->apply_remote(code, generation, record); });
            });

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation == generation_) {
                tracking_ = std::move(subscription);
                return;
            }
        }
        // Superseded while subscribing
        subscription.cancel();
    }

    void apply_remote(const std::string& code, uint64_t generation,
                      const std::optional<ActivationKey>& record) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_ || tracked_code_ != code) {
                return;
            }
            if (cached_ == record) {
                return;
            }
            cached_ = record;
            persist_activation_locked();
        }

        if (record) {
            detail::debug_log(config_.debug, kComponent,
                              "record " + code + " is now " + key_status_to_string(record->status()));
            event_bus_.emit(events::RECORD_CHANGED, *record);
        } else {
            detail::debug_log(config_.debug, kComponent, "record " + code + " was removed");
            event_bus_.emit(events::RECORD_REMOVED, std::map<std::string, std::string>{{"code", code}});
        }

        (void)current_verdict();
    }

    // A tampered or expired code keeps its latch when tracking moves away from it
    void hold_latch_locked() {
        if (!tracked_code_ || (verdict_ != Verdict::Tampered && verdict_ != Verdict::Expired)) {
            return;
        }
        if (!storage_->set_held_verdict(*tracked_code_, verdict_)) {
            detail::debug_log(config_.debug, kComponent, "failed to hold the verdict of " + *tracked_code_);
        }
    }

    void persist_activation_locked() {
        if (!tracked_code_) {
            return;
        }
        CachedActivation activation{*tracked_code_, tracked_device_, cached_, config_.clock()};
        if (!storage_->set_activation(activation)) {
            detail::debug_log(config_.debug, kComponent, "failed to persist " + *tracked_code_);
        }
    }

    std::shared_ptr<StoreInterface> store_;
    EngineConfig config_;
    std::unique_ptr<StorageInterface> storage_;
    std::string device_id_;
    EventBus event_bus_;

    std::optional<std::string> tracked_code_;
    std::string tracked_device_;
    std::optional<ActivationKey> cached_;
    std::optional<Timestamp> watermark_;
    Verdict verdict_ = Verdict::Inactive;
    // Held latch of a re-adopted code, applied by the next current_verdict()
    std::optional<Verdict> pending_latch_;
    Subscription tracking_;
    uint64_t generation_ = 0;
    mutable std::mutex mutex_;

    std::shared_ptr<detail::Lifeline> lifeline_ = std::make_shared<detail::Lifeline>();
    detail::AsyncTracker tasks_;
};

// ==================== Engine ====================

Engine::Engine(std::shared_ptr<StoreInterface> store, EngineConfig config)
    : impl_(std::make_unique<Impl>(std::move(store), std::move(config), nullptr)) {}

Engine::Engine(std::shared_ptr<StoreInterface> store, EngineConfig config,
               std::unique_ptr<StorageInterface> storage)
    : impl_(std::make_unique<Impl>(std::move(store), std::move(config), std::move(storage))) {}

Engine::~Engine() = default;

Engine::Engine(Engine&&) noexcept = default;
Engine& Engine::operator=(Engine&&) noexcept = default;

Result<ActivationKey> Engine::activate(const std::string& code, const std::string& device_id,
                                       std::optional<Timestamp> now) {
    return impl_->activate(code, device_id, now);
}

void Engine::activate_async(const std::string& code, ActivationCallback callback,
                            const std::string& device_id) {
    impl_->activate_async(code, std::move(callback), device_id);
}

Verdict Engine::current_verdict() {
    return impl_->current_verdict();
}

std::optional<ActivationKey> Engine::current_record() const {
    return impl_->current_record();
}

std::optional<std::string> Engine::current_code() const {
    return impl_->current_code();
}

std::optional<Timestamp> Engine::watermark() const {
    return impl_->watermark();
}

Subscription Engine::subscribe(const std::string& code, RecordHandler handler) {
    return impl_->subscribe(code, std::move(handler));
}

Result<std::optional<ActivationKey>> Engine::refresh() {
    return impl_->refresh();
}

void Engine::refresh_async(RefreshCallback callback) {
    impl_->refresh_async(std::move(callback));
}

void Engine::forget() {
    impl_->forget();
}

EventSubscription Engine::on(const std::string& event, EventHandler handler) {
    return impl_->on(event, std::move(handler));
}

const EngineConfig& Engine::config() const noexcept {
    return impl_->config();
}

const std::string& Engine::device_id() const noexcept {
    return impl_->device_id();
}

}  // namespace keygate
