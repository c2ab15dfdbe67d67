#include "keygate/store.hpp"
#include "keygate/json.hpp"

#include <chrono>

namespace keygate {

namespace {

const char* const kUnavailable = "Key store is not reachable";

}  // namespace

MemoryStore::MemoryStore(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

Result<std::optional<ActivationKey>> MemoryStore::get(const std::string& code) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!available_) {
        return Result<std::optional<ActivationKey>>::error(ErrorCode::StoreUnavailable, kUnavailable);
    }

    auto it = records_.find(code);
    if (it == records_.end()) {
        return Result<std::optional<ActivationKey>>::ok(std::nullopt);
    }
    return Result<std::optional<ActivationKey>>::ok(it->second);
}

Result<ActivationKey> MemoryStore::set(const ActivationKey& record) {
    ActivationKey stored;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!available_) {
            return Result<ActivationKey>::error(ErrorCode::StoreUnavailable, kUnavailable);
        }
        if (record.code().empty()) {
            return Result<ActivationKey>::error(ErrorCode::ValidationError,
                                                "Record has no code");
        }

        stored = record.stamped(json::truncate_to_millis(clock_()));
        records_[stored.code()] = stored;
    }

    notify(stored.code(), stored);
    return Result<ActivationKey>::ok(std::move(stored));
}

Result<ActivationKey> MemoryStore::update(const std::string& code, const KeyUpdate& update) {
    ActivationKey updated;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!available_) {
            return Result<ActivationKey>::error(ErrorCode::StoreUnavailable, kUnavailable);
        }

        auto it = records_.find(code);
        if (it == records_.end()) {
            return Result<ActivationKey>::error(ErrorCode::NotFound, "No record for code " + code);
        }

        if (update.expected_status && it->second.status() != *update.expected_status) {
            return Result<ActivationKey>::error(
                ErrorCode::Conflict,
                std::string("Record is ") + key_status_to_string(it->second.status()) +
                    ", expected " + key_status_to_string(*update.expected_status),
                it->second);
        }

        updated = it->second.with_state(update.status, update.binding);
        if (updated == it->second) {
            return Result<ActivationKey>::ok(std::move(updated));
        }
        it->second = updated;
    }

    notify(code, updated);
    return Result<ActivationKey>::ok(std::move(updated));
}

Result<void> MemoryStore::remove(const std::string& code) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!available_) {
            return Result<void>::error(ErrorCode::StoreUnavailable, kUnavailable);
        }
        if (records_.erase(code) == 0) {
            return Result<void>::ok();
        }
    }

    notify(code, std::nullopt);
    return Result<void>::ok();
}

Result<std::vector<ActivationKey>> MemoryStore::list() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!available_) {
        return Result<std::vector<ActivationKey>>::error(ErrorCode::StoreUnavailable, kUnavailable);
    }

    std::vector<ActivationKey> result;
    result.reserve(records_.size());
    for (const auto& [code, record] : records_) {
        result.push_back(record);
    }
    return Result<std::vector<ActivationKey>>::ok(std::move(result));
}

Subscription MemoryStore::on_change(const std::string& code, RecordHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto id = next_id_++;
    record_handlers_[id] = {code, std::move(handler)};
    return Subscription([this, id]() { this->remove_handler(id); });
}

Subscription MemoryStore::on_any_change(CollectionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto id = next_id_++;
    collection_handlers_[id] = std::move(handler);
    return Subscription([this, id]() { this->remove_handler(id); });
}

void MemoryStore::set_available(bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = available;
}

std::size_t MemoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void MemoryStore::notify(const std::string& code, const std::optional<ActivationKey>& record) {
    std::vector<RecordHandler> record_handlers;
    std::vector<CollectionHandler> collection_handlers;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : record_handlers_) {
            if (entry.first == code) {
                record_handlers.push_back(entry.second);
            }
        }
        for (const auto& [id, handler] : collection_handlers_) {
            collection_handlers.push_back(handler);
        }
    }

    // Call handlers outside the lock so they may call back into the store
    for (const auto& handler : record_handlers) {
        handler(record);
    }
    for (const auto& handler : collection_handlers) {
        handler(code, record);
    }
}

void MemoryStore::remove_handler(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_handlers_.erase(id);
    collection_handlers_.erase(id);
}

}  // namespace keygate
