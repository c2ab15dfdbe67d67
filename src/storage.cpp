#include "keygate/storage.hpp"
#include "keygate/json.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>
#include <system_error>

namespace keygate {

// ==================== FileStorage Implementation ====================

FileStorage::FileStorage(const std::string& storage_path, const std::string& prefix)
    : storage_path_(storage_path), prefix_(prefix) {
    ensure_directory();
}

std::filesystem::path FileStorage::get_activation_path() const {
    return storage_path_ / (prefix_ + "_activation.json");
}

std::filesystem::path FileStorage::get_watermark_path() const {
    return storage_path_ / (prefix_ + "_watermark.json");
}

std::filesystem::path FileStorage::get_verdict_path() const {
    return storage_path_ / (prefix_ + "_verdict.json");
}

std::filesystem::path FileStorage::get_held_path() const {
    return storage_path_ / (prefix_ + "_held.json");
}

bool FileStorage::ensure_directory() const {
    std::error_code ec;
    if (std::filesystem::exists(storage_path_, ec)) {
        return true;
    }
    std::filesystem::create_directories(storage_path_, ec);
    return !ec;
}

bool FileStorage::write_file(const std::filesystem::path& path, const std::string& content) {
    if (!ensure_directory()) {
        return false;
    }

    auto temp_path = path;
    temp_path += ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }
        file << content;
        if (!file.flush()) {
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return false;
    }
    return true;
}

std::optional<std::string> FileStorage::read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return content;
}

void FileStorage::remove_file(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

bool FileStorage::set_activation(const CachedActivation& activation) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json j;
    j["code"] = activation.code;
    j["device_id"] = activation.device_id;
    j["record"] = activation.record ? json::activation_key_to_json(*activation.record)
                                    : nlohmann::json(nullptr);
    j["last_synced"] = json::to_millis(activation.last_synced);

    return write_file(get_activation_path(), j.dump(2));
}

std::optional<CachedActivation> FileStorage::get_activation() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto content = read_file(get_activation_path());
    if (!content) {
        return std::nullopt;
    }

    auto j = nlohmann::json::parse(*content, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("code") || !j["code"].is_string()) {
        return std::nullopt;
    }

    CachedActivation activation;
    activation.code = j["code"].get<std::string>();
    if (activation.code.empty()) {
        return std::nullopt;
    }

    if (j.contains("device_id") && j["device_id"].is_string()) {
        activation.device_id = j["device_id"].get<std::string>();
    }

    if (j.contains("record") && !j["record"].is_null()) {
        auto record = json::parse_activation_key(j["record"]);
        if (record.is_error()) {
            return std::nullopt;
        }
        activation.record = std::move(record).value();
    }

    if (j.contains("last_synced") && j["last_synced"].is_number_integer()) {
        activation.last_synced = json::from_millis(j["last_synced"].get<int64_t>());
    }

    return activation;
}

void FileStorage::clear_activation() {
    std::lock_guard<std::mutex> lock(mutex_);
    remove_file(get_activation_path());
}

bool FileStorage::set_watermark(Timestamp watermark) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json j;
    j["watermark"] = json::to_millis(watermark);
    return write_file(get_watermark_path(), j.dump());
}

std::optional<Timestamp> FileStorage::get_watermark() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto content = read_file(get_watermark_path());
    if (!content) {
        return std::nullopt;
    }

    auto j = nlohmann::json::parse(*content, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("watermark") ||
        !j["watermark"].is_number_integer()) {
        return std::nullopt;
    }
    return json::from_millis(j["watermark"].get<int64_t>());
}

bool FileStorage::set_verdict(Verdict verdict) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json j;
    j["verdict"] = verdict_to_string(verdict);
    return write_file(get_verdict_path(), j.dump());
}

std::optional<Verdict> FileStorage::get_verdict() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto content = read_file(get_verdict_path());
    if (!content) {
        return std::nullopt;
    }

    auto j = nlohmann::json::parse(*content, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("verdict") || !j["verdict"].is_string()) {
        return std::nullopt;
    }
    return verdict_from_string(j["verdict"].get<std::string>());
}

std::map<std::string, Verdict> FileStorage::read_held() {
    std::map<std::string, Verdict> held;

    auto content = read_file(get_held_path());
    if (!content) {
        return held;
    }

    auto j = nlohmann::json::parse(*content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return held;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) {
            continue;
        }
        auto verdict = verdict_from_string(it.value().get<std::string>());
        if (verdict) {
            held[it.key()] = *verdict;
        }
    }
    return held;
}

bool FileStorage::write_held(const std::map<std::string, Verdict>& held) {
    if (held.empty()) {
        remove_file(get_held_path());
        return true;
    }

    nlohmann::json j = nlohmann::json::object();
    for (const auto& [code, verdict] : held) {
        j[code] = verdict_to_string(verdict);
    }
    return write_file(get_held_path(), j.dump(2));
}

bool FileStorage::set_held_verdict(const std::string& code, Verdict verdict) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto held = read_held();
    held[code] = verdict;
    return write_held(held);
}

std::optional<Verdict> FileStorage::get_held_verdict(const std::string& code) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto held = read_held();
    auto it = held.find(code);
    if (it == held.end()) {
        return std::nullopt;
    }
    return it->second;
}

void FileStorage::clear_held_verdict(const std::string& code) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto held = read_held();
    if (held.erase(code) > 0) {
        (void)write_held(held);
    }
}

void FileStorage::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::directory_iterator it(storage_path_, ec);
    if (ec) {
        return;
    }

    // Remove all files with our prefix
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return;
        }
        if (it->path().filename().string().rfind(prefix_ + "_", 0) == 0) {
            std::error_code remove_ec;
            std::filesystem::remove(it->path(), remove_ec);
        }
    }
}

// ==================== MemoryStorage Implementation ====================

bool MemoryStorage::set_activation(const CachedActivation& activation) {
    std::lock_guard<std::mutex> lock(mutex_);
    activation_ = activation;
    return true;
}

std::optional<CachedActivation> MemoryStorage::get_activation() {
    std::lock_guard<std::mutex> lock(mutex_);
    return activation_;
}

void MemoryStorage::clear_activation() {
    std::lock_guard<std::mutex> lock(mutex_);
    activation_.reset();
}

bool MemoryStorage::set_watermark(Timestamp watermark) {
    std::lock_guard<std::mutex> lock(mutex_);
    watermark_ = watermark;
    return true;
}

std::optional<Timestamp> MemoryStorage::get_watermark() {
    std::lock_guard<std::mutex> lock(mutex_);
    return watermark_;
}

bool MemoryStorage::set_verdict(Verdict verdict) {
    std::lock_guard<std::mutex> lock(mutex_);
    verdict_ = verdict;
    return true;
}

std::optional<Verdict> MemoryStorage::get_verdict() {
    std::lock_guard<std::mutex> lock(mutex_);
    return verdict_;
}

bool MemoryStorage::set_held_verdict(const std::string& code, Verdict verdict) {
    std::lock_guard<std::mutex> lock(mutex_);
    held_[code] = verdict;
    return true;
}

std::optional<Verdict> MemoryStorage::get_held_verdict(const std::string& code) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = held_.find(code);
    if (it == held_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStorage::clear_held_verdict(const std::string& code) {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.erase(code);
}

void MemoryStorage::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    activation_.reset();
    watermark_.reset();
    verdict_.reset();
    held_.clear();
}

}  // namespace keygate
