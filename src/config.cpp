#include "keygate/config.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <regex>
#include <utility>
#include <vector>

namespace keygate {

namespace {

// Field names as they appear in the hosting console's config object
std::vector<std::pair<const char*, std::string StoreConfig::*>> snippet_fields() {
    return {
        {"apiKey", &StoreConfig::api_key},
        {"authDomain", &StoreConfig::auth_domain},
        {"databaseURL", &StoreConfig::database_url},
        {"projectId", &StoreConfig::project_id},
        {"storageBucket", &StoreConfig::storage_bucket},
        {"messagingSenderId", &StoreConfig::messaging_sender_id},
        {"appId", &StoreConfig::app_id},
        {"measurementId", &StoreConfig::measurement_id},
    };
}

}  // namespace

Result<void> StoreConfig::validate() const {
    std::string missing;
    auto require = [&missing](const std::string& value, const char* name) {
        if (value.empty()) {
            missing += missing.empty() ? name : std::string(", ") + name;
        }
    };
    require(api_key, "apiKey");
    require(database_url, "databaseURL");
    require(project_id, "projectId");

    if (!missing.empty()) {
        return Result<void>::error(ErrorCode::ValidationError, "Missing required fields: " + missing);
    }
    if (database_url.rfind("https://", 0) != 0 && database_url.rfind("http://", 0) != 0) {
        return Result<void>::error(ErrorCode::ValidationError,
                                   "databaseURL must start with http:// or https://");
    }
    if (root.empty()) {
        return Result<void>::error(ErrorCode::ValidationError, "Collection root cannot be empty");
    }
    return Result<void>::ok();
}

Result<StoreConfig> parse_store_config_snippet(const std::string& text) {
    StoreConfig config;
    int found = 0;

    for (const auto& [name, member] : snippet_fields()) {
        // Accept quoted and unquoted keys: apiKey: "x" or "apiKey": "x"
        std::regex pattern(std::string("\"?") + name + "\"?\\s*:\\s*\"([^\"]*)\"");
        std::smatch match;
        if (std::regex_search(text, match, pattern) && match[1].length() > 0) {
            config.*member = match[1].str();
            ++found;
        }
    }

    if (found == 0) {
        return Result<StoreConfig>::error(ErrorCode::ValidationError,
                                          "No config fields found in the pasted text");
    }
    return Result<StoreConfig>::ok(std::move(config));
}

Result<StoreConfig> load_store_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<StoreConfig>::error(ErrorCode::FileError, "Cannot open " + path);
    }

    try {
        auto j = nlohmann::json::parse(file);

        StoreConfig config;
        for (const auto& [name, member] : snippet_fields()) {
            if (j.contains(name) && j[name].is_string()) {
                config.*member = j[name].get<std::string>();
            }
        }
        config.root = j.value("root", config.root);
        config.auth_token = j.value("authToken", "");
        return Result<StoreConfig>::ok(std::move(config));
    } catch (const nlohmann::json::exception& e) {
        return Result<StoreConfig>::error(ErrorCode::ParseError,
                                          std::string("Invalid store config: ") + e.what());
    }
}

Result<void> save_store_config(const StoreConfig& config, const std::string& path) {
    nlohmann::json j;
    for (const auto& [name, member] : snippet_fields()) {
        j[name] = config.*member;
    }
    j["root"] = config.root;
    j["authToken"] = config.auth_token;

    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Result<void>::error(ErrorCode::FileError,
                                       "Cannot create " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return Result<void>::error(ErrorCode::FileError, "Cannot write " + path);
    }
    file << j.dump(2);
    if (!file) {
        return Result<void>::error(ErrorCode::FileError, "Failed writing " + path);
    }
    return Result<void>::ok();
}

}  // namespace keygate
