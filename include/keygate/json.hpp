#pragma once

/**
 * @file json.hpp
 * @brief JSON serialization of keygate records
 *
 * Uses nlohmann/json for the record wire shape shared by the issuer and the
 * engine. Timestamps travel as integer milliseconds since the Unix epoch and
 * unset binding fields as JSON null.
 */

#include "keygate.hpp"

#include <nlohmann/json.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace keygate {
namespace json {

using nlohmann::json;

// ==================== Timestamp Helpers ====================

/// Convert Timestamp to milliseconds since the Unix epoch
[[nodiscard]] inline int64_t to_millis(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

/// Convert milliseconds since the Unix epoch to Timestamp
[[nodiscard]] inline Timestamp from_millis(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis)));
}

/// Truncate a Timestamp to the precision records are stored with
[[nodiscard]] inline Timestamp truncate_to_millis(const Timestamp& ts) {
    return from_millis(to_millis(ts));
}

/// Format Timestamp to ISO 8601 string (UTC, second precision)
[[nodiscard]] inline std::string format_timestamp(const Timestamp& ts) {
    auto time = std::chrono::system_clock::to_time_t(ts);
    std::tm tm = {};
#if defined(_MSC_VER)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

/// Server-side timestamp placeholder understood by the hosted store
[[nodiscard]] inline json server_timestamp() {
    return json{{".sv", "timestamp"}};
}

// ==================== Client Info ====================

/// Parse ClientInfo from JSON (missing fields become empty strings)
[[nodiscard]] inline ClientInfo parse_client(const json& j) {
    ClientInfo client;
    if (!j.is_object()) {
        return client;
    }
    if (j.contains("name") && j["name"].is_string()) {
        client.name = j["name"].get<std::string>();
    }
    if (j.contains("phone") && j["phone"].is_string()) {
        client.phone = j["phone"].get<std::string>();
    }
    if (j.contains("notes") && j["notes"].is_string()) {
        client.notes = j["notes"].get<std::string>();
    }
    return client;
}

/// Convert ClientInfo to JSON object
[[nodiscard]] inline json client_to_json(const ClientInfo& client) {
    return json{{"name", client.name}, {"phone", client.phone}, {"notes", client.notes}};
}

// ==================== Activation Key ====================

/// Binding fields of a record, as written by activation and reset
[[nodiscard]] inline json binding_to_json(const std::optional<Binding>& binding) {
    json j = json::object();
    if (binding) {
        j["deviceId"] = binding->device_id;
        j["activatedAt"] = to_millis(binding->activated_at);
        j["expiresAt"] = to_millis(binding->expires_at);
    } else {
        j["deviceId"] = nullptr;
        j["activatedAt"] = nullptr;
        j["expiresAt"] = nullptr;
    }
    return j;
}

/// Convert ActivationKey to its wire shape
[[nodiscard]] inline json activation_key_to_json(const ActivationKey& key) {
    json j = binding_to_json(key.binding());
    j["code"] = key.code();
    j["client"] = client_to_json(key.client());
    j["durationDays"] = key.duration_days();
    j["status"] = key_status_to_string(key.status());
    j["createdAt"] = to_millis(key.created_at());
    return j;
}

/**
 * @brief Parse ActivationKey from its wire shape
 *
 * Rejects documents that violate the record invariants: a missing code, a
 * non-positive duration, an unknown status, a partially set binding, or an
 * unused key that still carries a binding.
 */
[[nodiscard]] inline Result<ActivationKey> parse_activation_key(const json& j) {
    if (!j.is_object()) {
        return Result<ActivationKey>::error(ErrorCode::ParseError, "Record is not an object");
    }

    try {
        std::string code = j.value("code", "");
        if (code.empty()) {
            return Result<ActivationKey>::error(ErrorCode::ParseError, "Record has no code");
        }

        int64_t duration_days = 0;
        if (j.contains("durationDays") && j["durationDays"].is_number_integer()) {
            duration_days = j["durationDays"].get<int64_t>();
        }
        if (duration_days <= 0 || duration_days > MAX_DURATION_DAYS) {
            return Result<ActivationKey>::error(ErrorCode::ParseError,
                                                "Record " + code + " has an invalid duration");
        }

        auto status = key_status_from_string(j.value("status", ""));
        if (!status) {
            return Result<ActivationKey>::error(ErrorCode::ParseError,
                                                "Record " + code + " has an unknown status");
        }

        Timestamp created_at;
        if (j.contains("createdAt") && j["createdAt"].is_number()) {
            created_at = from_millis(j["createdAt"].get<int64_t>());
        }

        ClientInfo client;
        if (j.contains("client")) {
            client = parse_client(j["client"]);
        }

        auto is_set = [&j](const char* field) {
            return j.contains(field) && !j[field].is_null();
        };
        int set_count = static_cast<int>(is_set("deviceId")) +
                        static_cast<int>(is_set("activatedAt")) +
                        static_cast<int>(is_set("expiresAt"));

        std::optional<Binding> binding;
        if (set_count == 3) {
            binding = Binding{j["deviceId"].get<std::string>(),
                              from_millis(j["activatedAt"].get<int64_t>()),
                              from_millis(j["expiresAt"].get<int64_t>())};
        } else if (set_count != 0) {
            return Result<ActivationKey>::error(ErrorCode::ParseError,
                                                "Record " + code + " has a partial binding");
        }

        if (*status == KeyStatus::Unused && binding) {
            return Result<ActivationKey>::error(ErrorCode::ParseError,
                                                "Unused record " + code + " carries a binding");
        }

        return Result<ActivationKey>::ok(ActivationKey(std::move(code), std::move(client),
                                                       static_cast<int>(duration_days), *status, created_at,
                                                       std::move(binding)));
    } catch (const nlohmann::json::exception& e) {
        return Result<ActivationKey>::error(ErrorCode::ParseError,
                                            std::string("Malformed record: ") + e.what());
    }
}

}  // namespace json
}  // namespace keygate
