#pragma once

/**
 * @file config.hpp
 * @brief Connection settings for the hosted key store
 *
 * The admin console and the protected application are both pointed at the
 * same hosted database. Operators usually paste the web config object the
 * hosting console hands out; parse_store_config_snippet() lifts the fields
 * out of that text.
 */

#include "keygate/keygate.hpp"

#include <string>

namespace keygate {

/**
 * @brief Hosted store connection settings
 */
struct StoreConfig {
    /// Project API key (required)
    std::string api_key;

    /// Auth domain of the project
    std::string auth_domain;

    /// Realtime database URL, e.g. "https://project-default-rtdb.firebaseio.com" (required)
    std::string database_url;

    /// Project identifier (required)
    std::string project_id;

    /// Storage bucket of the project
    std::string storage_bucket;

    /// Messaging sender id of the project
    std::string messaging_sender_id;

    /// Application id of the project
    std::string app_id;

    /// Optional analytics measurement id
    std::string measurement_id;

    /// Collection holding the activation keys
    std::string root = "activation_keys";

    /// Credential appended as the `auth` query parameter (empty for open rules)
    std::string auth_token;

    /// Check the required fields
    [[nodiscard]] Result<void> validate() const;
};

/**
 * @brief Extract `name: "value"` pairs from a pasted config object
 *
 * Recognizes apiKey, authDomain, databaseURL, projectId, storageBucket,
 * messagingSenderId, appId and measurementId. Fails with
 * ErrorCode::ValidationError if none of them is present.
 */
[[nodiscard]] Result<StoreConfig> parse_store_config_snippet(const std::string& text);

/// Load a store config saved by save_store_config()
[[nodiscard]] Result<StoreConfig> load_store_config(const std::string& path);

/// Save a store config as JSON, creating parent directories
[[nodiscard]] Result<void> save_store_config(const StoreConfig& config, const std::string& path);

}  // namespace keygate
