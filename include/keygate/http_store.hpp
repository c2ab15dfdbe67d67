#pragma once

/**
 * @file http_store.hpp
 * @brief Key store client for a hosted realtime database
 *
 * Talks to the database's REST interface: records live at
 * `<database_url>/<root>/<code>.json`, issuance timestamps are resolved by
 * the server, conditional writes use ETags and change notification uses a
 * server-sent event stream.
 */

#include "keygate/config.hpp"
#include "keygate/http.hpp"
#include "keygate/store.hpp"

#include <memory>
#include <string>

namespace keygate {

/**
 * @brief StoreInterface over the hosted database's REST API
 *
 * Each on_change()/on_any_change() subscription runs its own stream on a
 * background thread and reconnects after transport failures until the
 * subscription is cancelled or the store is destroyed.
 */
class HttpStore : public StoreInterface {
  public:
    /// Configuration for the hosted store client
    struct Config {
        /// Database URL (scheme, host and optional port)
        std::string database_url;

        /// Collection holding the activation keys
        std::string root = "activation_keys";

        /// Credential sent as the `auth` query parameter
        std::string auth_token;

        /// HTTP request timeout in seconds
        int timeout_seconds = 30;

        /// Enable SSL certificate verification (disable only for testing!)
        bool verify_ssl = true;

        /// Number of retry attempts for failed requests
        int max_retries = 3;

        /// Interval between retries in milliseconds
        int retry_interval_ms = 1000;

        /// Attempts at a conditional write before giving up under contention
        int max_conditional_attempts = 5;

        /// Delay before re-opening a dropped change stream
        int reconnect_interval_ms = 2000;

        /// Enable debug logging
        bool debug = false;
    };

    /// Build the client config from the shared connection settings
    [[nodiscard]] static Config from_store_config(const StoreConfig& store_config);

    /// Construct with cpp-httplib transport
    explicit HttpStore(Config config);

    /// Construct with a custom transport (used by tests)
    HttpStore(Config config, http::HttpClientFactory factory);

    ~HttpStore() override;

    // Non-copyable
    HttpStore(const HttpStore&) = delete;
    HttpStore& operator=(const HttpStore&) = delete;

    [[nodiscard]] Result<std::optional<ActivationKey>> get(const std::string& code) override;
    [[nodiscard]] Result<ActivationKey> set(const ActivationKey& record) override;
    [[nodiscard]] Result<ActivationKey> update(const std::string& code,
                                               const KeyUpdate& update) override;
    [[nodiscard]] Result<void> remove(const std::string& code) override;
    [[nodiscard]] Result<std::vector<ActivationKey>> list() override;

    Subscription on_change(const std::string& code, RecordHandler handler) override;
    Subscription on_any_change(CollectionHandler handler) override;

    /// Get the current configuration
    [[nodiscard]] const Config& config() const noexcept;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Check that a code can be used as a key in the hosted database
[[nodiscard]] bool is_valid_store_key(const std::string& code) noexcept;

}  // namespace keygate
