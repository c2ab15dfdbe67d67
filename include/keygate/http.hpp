#pragma once

/**
 * @file http.hpp
 * @brief HTTP client abstraction for the hosted key store
 *
 * Provides a small HTTP client interface using cpp-httplib under the hood.
 * Handles HTTPS, retries, streaming responses and common error scenarios.
 */

#include "keygate.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace keygate {
namespace http {

/// HTTP method
enum class Method { GET, PUT, PATCH, DELETE_METHOD };

/// Header map (names compared as given; the store's headers are lower-case)
using Headers = std::map<std::string, std::string>;

/// HTTP response structure
struct Response {
    int status_code = 0;
    std::string body;
    Headers headers;
    bool success = false;
    std::string error_message;  // Set only for transport failures
};

/// HTTP request structure
struct Request {
    Method method = Method::GET;
    std::string path;
    std::string body;
    std::string content_type = "application/json";
    Headers headers;
};

/// Receives streamed body bytes; return false to stop the stream
using ChunkHandler = std::function<bool(const char* data, std::size_t length)>;

/**
 * @brief HTTP client interface
 *
 * Abstract interface for HTTP operations. Can be mocked for testing.
 */
class HttpClientInterface {
  public:
    virtual ~HttpClientInterface() = default;

    /// Send an HTTP request and return the response
    [[nodiscard]] virtual Response send(const Request& request) = 0;

    /// Send a GET request and hand the body to on_chunk as it arrives
    [[nodiscard]] virtual Response stream(const Request& request, ChunkHandler on_chunk) = 0;

    /// Abort an in-flight stream() from another thread
    virtual void stop() = 0;

    /// Check if the client is properly configured
    [[nodiscard]] virtual bool is_configured() const = 0;
};

/// Creates HTTP clients (one per request channel or stream)
using HttpClientFactory = std::function<std::unique_ptr<HttpClientInterface>()>;

/**
 * @brief HTTP client using cpp-httplib
 *
 * Implements HttpClientInterface using cpp-httplib for actual HTTP communication.
 * Supports HTTPS with SSL certificate verification.
 */
class HttpClient : public HttpClientInterface {
  public:
    /// Configuration for the HTTP client
    struct Config {
        std::string base_url;
        int timeout_seconds = 30;
        bool verify_ssl = true;
        int max_retries = 3;
        int retry_interval_ms = 1000;
    };

    /// Construct with configuration
    explicit HttpClient(Config config);

    /// Destructor
    ~HttpClient() override;

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Movable
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /// Send an HTTP request
    [[nodiscard]] Response send(const Request& request) override;

    /// Stream a GET response body
    [[nodiscard]] Response stream(const Request& request, ChunkHandler on_chunk) override;

    /// Abort an in-flight stream
    void stop() override;

    /// Check if properly configured
    [[nodiscard]] bool is_configured() const override;

    /// Get the base URL
    [[nodiscard]] const std::string& base_url() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Convert HTTP status code to ErrorCode
[[nodiscard]] inline ErrorCode status_code_to_error_code(int status) {
    if (status >= 200 && status < 300) {
        return ErrorCode::Success;
    }

    switch (status) {
        case 400:
        case 422:
            return ErrorCode::ValidationError;
        case 401:
        case 403:
            return ErrorCode::PermissionDenied;
        case 404:
            return ErrorCode::NotFound;
        case 409:
        case 412:
            return ErrorCode::Conflict;
        case 0:
        case 408:
        case 429:
            return ErrorCode::StoreUnavailable;
        default:
            if (status >= 500) {
                return ErrorCode::StoreUnavailable;
            }
            return ErrorCode::Unknown;
    }
}

/**
 * @brief Incremental parser for text/event-stream bodies
 *
 * Feed raw chunks as they arrive; every complete event (terminated by a blank
 * line) is handed to the callback with its event name and joined data lines.
 */
class EventStreamParser {
  public:
    using EventCallback = std::function<void(const std::string& event, const std::string& data)>;

    explicit EventStreamParser(EventCallback on_event) : on_event_(std::move(on_event)) {}

    /// Consume a chunk of the stream
    void feed(const char* data, std::size_t length);

    /// Drop any partially received event
    void reset();

  private:
    void process_line(const std::string& line);
    void dispatch();

    EventCallback on_event_;
    std::string buffer_;
    std::string event_;
    std::string data_;
    bool has_data_ = false;
};

}  // namespace http
}  // namespace keygate
