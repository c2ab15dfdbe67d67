#include "keygate/http.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <mutex>
#include <thread>

// Detect SSL support in cpp-httplib
#if defined(CPPHTTPLIB_OPENSSL_SUPPORT)
#define KEYGATE_HTTP_HAS_SSL 1
#else
#define KEYGATE_HTTP_HAS_SSL 0
#endif

namespace keygate {
namespace http {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const char* describe_error(httplib::Error error) {
    switch (error) {
        case httplib::Error::Connection:
            return "Connection failed";
        case httplib::Error::Read:
            return "Read failed";
        case httplib::Error::Write:
            return "Write failed";
        case httplib::Error::Canceled:
            return "Request canceled";
#if KEYGATE_HTTP_HAS_SSL
        case httplib::Error::SSLConnection:
            return "SSL connection failed";
        case httplib::Error::SSLServerVerification:
            return "SSL certificate verification failed";
#endif
        default:
            return "Unknown network error";
    }
}

}  // namespace

// ==================== HttpClient Implementation ====================

class HttpClient::Impl {
  public:
    explicit Impl(Config config) : config_(std::move(config)) {
        // Parse base URL to extract host and port
        std::string url = config_.base_url;

        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }

        bool use_https = false;
        if (url.rfind("https://", 0) == 0) {
            use_https = true;
            url = url.substr(8);
        } else if (url.rfind("http://", 0) == 0) {
            url = url.substr(7);
        }

        std::string host;
        int port = use_https ? 443 : 80;

        auto colon_pos = url.find(':');
        auto slash_pos = url.find('/');

        if (colon_pos != std::string::npos && (slash_pos == std::string::npos || colon_pos < slash_pos)) {
            host = url.substr(0, colon_pos);
            std::string port_str;
            if (slash_pos != std::string::npos) {
                port_str = url.substr(colon_pos + 1, slash_pos - colon_pos - 1);
                base_path_ = url.substr(slash_pos);
            } else {
                port_str = url.substr(colon_pos + 1);
            }
            try {
                port = std::stoi(port_str);
            } catch (const std::exception&) {
                return;  // Leaves the client unconfigured
            }
        } else if (slash_pos != std::string::npos) {
            host = url.substr(0, slash_pos);
            base_path_ = url.substr(slash_pos);
        } else {
            host = url;
        }

        if (host.empty()) {
            return;
        }

        if (use_https) {
#if KEYGATE_HTTP_HAS_SSL
            ssl_client_ = std::make_unique<httplib::SSLClient>(host, port);
            apply_timeouts(*ssl_client_);
            if (!config_.verify_ssl) {
                ssl_client_->enable_server_certificate_verification(false);
            }
#else
            // SSL not available - HTTPS URLs will fail at request time
            https_requested_ = true;
            client_ = std::make_unique<httplib::Client>(host, port);
            apply_timeouts(*client_);
#endif
        } else {
            client_ = std::make_unique<httplib::Client>(host, port);
            apply_timeouts(*client_);
        }

        configured_ = true;
    }

    Response send(const Request& request) {
        std::lock_guard<std::mutex> lock(mutex_);

        Response response;
        if (!check_usable(response)) {
            return response;
        }

        std::string full_path = base_path_ + request.path;
        httplib::Headers headers = build_headers(request);

        // Retry loop (transport failures only)
        for (int attempt = 0; attempt <= config_.max_retries; ++attempt) {
            httplib::Result result;
#if KEYGATE_HTTP_HAS_SSL
            if (ssl_client_) {
                result = dispatch(*ssl_client_, request, full_path, headers);
            } else {
                result = dispatch(*client_, request, full_path, headers);
            }
#else
            result = dispatch(*client_, request, full_path, headers);
#endif

            if (result) {
                fill_response(*result, response);
                return response;
            }

            auto error = result.error();
            if (error == httplib::Error::Connection || error == httplib::Error::Read ||
                error == httplib::Error::Write) {
                if (attempt < config_.max_retries) {
                    std::this_thread::sleep_for(
                        std::chrono::milliseconds(config_.retry_interval_ms));
                    continue;
                }
            }

            response.error_message = describe_error(error);
            break;
        }

        return response;
    }

    Response stream(const Request& request, const ChunkHandler& on_chunk) {
        Response response;
        if (!check_usable(response)) {
            return response;
        }

        std::string full_path = base_path_ + request.path;
        httplib::Headers headers = build_headers(request);
        headers.emplace("Accept", "text/event-stream");

        httplib::ContentReceiver receiver = [&on_chunk](const char* data, size_t length) {
            return on_chunk(data, length);
        };

        httplib::Result result;
#if KEYGATE_HTTP_HAS_SSL
        if (ssl_client_) {
            result = ssl_client_->Get(full_path, headers, receiver);
        } else {
            result = client_->Get(full_path, headers, receiver);
        }
#else
        result = client_->Get(full_path, headers, receiver);
#endif

        if (result) {
            fill_response(*result, response);
        } else {
            response.error_message = describe_error(result.error());
        }
        return response;
    }

    void stop() {
#if KEYGATE_HTTP_HAS_SSL
        if (ssl_client_) {
            ssl_client_->stop();
        }
#endif
        if (client_) {
            client_->stop();
        }
    }

    bool is_configured() const { return configured_; }

    const std::string& base_url() const { return config_.base_url; }

  private:
    template <typename C> void apply_timeouts(C& client) {
        client.set_connection_timeout(config_.timeout_seconds);
        client.set_read_timeout(config_.timeout_seconds);
        client.set_write_timeout(config_.timeout_seconds);
    }

    template <typename C>
    httplib::Result dispatch(C& client, const Request& request, const std::string& path,
                             const httplib::Headers& headers) {
        switch (request.method) {
            case Method::GET:
                return client.Get(path, headers);
            case Method::PUT:
                return client.Put(path, headers, request.body, request.content_type);
            case Method::PATCH:
                return client.Patch(path, headers, request.body, request.content_type);
            case Method::DELETE_METHOD:
                return client.Delete(path, headers);
        }
        return httplib::Result();
    }

    bool check_usable(Response& response) const {
        if (!configured_) {
            response.error_message = "HTTP client not configured";
            return false;
        }
#if !KEYGATE_HTTP_HAS_SSL
        if (https_requested_) {
            response.error_message = "HTTPS not supported: cpp-httplib was compiled without SSL support";
            return false;
        }
#endif
        return true;
    }

    httplib::Headers build_headers(const Request& request) const {
        httplib::Headers headers;
        for (const auto& [name, value] : request.headers) {
            headers.emplace(name, value);
        }
        headers.emplace("User-Agent", std::string("keygate/") + VERSION);
        return headers;
    }

    static void fill_response(const httplib::Response& result, Response& response) {
        response.status_code = result.status;
        response.body = result.body;
        for (const auto& [name, value] : result.headers) {
            response.headers[to_lower(name)] = value;
        }
        response.success = (result.status >= 200 && result.status < 300);
    }

    Config config_;
    std::string base_path_;
    std::unique_ptr<httplib::Client> client_;
#if KEYGATE_HTTP_HAS_SSL
    std::unique_ptr<httplib::SSLClient> ssl_client_;
#else
    bool https_requested_ = false;
#endif
    bool configured_ = false;
    std::mutex mutex_;
};

HttpClient::HttpClient(Config config) : impl_(std::make_unique<Impl>(std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

Response HttpClient::send(const Request& request) {
    return impl_->send(request);
}

Response HttpClient::stream(const Request& request, ChunkHandler on_chunk) {
    return impl_->stream(request, on_chunk);
}

void HttpClient::stop() {
    impl_->stop();
}

bool HttpClient::is_configured() const {
    return impl_->is_configured();
}

const std::string& HttpClient::base_url() const {
    return impl_->base_url();
}

// ==================== EventStreamParser ====================

void EventStreamParser::feed(const char* data, std::size_t length) {
    buffer_.append(data, length);

    std::size_t start = 0;
    std::size_t newline = 0;
    while ((newline = buffer_.find('\n', start)) != std::string::npos) {
        std::string line = buffer_.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        process_line(line);
        start = newline + 1;
    }
    buffer_.erase(0, start);
}

void EventStreamParser::reset() {
    buffer_.clear();
    event_.clear();
    data_.clear();
    has_data_ = false;
}

void EventStreamParser::process_line(const std::string& line) {
    if (line.empty()) {
        dispatch();
        return;
    }
    if (line.front() == ':') {
        return;  // comment
    }

    std::string field = line;
    std::string value;
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.erase(0, 1);
        }
    }

    if (field == "event") {
        event_ = value;
    } else if (field == "data") {
        if (has_data_) {
            data_ += '\n';
        }
        data_ += value;
        has_data_ = true;
    }
}

void EventStreamParser::dispatch() {
    if (!has_data_ && event_.empty()) {
        return;
    }
    std::string event = event_.empty() ? "message" : event_;
    std::string data = data_;
    event_.clear();
    data_.clear();
    has_data_ = false;
    if (on_event_) {
        on_event_(event, data);
    }
}

}  // namespace http
}  // namespace keygate
