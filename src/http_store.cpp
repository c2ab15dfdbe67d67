#include "keygate/http_store.hpp"
#include "keygate/json.hpp"

#include "log.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <iomanip>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>

namespace keygate {

namespace {

constexpr const char* kComponent = "http-store";

std::string url_encode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << static_cast<char>(c);
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

template <typename T> Result<T> error_from_response(const http::Response& response) {
    if (!response.error_message.empty()) {
        return Result<T>::error(ErrorCode::StoreUnavailable, response.error_message);
    }

    ErrorCode code = http::status_code_to_error_code(response.status_code);
    if (code == ErrorCode::Success || code == ErrorCode::Unknown) {
        code = ErrorCode::Unknown;
    }

    // The database reports failures as {"error": "..."}
    std::string message;
    auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("error") &&
        body["error"].is_string()) {
        message = body["error"].get<std::string>();
    }
    if (message.empty()) {
        message = error_code_to_string(code);
    }
    return Result<T>::error(code, message + " (HTTP " + std::to_string(response.status_code) + ")");
}

std::string escape_pointer_token(const std::string& token) {
    std::string escaped;
    for (char c : token) {
        if (c == '~') {
            escaped += "~0";
        } else if (c == '/') {
            escaped += "~1";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

std::string join_path(const std::string& path, const std::string& key) {
    if (path.empty() || path == "/") {
        return "/" + escape_pointer_token(key);
    }
    return path + "/" + escape_pointer_token(key);
}

std::string first_segment(const std::string& path) {
    std::size_t start = (!path.empty() && path.front() == '/') ? 1 : 0;
    auto end = path.find('/', start);
    return path.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

// Write value at a stream path inside the local snapshot; null deletes
void set_at(nlohmann::json& doc, const std::string& path, const nlohmann::json& value) {
    if (path.empty() || path == "/") {
        doc = value;
        return;
    }

    nlohmann::json::json_pointer pointer(path);
    if (value.is_null()) {
        if (doc.contains(pointer)) {
            doc[pointer.parent_pointer()].erase(pointer.back());
        }
        return;
    }
    doc[pointer] = value;
}

nlohmann::json child_of(const nlohmann::json& doc, const std::string& code) {
    if (doc.is_object() && doc.contains(code)) {
        return doc[code];
    }
    return nlohmann::json();
}

/**
 * One change stream: keeps a local snapshot of the watched location and
 * reports each record whose document changed.
 */
class StreamWorker : public std::enable_shared_from_this<StreamWorker> {
  public:
    using Dispatch = std::function<void(const std::string& code, const std::optional<ActivationKey>&)>;

    StreamWorker(std::unique_ptr<http::HttpClientInterface> client, http::Request request,
                 std::optional<std::string> single_code, Dispatch dispatch, int reconnect_ms,
                 bool debug)
        : client_(std::move(client)),
          request_(std::move(request)),
          single_code_(std::move(single_code)),
          dispatch_(std::move(dispatch)),
          reconnect_ms_(reconnect_ms),
          debug_(debug) {}

    void start() {
        running_ = true;
        thread_ = std::thread([self = shared_from_this()]() { self->run(); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            running_ = false;
        }
        wait_cv_.notify_all();
        client_->stop();

        if (thread_.joinable()) {
            // Cancelled from inside a change handler: let the thread wind down on its own
            if (thread_.get_id() == std::this_thread::get_id()) {
                thread_.detach();
            } else {
                thread_.join();
            }
        }
    }

  private:
    void run() {
        while (running_) {
            nlohmann::json doc;
            http::EventStreamParser parser([this, &doc](const std::string& event, const std::string& data) {
                handle_event(doc, event, data);
            });

            auto response = client_->stream(request_, [this, &parser](const char* data, std::size_t length) {
                if (!running_) {
                    return false;
                }
                parser.feed(data, length);
                return running_.load();
            });

            if (!running_) {
                break;
            }

            detail::debug_log(debug_, kComponent,
                              "change stream closed (" +
                                  (response.error_message.empty()
                                       ? "HTTP " + std::to_string(response.status_code)
                                       : response.error_message) +
                                  "), reconnecting");

            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_for(lock, std::chrono::milliseconds(reconnect_ms_),
                              [this]() { return !running_; });
        }
    }

    void handle_event(nlohmann::json& doc, const std::string& event, const std::string& data) {
        if (event == "keep-alive") {
            return;
        }
        if (event == "cancel" || event == "auth_revoked") {
            detail::debug_log(debug_, kComponent, "server ended the stream: " + event);
            return;
        }
        if (event != "put" && event != "patch") {
            return;
        }

        auto payload = nlohmann::json::parse(data, nullptr, false);
        if (payload.is_discarded() || !payload.is_object()) {
            detail::debug_log(debug_, kComponent, "ignoring malformed " + event + " event");
            return;
        }

        std::string path = payload.value("path", "/");
        nlohmann::json value = payload.contains("data") ? payload["data"] : nlohmann::json();
        nlohmann::json before = doc;

        try {
            if (event == "put") {
                set_at(doc, path, value);
            } else if (value.is_object()) {
                for (const auto& [key, child] : value.items()) {
                    set_at(doc, join_path(path, key), child);
                }
            }
        } catch (const nlohmann::json::exception& e) {
            detail::debug_log(debug_, kComponent, "cannot apply " + event + " at " + path + ": " + e.what());
            return;
        }

        std::set<std::string> affected;
        if (single_code_) {
            affected.insert(*single_code_);
        } else if (!first_segment(path).empty()) {
            affected.insert(first_segment(path));
        } else {
            for (const nlohmann::json* snapshot : {&before, &doc}) {
                if (snapshot->is_object()) {
                    for (const auto& [code, record] : snapshot->items()) {
                        affected.insert(code);
                    }
                }
            }
        }

        for (const auto& code : affected) {
            nlohmann::json old_record = single_code_ ? before : child_of(before, code);
            nlohmann::json new_record = single_code_ ? doc : child_of(doc, code);
            if (old_record == new_record) {
                continue;
            }

            if (new_record.is_null()) {
                dispatch_(code, std::nullopt);
                continue;
            }

            auto parsed = json::parse_activation_key(new_record);
            if (parsed.is_error()) {
                detail::debug_log(debug_, kComponent, "skipping " + code + ": " + parsed.error_message());
                continue;
            }
            dispatch_(code, parsed.value());
        }
    }

    std::unique_ptr<http::HttpClientInterface> client_;
    http::Request request_;
    std::optional<std::string> single_code_;
    Dispatch dispatch_;
    int reconnect_ms_;
    bool debug_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

}  // namespace

bool is_valid_store_key(const std::string& code) noexcept {
    if (code.empty() || code.size() > 768) {
        return false;
    }
    for (char c : code) {
        if (c == '.' || c == '$' || c == '#' || c == '[' || c == ']' || c == '/' ||
            static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            return false;
        }
    }
    return true;
}

// ==================== HttpStore Implementation ====================

class HttpStore::Impl {
  public:
    Impl(Config config, http::HttpClientFactory factory)
        : config_(std::move(config)), factory_(std::move(factory)) {
        while (!config_.root.empty() && config_.root.back() == '/') {
            config_.root.pop_back();
        }
        while (!config_.root.empty() && config_.root.front() == '/') {
            config_.root.erase(0, 1);
        }

        if (!factory_) {
            http::HttpClient::Config http_config;
            http_config.base_url = config_.database_url;
            http_config.timeout_seconds = config_.timeout_seconds;
            http_config.verify_ssl = config_.verify_ssl;
            http_config.max_retries = config_.max_retries;
            http_config.retry_interval_ms = config_.retry_interval_ms;
            factory_ = [http_config]() { return std::make_unique<http::HttpClient>(http_config); };
        }
        client_ = factory_();
    }

    ~Impl() {
        std::map<uint64_t, std::shared_ptr<StreamWorker>> streams;
        {
            std::lock_guard<std::mutex> lock(streams_mutex_);
            streams.swap(streams_);
        }
        for (auto& [id, worker] : streams) {
            worker->stop();
        }
    }

    Result<std::optional<ActivationKey>> get(const std::string& code) {
        using R = Result<std::optional<ActivationKey>>;
        if (!is_valid_store_key(code)) {
            return R::error(ErrorCode::ValidationError, "Invalid activation code: " + code);
        }

        http::Request request;
        request.method = http::Method::GET;
        request.path = record_path(code);

        auto response = client_->send(request);
        if (!response.success) {
            return error_from_response<std::optional<ActivationKey>>(response);
        }

        auto body = nlohmann::json::parse(response.body, nullptr, false);
        if (body.is_discarded()) {
            return R::error(ErrorCode::ParseError, "Store returned invalid JSON for " + code);
        }
        if (body.is_null()) {
            return R::ok(std::nullopt);
        }

        auto parsed = json::parse_activation_key(body);
        if (parsed.is_error()) {
            return R::error(parsed.error_code(), parsed.error_message());
        }
        return R::ok(std::move(parsed).value());
    }

    Result<ActivationKey> set(const ActivationKey& record) {
        if (!is_valid_store_key(record.code())) {
            return Result<ActivationKey>::error(ErrorCode::ValidationError,
                                                "Invalid activation code: " + record.code());
        }

        auto body = json::activation_key_to_json(record);
        body["createdAt"] = json::server_timestamp();

        http::Request request;
        request.method = http::Method::PUT;
        request.path = record_path(record.code());
        request.body = body.dump();

        auto response = client_->send(request);
        if (!response.success) {
            return error_from_response<ActivationKey>(response);
        }

        // The response echoes the stored document with the server timestamp resolved
        auto echoed = nlohmann::json::parse(response.body, nullptr, false);
        if (!echoed.is_discarded() && echoed.is_object() && echoed.contains("createdAt") &&
            echoed["createdAt"].is_number()) {
            auto parsed = json::parse_activation_key(echoed);
            if (parsed.is_ok()) {
                return parsed;
            }
        }

        auto stored = get(record.code());
        if (stored.is_error()) {
            return Result<ActivationKey>::error(stored.error_code(), stored.error_message());
        }
        if (!stored.value()) {
            return Result<ActivationKey>::error(ErrorCode::NotFound,
                                                "Record " + record.code() + " vanished after write");
        }
        return Result<ActivationKey>::ok(*stored.value());
    }

    Result<ActivationKey> update(const std::string& code, const KeyUpdate& update) {
        if (!is_valid_store_key(code)) {
            return Result<ActivationKey>::error(ErrorCode::ValidationError,
                                                "Invalid activation code: " + code);
        }

        for (int attempt = 0; attempt < config_.max_conditional_attempts; ++attempt) {
            http::Request read;
            read.method = http::Method::GET;
            read.path = record_path(code);
            read.headers["X-Firebase-ETag"] = "true";

            auto current = client_->send(read);
            if (!current.success) {
                return error_from_response<ActivationKey>(current);
            }

            auto body = nlohmann::json::parse(current.body, nullptr, false);
            if (body.is_discarded()) {
                return Result<ActivationKey>::error(ErrorCode::ParseError,
                                                    "Store returned invalid JSON for " + code);
            }
            if (body.is_null()) {
                return Result<ActivationKey>::error(ErrorCode::NotFound, "No record for code " + code);
            }

            auto parsed = json::parse_activation_key(body);
            if (parsed.is_error()) {
                return parsed;
            }
            const ActivationKey& record = parsed.value();

            if (update.expected_status && record.status() != *update.expected_status) {
                return Result<ActivationKey>::error(
                    ErrorCode::Conflict,
                    std::string("Record is ") + key_status_to_string(record.status()) +
                        ", expected " + key_status_to_string(*update.expected_status),
                    record);
            }

            ActivationKey updated = record.with_state(update.status, update.binding);
            if (updated == record) {
                return Result<ActivationKey>::ok(std::move(updated));
            }

            auto etag = current.headers.find("etag");
            if (etag == current.headers.end()) {
                return Result<ActivationKey>::error(ErrorCode::StoreUnavailable,
                                                    "Store did not return an ETag for " + code);
            }

            http::Request write;
            write.method = http::Method::PUT;
            write.path = record_path(code);
            write.headers["if-match"] = etag->second;
            write.body = json::activation_key_to_json(updated).dump();

            auto written = client_->send(write);
            if (written.success) {
                return Result<ActivationKey>::ok(std::move(updated));
            }
            if (written.status_code == 412) {
                detail::debug_log(config_.debug, kComponent,
                                  "conditional write on " + code + " lost a race, re-reading");
                continue;
            }
            return error_from_response<ActivationKey>(written);
        }

        return Result<ActivationKey>::error(ErrorCode::StoreUnavailable,
                                            "Record " + code + " is changing too fast to update");
    }

    Result<void> remove(const std::string& code) {
        if (!is_valid_store_key(code)) {
            return Result<void>::error(ErrorCode::ValidationError, "Invalid activation code: " + code);
        }

        http::Request request;
        request.method = http::Method::DELETE_METHOD;
        request.path = record_path(code);

        auto response = client_->send(request);
        if (!response.success) {
            return error_from_response<void>(response);
        }
        return Result<void>::ok();
    }

    Result<std::vector<ActivationKey>> list() {
        using R = Result<std::vector<ActivationKey>>;

        http::Request request;
        request.method = http::Method::GET;
        request.path = collection_path();

        auto response = client_->send(request);
        if (!response.success) {
            return error_from_response<std::vector<ActivationKey>>(response);
        }

        auto body = nlohmann::json::parse(response.body, nullptr, false);
        if (body.is_discarded()) {
            return R::error(ErrorCode::ParseError, "Store returned invalid JSON for the key list");
        }

        std::vector<ActivationKey> records;
        if (body.is_object()) {
            for (const auto& [code, document] : body.items()) {
                auto parsed = json::parse_activation_key(document);
                if (parsed.is_error()) {
                    detail::debug_log(config_.debug, kComponent,
                                      "skipping " + code + ": " + parsed.error_message());
                    continue;
                }
                records.push_back(std::move(parsed).value());
            }
        }
        return R::ok(std::move(records));
    }

    Subscription on_change(const std::string& code, RecordHandler handler) {
        if (!is_valid_store_key(code)) {
            detail::debug_log(config_.debug, kComponent, "not watching invalid code " + code);
            return Subscription();
        }
        return start_stream(record_path(code), code,
                            [handler](const std::string&, const std::optional<ActivationKey>& record) {
                                handler(record);
                            });
    }

    Subscription on_any_change(CollectionHandler handler) {
        return start_stream(collection_path(), std::nullopt, std::move(handler));
    }

    const Config& config() const noexcept { return config_; }

  private:
    Subscription start_stream(const std::string& path, std::optional<std::string> single_code,
                              StreamWorker::Dispatch dispatch) {
        http::Request request;
        request.method = http::Method::GET;
        request.path = path;

        auto worker = std::make_shared<StreamWorker>(factory_(), std::move(request),
                                                     std::move(single_code), std::move(dispatch),
                                                     config_.reconnect_interval_ms, config_.debug);

        uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(streams_mutex_);
            id = next_id_++;
            streams_[id] = worker;
        }
        worker->start();

        return Subscription([this, id]() { this->stop_stream(id); });
    }

    void stop_stream(uint64_t id) {
        std::shared_ptr<StreamWorker> worker;
        {
            std::lock_guard<std::mutex> lock(streams_mutex_);
            auto it = streams_.find(id);
            if (it == streams_.end()) {
                return;
            }
            worker = it->second;
            streams_.erase(it);
        }
        worker->stop();
    }

    std::string auth_query() const {
        return config_.auth_token.empty() ? "" : "?auth=" + url_encode(config_.auth_token);
    }

    std::string collection_path() const { return "/" + config_.root + ".json" + auth_query(); }

    std::string record_path(const std::string& code) const {
        return "/" + config_.root + "/" + code + ".json" + auth_query();
    }

    Config config_;
    http::HttpClientFactory factory_;
    std::unique_ptr<http::HttpClientInterface> client_;
    std::map<uint64_t, std::shared_ptr<StreamWorker>> streams_;
    std::mutex streams_mutex_;
    uint64_t next_id_ = 0;
};

HttpStore::Config HttpStore::from_store_config(const StoreConfig& store_config) {
    Config config;
    config.database_url = store_config.database_url;
    config.root = store_config.root;
    config.auth_token = store_config.auth_token;
    return config;
}

HttpStore::HttpStore(Config config) : impl_(std::make_unique<Impl>(std::move(config), nullptr)) {}

HttpStore::HttpStore(Config config, http::HttpClientFactory factory)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(factory))) {}

HttpStore::~HttpStore() = default;

Result<std::optional<ActivationKey>> HttpStore::get(const std::string& code) {
    return impl_->get(code);
}

Result<ActivationKey> HttpStore::set(const ActivationKey& record) {
    return impl_->set(record);
}

Result<ActivationKey> HttpStore::update(const std::string& code, const KeyUpdate& update) {
    return impl_->update(code, update);
}

Result<void> HttpStore::remove(const std::string& code) {
    return impl_->remove(code);
}

Result<std::vector<ActivationKey>> HttpStore::list() {
    return impl_->list();
}

Subscription HttpStore::on_change(const std::string& code, RecordHandler handler) {
    return impl_->on_change(code, std::move(handler));
}

Subscription HttpStore::on_any_change(CollectionHandler handler) {
    return impl_->on_any_change(std::move(handler));
}

const HttpStore::Config& HttpStore::config() const noexcept {
    return impl_->config();
}

}  // namespace keygate
