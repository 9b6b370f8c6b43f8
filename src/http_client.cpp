#include "blobup/net/http.hpp"
#include "blobup/net/transport.hpp"
#include "blobup/log.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <iterator>
#include <map>
#include <mutex>
#include <thread>

namespace blobup::net {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
}

HttpRequest make_request(HttpMethod method, const std::string& url,
                         std::shared_ptr<BodySource> source) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    req.body_source = std::move(source);
    return req;
}

} // namespace

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

// ============================================================================
// Base64
// ============================================================================

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            data.data(), static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

std::string base64_encode(const std::string& str) {
    return base64_encode(std::vector<uint8_t>(str.begin(), str.end()));
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) return {};

    std::vector<uint8_t> out(encoded.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(encoded.data()),
                            static_cast<int>(encoded.size()));
    if (n < 0) return {};

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') padding++;
    if (encoded[encoded.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

// ============================================================================
// HttpHeaders / HttpRequest
// ============================================================================

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[lowercase(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[lowercase(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(lowercase(name));
    if (it == headers_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.front();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

HttpRequest HttpRequest::get(const std::string& url) {
    return make_request(HttpMethod::GET, url, nullptr);
}

HttpRequest HttpRequest::put(const std::string& url, std::shared_ptr<BodySource> source) {
    return make_request(HttpMethod::PUT, url, std::move(source));
}

HttpRequest HttpRequest::post(const std::string& url, std::shared_ptr<BodySource> source) {
    return make_request(HttpMethod::POST, url, std::move(source));
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    const size_t sep = url.find("://");
    if (sep == std::string::npos || sep == 0) {
        return std::nullopt;
    }

    ParsedUrl out;
    out.scheme = lowercase(url.substr(0, sep));
    bool scheme_ok = std::all_of(out.scheme.begin(), out.scheme.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
    if (!scheme_ok) {
        return std::nullopt;
    }

    const size_t authority_start = sep + 3;
    const size_t authority_end = std::min(url.find_first_of("/?#", authority_start), url.size());
    std::string authority = url.substr(authority_start, authority_end - authority_start);

    // Credentials in the URL are not carried over
    if (size_t at = authority.rfind('@'); at != std::string::npos) {
        authority.erase(0, at + 1);
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    std::string port_text;
    if (authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            port_text = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        out.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (out.host.empty() ||
        std::any_of(out.host.begin(), out.host.end(),
                    [](unsigned char c) { return std::isspace(c); })) {
        return std::nullopt;
    }

    if (!port_text.empty()) {
        if (!is_digits(port_text) || port_text.size() > 5) return std::nullopt;
        out.port = std::stoi(port_text);
        if (out.port == 0 || out.port > 65535) return std::nullopt;
    }

    size_t pos = authority_end;
    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = std::min(url.find_first_of("?#", pos), url.size());
        out.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }
    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = std::min(url.find('#', pos), url.size());
        out.query = url.substr(pos + 1, query_end - pos - 1);
    }

    return out;
}

std::string ParsedUrl::to_string() const {
    std::string out = scheme + "://";
    out += host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port != 0) {
        out += ":" + std::to_string(port);
    }
    out += path.empty() ? "/" : path;
    if (!query.empty()) {
        out += "?" + query;
    }
    return out;
}

ParsedUrl ParsedUrl::join(const std::string& relative) const {
    ParsedUrl result = *this;
    result.query.clear();

    if (!relative.empty() && relative.front() == '/') {
        result.path = relative;
    } else {
        std::string base = path.empty() ? "/" : path;
        result.path = base.substr(0, base.rfind('/') + 1) + relative;
    }
    return result;
}

// ============================================================================
// libcurl callbacks
// ============================================================================

namespace {

// Per-transfer state shared by every callback of one curl_easy_perform
struct TransferState {
    std::vector<uint8_t>* sink = nullptr;
    size_t limit = 0;
    bool overflow = false;

    BodySource* source = nullptr;
    const std::atomic<bool>* cancel = nullptr;

    bool cancelled() const {
        return cancel && cancel->load(std::memory_order_acquire);
    }

    static size_t on_write(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* st = static_cast<TransferState*>(userdata);
        size_t bytes = size * nmemb;
        if (st->limit > 0 && st->sink->size() + bytes > st->limit) {
            st->overflow = true;
            return 0;
        }
        st->sink->insert(st->sink->end(), ptr, ptr + bytes);
        return bytes;
    }

    static size_t on_read(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* st = static_cast<TransferState*>(userdata);
        if (st->cancelled()) {
            return CURL_READFUNC_ABORT;
        }
        size_t n = st->source->read(reinterpret_cast<uint8_t*>(buffer), size * nitems);
        // A closed source reads as EOF; tell curl it was an abort, not a short body
        if (n == 0 && st->cancelled()) {
            return CURL_READFUNC_ABORT;
        }
        return n;
    }

    static int on_progress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        return static_cast<TransferState*>(clientp)->cancelled() ? 1 : 0;
    }
};

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    size_t colon = line.find(':');
    if (line.empty() || line.starts_with("HTTP/") || colon == std::string::npos) {
        return bytes;
    }

    std::string value = line.substr(colon + 1);
    size_t start = value.find_first_not_of(" \t");
    headers->add(line.substr(0, colon), start == std::string::npos ? "" : value.substr(start));
    return bytes;
}

// ============================================================================
// Handle pool
// ============================================================================

// Pool key: scheme://host:port of the request URL
std::string origin_of(const std::string& url) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) return url;
    int port = parsed->port;
    if (port == 0) port = parsed->scheme == "https" ? 443 : 80;
    return parsed->scheme + "://" + parsed->host + ":" + std::to_string(port);
}

// Easy handles keep their connection cache across curl_easy_reset, so idle
// handles are filed under the origin they last talked to and handed back to
// requests for the same origin.
class HandlePool {
public:
    explicit HandlePool(size_t max_handles)
        : max_handles_(max_handles) {}

    ~HandlePool() {
        for (auto& [origin, handles] : idle_) {
            for (CURL* handle : handles) {
                curl_easy_cleanup(handle);
            }
        }
    }

    HandlePool(const HandlePool&) = delete;
    HandlePool& operator=(const HandlePool&) = delete;

    // nullptr when every handle is busy
    CURL* acquire(const std::string& origin) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = idle_.find(origin);
        if (it == idle_.end() && in_use_ + idle_count_ >= max_handles_ && idle_count_ > 0) {
            // At capacity: recycle a handle idling for another origin
            it = idle_.begin();
        }
        if (it != idle_.end()) {
            CURL* handle = it->second.back();
            it->second.pop_back();
            if (it->second.empty()) idle_.erase(it);
            --idle_count_;
            ++in_use_;
            return handle;
        }
        if (in_use_ >= max_handles_) {
            return nullptr;
        }
        CURL* handle = curl_easy_init();
        if (handle) ++in_use_;
        return handle;
    }

    void release(const std::string& origin, CURL* handle) {
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(mutex_);
        --in_use_;
        if (in_use_ + idle_count_ < max_handles_) {
            idle_[origin].push_back(handle);
            ++idle_count_;
        } else {
            curl_easy_cleanup(handle);
        }
    }

    // Close idle handles beyond keep for each origin
    void trim(size_t keep_per_origin) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = idle_.begin(); it != idle_.end();) {
            auto& handles = it->second;
            while (handles.size() > keep_per_origin) {
                curl_easy_cleanup(handles.back());
                handles.pop_back();
                --idle_count_;
            }
            it = handles.empty() ? idle_.erase(it) : std::next(it);
        }
    }

private:
    const size_t max_handles_;
    std::mutex mutex_;
    std::map<std::string, std::vector<CURL*>> idle_;
    size_t idle_count_ = 0;
    size_t in_use_ = 0;
};

} // namespace

// ============================================================================
// HttpClient::Impl
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config)
        , pool_(config.max_handles) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        if (!config_.verify_ssl) {
            log_warn("[http] SSL verification disabled; uploads are exposed to interception");
        }

        trimmer_ = std::thread([this]() { trim_loop(); });
    }

    ~Impl() {
        {
            std::lock_guard<std::mutex> lock(trim_mutex_);
            stopping_ = true;
        }
        trim_cv_.notify_all();
        if (trimmer_.joinable()) {
            trimmer_.join();
        }
    }

    HttpResponse execute(const HttpRequest& request, const std::atomic<bool>* cancel) {
        HttpResponse response;

        const std::string origin = origin_of(request.url);
        CURL* curl = pool_.acquire(origin);
        if (!curl) {
            if (request.body_source) request.body_source->close();
            response.error = "No free connection handle";
            response.is_network_error = true;
            return response;
        }

        TransferState state;
        state.sink = &response.body;
        state.limit = config_.max_response_size;
        state.source = request.body_source.get();
        state.cancel = cancel;

        curl_slist* header_list = build_header_list(request);
        configure(curl, request, state, header_list, response.headers);

        auto started = std::chrono::steady_clock::now();
        CURLcode rc = curl_easy_perform(curl);
        response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        // Unblock a producer still feeding the body
        if (request.body_source) {
            request.body_source->close();
        }

        if (state.overflow) {
            response.body.clear();
            response.status_code = 413;
            response.error = "Response body exceeded " +
                             std::to_string(config_.max_response_size) + " bytes";
        } else if (rc == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
        } else if (state.cancelled()) {
            response.body.clear();
            response.error = "Transfer cancelled";
            response.cancelled = true;
            response.is_network_error = true;
        } else {
            response.body.clear();
            response.error = curl_easy_strerror(rc);
            response.is_network_error = true;
        }

        curl_slist_free_all(header_list);
        pool_.release(origin, curl);
        return response;
    }

    const HttpClientConfig& config() const { return config_; }

private:
    static curl_slist* build_header_list(const HttpRequest& request) {
        curl_slist* list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            list = curl_slist_append(list, (name + ": " + value).c_str());
        }
        if (request.body_source) {
            // No 100-continue round trip before the body
            list = curl_slist_append(list, "Expect:");
        }
        return list;
    }

    void configure(CURL* curl, const HttpRequest& request, TransferState& state,
                   curl_slist* header_list, HttpHeaders& response_headers) const {
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        const auto body_size = static_cast<curl_off_t>(request.body_size());
        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                // Discovery documents may redirect; streamed bodies cannot be replayed
                curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
                curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, body_size);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, body_size);
                break;
        }

        if (request.body_source) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, &TransferState::on_read);
            curl_easy_setopt(curl, CURLOPT_READDATA, &state);
        }
        if (header_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        }
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &TransferState::on_write);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);

        if (state.cancel) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &TransferState::on_progress);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        auto connect_timeout = request.connect_timeout.count() > 0
            ? request.connect_timeout : config_.connect_timeout;
        auto total_timeout = request.total_timeout.count() > 0
            ? request.total_timeout : config_.request_timeout;
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(total_timeout.count()));

        curl_easy_setopt(curl, CURLOPT_MAXAGE_CONN, static_cast<long>(config_.idle_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, static_cast<long>(config_.keepalive_idle.count()));

        const bool verify = request.verify_ssl && config_.verify_ssl;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);
        if (!config_.ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle.c_str());
        }
        if (!config_.proxy.empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, config_.proxy.c_str());
        }
    }

    void trim_loop() {
        std::unique_lock<std::mutex> lock(trim_mutex_);
        while (!stopping_) {
            trim_cv_.wait_for(lock, config_.trim_interval, [this] { return stopping_; });
            if (stopping_) break;
            pool_.trim(config_.max_idle_per_host);
        }
    }

    HttpClientConfig config_;
    HandlePool pool_;

    std::mutex trim_mutex_;
    std::condition_variable trim_cv_;
    bool stopping_ = false;
    std::thread trimmer_;
};

// ============================================================================
// Async transfers
// ============================================================================

namespace {

// Runs one request on its own thread. The destructor cancels an unfinished
// transfer and joins, so no transfer outlives its handle.
class AsyncTransfer : public HttpAsyncOperation {
public:
    AsyncTransfer(HttpClient& client, const HttpRequest& request)
        : request_(request) {
        thread_ = std::thread([this, &client]() {
            HttpResponse response = client.execute(request_, &cancelled_);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                response_ = std::move(response);
                complete_ = true;
            }
            cv_.notify_all();
        });
    }

    ~AsyncTransfer() override {
        if (!is_complete()) {
            cancel();
        }
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool is_complete() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return complete_;
    }

    HttpResponse wait() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return complete_; });
        return response_;
    }

    bool wait_for(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return complete_; });
    }

    void cancel() override {
        cancelled_.store(true, std::memory_order_release);
        // Wakes a read blocked on an empty chunk queue
        if (request_.body_source) {
            request_.body_source->close();
        }
    }

private:
    HttpRequest request_;
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool complete_ = false;
    HttpResponse response_;
    std::thread thread_;
};

} // namespace

// ============================================================================
// HttpClient / CurlTransport
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request, const std::atomic<bool>* cancel) {
    return impl_->execute(request, cancel);
}

std::unique_ptr<HttpAsyncOperation> HttpClient::execute_async(const HttpRequest& request) {
    return std::make_unique<AsyncTransfer>(*this, request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

CurlTransport::CurlTransport(const HttpClientConfig& config)
    : client_(config) {}

std::unique_ptr<HttpAsyncOperation> CurlTransport::start(const HttpRequest& request) {
    return client_.execute_async(request);
}

HttpResponse CurlTransport::execute(const HttpRequest& request) {
    return client_.execute(request);
}

} // namespace blobup::net
