#pragma once

#include "blobup/core/constants.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blobup::net {

enum class HttpMethod {
    GET,
    POST,
    PUT
};

bool is_success_status(int status);

// HTTP headers (case-insensitive names)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type) { set("Content-Type", content_type); }
    void set_authorization(const std::string& value) { set("Authorization", value); }
    std::optional<std::string> content_type() const { return get("Content-Type"); }

private:
    // lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;
};

// Streaming request body.
// read() is called from the transfer thread; close() may be called from any
// thread and must unblock a pending read().
class BodySource {
public:
    virtual ~BodySource() = default;

    // Total number of bytes the body will produce
    virtual uint64_t size() const = 0;

    // Copy up to max bytes into buffer. Returns 0 once the body is exhausted
    // or closed.
    virtual size_t read(uint8_t* buffer, size_t max) = 0;

    // Stop producing; further reads return 0
    virtual void close() = 0;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::shared_ptr<BodySource> body_source;  // null for GET

    // Zero = client default
    std::chrono::milliseconds connect_timeout{0};
    std::chrono::milliseconds total_timeout{0};
    bool verify_ssl = true;

    static HttpRequest get(const std::string& url);
    static HttpRequest put(const std::string& url, std::shared_ptr<BodySource> source);
    static HttpRequest post(const std::string& url, std::shared_ptr<BodySource> source);

    uint64_t body_size() const { return body_source ? body_source->size() : 0; }
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::chrono::milliseconds elapsed{0};

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const { return std::string(body.begin(), body.end()); }

    // Set when no usable HTTP response was received
    std::string error;
    bool is_network_error = false;
    bool cancelled = false;  // caller aborted the transfer
};

struct HttpClientConfig {
    // Handle pool. Idle handles are kept per scheme://host:port so a reused
    // handle finds its keep-alive connection.
    size_t max_handles = 16;
    size_t max_idle_per_host = constants::DEFAULT_POOL_MAX_IDLE_PER_HOST;
    std::chrono::seconds idle_timeout{constants::DEFAULT_POOL_IDLE_TIMEOUT_SECONDS};
    std::chrono::seconds trim_interval{30};
    std::chrono::seconds keepalive_idle{60};

    std::chrono::milliseconds connect_timeout{constants::DEFAULT_CONNECT_TIMEOUT_SECONDS * 1000};
    std::chrono::milliseconds request_timeout{constants::DEFAULT_REQUEST_TIMEOUT_SECONDS * 1000};

    size_t max_response_size = constants::DEFAULT_MAX_RESPONSE_SIZE;  // 0 = unlimited

    bool verify_ssl = true;
    std::string ca_bundle;
    std::string user_agent = constants::DEFAULT_USER_AGENT;
    std::string proxy;  // e.g. socks5h://127.0.0.1:9050
};

// Handle to an in-flight request
class HttpAsyncOperation {
public:
    virtual ~HttpAsyncOperation() = default;

    virtual bool is_complete() const = 0;

    // Block until the response is ready
    virtual HttpResponse wait() = 0;

    // Block up to timeout; true if the response is ready
    virtual bool wait_for(std::chrono::milliseconds timeout) = 0;

    // Abort the transfer. wait() then returns a response with cancelled set.
    virtual void cancel() = 0;
};

// libcurl client with a pool of reusable easy handles
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Synchronous request. The transfer is aborted as soon as *cancel
    // becomes true.
    HttpResponse execute(const HttpRequest& request,
                         const std::atomic<bool>* cancel = nullptr);

    // Asynchronous request, runs on its own thread
    std::unique_ptr<HttpAsyncOperation> execute_async(const HttpRequest& request);

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Absolute http(s) URL split into the parts the uploader rewrites
struct ParsedUrl {
    std::string scheme;   // lowercase
    std::string host;
    int port = 0;         // 0 = scheme default
    std::string path;     // empty or starting with '/'
    std::string query;

    std::string to_string() const;

    // Resolve a relative reference. Plain segments ("upload") replace the
    // last path segment, absolute paths ("/api") replace the whole path.
    // Query is dropped. Dot segments are not interpreted.
    ParsedUrl join(const std::string& relative) const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// Base64 (standard alphabet, padded)
std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& str);
// Empty on malformed input
std::vector<uint8_t> base64_decode(const std::string& encoded);

} // namespace blobup::net
