#include "blobup/config.hpp"
#include "blobup/upload/failover.hpp"
#include "blobup/upload/mime.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace blobup {

namespace {

// Read an unsigned integer from the environment into target if it lies in
// [lo, hi]. Anything else leaves target alone with a warning.
template <typename T>
void env_uint(const char* name, unsigned long long lo, unsigned long long hi, T& target) {
    const char* env = std::getenv(name);
    if (!env) return;
    try {
        unsigned long long value = std::stoull(env);
        if (value >= lo && value <= hi) {
            target = static_cast<T>(value);
            return;
        }
        std::cerr << "warning: " << name << "=" << env
                  << " out of range [" << lo << "," << hi << "], using default\n";
    } catch (const std::exception&) {
        std::cerr << "warning: invalid " << name << "=" << env << ", using default\n";
    }
}

bool parse_bool(const std::string& value, bool& out) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    return false;
}

void env_bool(const char* name, bool& target) {
    const char* env = std::getenv(name);
    if (!env) return;
    if (!parse_bool(env, target)) {
        std::cerr << "warning: invalid " << name << "=" << env << ", using default\n";
    }
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        size_t end = item.find_last_not_of(" \t");
        if (start != std::string::npos) {
            out.push_back(item.substr(start, end - start + 1));
        }
    }
    return out;
}

}  // namespace

bool UploadConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("protocol")) {
            auto name = j["protocol"].get<std::string>();
            auto parsed = parse_upload_protocol(name);
            if (!parsed) {
                std::cerr << "Error: unknown protocol in config: " << name << "\n";
                return false;
            }
            protocol = *parsed;
        }
        if (j.contains("servers")) servers = j["servers"].get<std::vector<std::string>>();
        if (j.contains("mime_type")) mime_type = j["mime_type"].get<std::string>();
        if (j.contains("retry_count")) retry_count = j["retry_count"].get<uint32_t>();
        if (j.contains("retry_spacing_ms"))
            retry_spacing = std::chrono::milliseconds(j["retry_spacing_ms"].get<int64_t>());
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<size_t>();
        if (j.contains("queue_capacity")) queue_capacity = j["queue_capacity"].get<size_t>();
        if (j.contains("stall_threshold")) stall_threshold = j["stall_threshold"].get<uint32_t>();
        if (j.contains("poll_interval_ms"))
            poll_interval = std::chrono::milliseconds(j["poll_interval_ms"].get<int64_t>());
        if (j.contains("connect_timeout"))
            connect_timeout = std::chrono::seconds(j["connect_timeout"].get<int64_t>());
        if (j.contains("request_timeout"))
            request_timeout = std::chrono::seconds(j["request_timeout"].get<int64_t>());
        if (j.contains("pool_idle_timeout"))
            pool_idle_timeout = std::chrono::seconds(j["pool_idle_timeout"].get<int64_t>());
        if (j.contains("pool_max_idle_per_host"))
            pool_max_idle_per_host = j["pool_max_idle_per_host"].get<size_t>();
        if (j.contains("proxy")) proxy = j["proxy"].get<std::string>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("ca_bundle")) ca_bundle = j["ca_bundle"].get<std::string>();
        if (j.contains("user_agent")) user_agent = j["user_agent"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void UploadConfig::apply_env() {
    if (const char* v = std::getenv("BLOBUP_PROTOCOL")) {
        if (auto parsed = parse_upload_protocol(v)) {
            protocol = *parsed;
        } else {
            std::cerr << "warning: invalid BLOBUP_PROTOCOL=" << v << ", using default\n";
        }
    }
    if (const char* v = std::getenv("BLOBUP_SERVERS")) {
        servers = split_list(v);
    }
    if (const char* v = std::getenv("BLOBUP_PROXY")) {
        proxy = v;
    }

    env_uint("BLOBUP_RETRY_COUNT", 0, constants::MAX_RETRY_COUNT, retry_count);

    uint64_t spacing_ms = static_cast<uint64_t>(retry_spacing.count());
    env_uint("BLOBUP_RETRY_SPACING_MS", 0, 600000, spacing_ms);
    retry_spacing = std::chrono::milliseconds(spacing_ms);

    env_uint("BLOBUP_CHUNK_SIZE", 1024, 16 * 1024 * 1024, chunk_size);
    env_uint("BLOBUP_STALL_THRESHOLD", 1, 100000, stall_threshold);

    uint64_t connect_secs = static_cast<uint64_t>(connect_timeout.count());
    env_uint("BLOBUP_CONNECT_TIMEOUT", 1, 300, connect_secs);
    connect_timeout = std::chrono::seconds(connect_secs);

    uint64_t request_secs = static_cast<uint64_t>(request_timeout.count());
    env_uint("BLOBUP_REQUEST_TIMEOUT", 5, 3600, request_secs);
    request_timeout = std::chrono::seconds(request_secs);

    env_bool("BLOBUP_VERIFY_SSL", verify_ssl);
    env_bool("BLOBUP_VERBOSE", verbose);
}

std::string UploadConfig::validate() const {
    if (servers.empty()) return "at least one server is required";
    // Invalid entries are skipped at upload time; a list with none usable is an error
    if (std::none_of(servers.begin(), servers.end(), [](const std::string& server) {
            return FailoverController::validate_server_url(server).empty();
        })) {
        return "no valid server URL in servers";
    }
    if (!mime_type.empty() && !is_valid_mime_type(mime_type))
        return "invalid mime_type: " + mime_type;
    if (chunk_size == 0) return "chunk_size must be > 0";
    if (queue_capacity == 0) return "queue_capacity must be > 0";
    if (stall_threshold == 0) return "stall_threshold must be > 0";
    if (poll_interval.count() <= 0) return "poll_interval must be > 0";
    if (retry_count > constants::MAX_RETRY_COUNT)
        return "retry_count must be <= " + std::to_string(constants::MAX_RETRY_COUNT);
    if (retry_spacing.count() < 0) return "retry_spacing must be >= 0";
    if (connect_timeout.count() <= 0) return "connect_timeout must be > 0";
    if (request_timeout.count() <= 0) return "request_timeout must be > 0";
    if (connect_timeout > request_timeout) return "connect_timeout must be <= request_timeout";
    if (pool_max_idle_per_host == 0) return "pool_max_idle_per_host must be > 0";
    if (!metrics_file.empty() && metrics_interval_secs == 0)
        return "metrics_interval must be > 0";
    return {};
}

AttemptOptions UploadConfig::attempt_options() const {
    AttemptOptions options;
    options.chunk_size = chunk_size;
    options.queue_capacity = queue_capacity;
    options.stall_threshold = stall_threshold;
    options.poll_interval = poll_interval;
    options.connect_timeout = connect_timeout;
    options.request_timeout = request_timeout;
    options.verify_ssl = verify_ssl;
    return options;
}

RetryPolicy UploadConfig::retry_policy() const {
    RetryPolicy policy;
    policy.retry_count = retry_count;
    policy.retry_spacing = retry_spacing;
    return policy;
}

net::HttpClientConfig UploadConfig::http_client_config() const {
    net::HttpClientConfig config;
    config.max_idle_per_host = pool_max_idle_per_host;
    config.idle_timeout = pool_idle_timeout;
    config.connect_timeout = connect_timeout;
    config.request_timeout = request_timeout;
    config.verify_ssl = verify_ssl;
    config.ca_bundle = ca_bundle;
    config.user_agent = user_agent;
    config.proxy = proxy;
    return config;
}

}  // namespace blobup
