#pragma once

#include "blobup/core/constants.hpp"
#include "blobup/net/http.hpp"
#include "blobup/upload/attempt.hpp"
#include "blobup/upload/retry_policy.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace blobup {

/// Configuration for the upload engine.
/// Defaults come from core/constants.hpp; a JSON file and BLOBUP_*
/// environment variables can overlay them.
struct UploadConfig {
    // Servers, tried in order
    UploadProtocol protocol = UploadProtocol::Blossom;
    std::vector<std::string> servers;
    std::string mime_type;  // Empty: no Content-Type sent

    // Retry (per server)
    uint32_t retry_count = constants::DEFAULT_RETRY_COUNT;
    std::chrono::milliseconds retry_spacing{constants::DEFAULT_RETRY_SPACING_MS};

    // Streaming
    size_t chunk_size = constants::DEFAULT_CHUNK_SIZE;
    size_t queue_capacity = constants::DEFAULT_QUEUE_CAPACITY;

    // Stall detection: stall_threshold ticks of poll_interval without progress
    uint32_t stall_threshold = constants::DEFAULT_STALL_THRESHOLD;
    std::chrono::milliseconds poll_interval{constants::DEFAULT_POLL_INTERVAL_MS};

    // HTTP
    std::chrono::seconds connect_timeout{constants::DEFAULT_CONNECT_TIMEOUT_SECONDS};
    std::chrono::seconds request_timeout{constants::DEFAULT_REQUEST_TIMEOUT_SECONDS};
    std::chrono::seconds pool_idle_timeout{constants::DEFAULT_POOL_IDLE_TIMEOUT_SECONDS};
    size_t pool_max_idle_per_host = constants::DEFAULT_POOL_MAX_IDLE_PER_HOST;
    std::string proxy;      // e.g. socks5h://127.0.0.1:9050
    bool verify_ssl = true;
    std::string ca_bundle;
    std::string user_agent = constants::DEFAULT_USER_AGENT;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    bool verbose = false;

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Overlay BLOBUP_* environment variables. Out-of-range or unparsable
    /// values are reported on stderr and ignored.
    void apply_env();

    /// Validate fields. Returns error message or empty string.
    std::string validate() const;

    // Views for the components the uploader wires together
    AttemptOptions attempt_options() const;
    RetryPolicy retry_policy() const;
    net::HttpClientConfig http_client_config() const;
};

}  // namespace blobup
