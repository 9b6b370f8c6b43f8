#pragma once

#include "blobup/net/transport.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blobup {

// File-storage server self description (/.well-known/nostr/nip96.json)
struct ServerConfig {
    std::string api_url;
    std::string download_url;
    std::vector<int> supported_nips;
    std::vector<std::string> content_types;
    std::optional<uint64_t> max_byte_size;
};

struct ServerConfigResult {
    bool success = false;
    ServerConfig config;
    std::string error_message;
};

/// Parse a well-known document. Relative api_url/download_url values are
/// resolved against server.
ServerConfigResult parse_server_config(const std::string& server, const std::string& body);

/// Per-server configuration, fetched on first use and reused afterwards.
/// Failed fetches are not cached.
class ServerConfigCache {
public:
    explicit ServerConfigCache(net::Transport& transport);

    ServerConfigResult get(const std::string& server);

    // Drop one server's entry; the next get() fetches again
    void invalidate(const std::string& server);

    // Drop everything
    void reset();

    size_t size() const;

private:
    ServerConfigResult fetch(const std::string& server);

    net::Transport& transport_;
    mutable std::mutex mutex_;
    std::map<std::string, ServerConfig> entries_;
};

} // namespace blobup
