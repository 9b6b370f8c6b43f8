#include "blobup/upload/server_config.hpp"
#include "blobup/core/constants.hpp"
#include "blobup/log.hpp"

#include <nlohmann/json.hpp>

namespace blobup {

using json = nlohmann::json;

namespace {

ServerConfigResult config_fail(std::string message) {
    ServerConfigResult result;
    result.error_message = std::move(message);
    return result;
}

std::string resolve(const net::ParsedUrl& base, const std::string& ref) {
    if (ref.empty() || net::ParsedUrl::parse(ref)) {
        return ref;
    }
    return base.join(ref).to_string();
}

} // namespace

ServerConfigResult parse_server_config(const std::string& server, const std::string& body) {
    auto base = net::ParsedUrl::parse(server);
    if (!base) {
        return config_fail("Invalid server URL: " + server);
    }

    ServerConfig config;
    try {
        json j = json::parse(body);
        if (!j.is_object()) {
            return config_fail("Server config is not a JSON object");
        }
        if (j.contains("api_url") && j["api_url"].is_string()) {
            config.api_url = resolve(*base, j["api_url"].get<std::string>());
        }
        if (j.contains("download_url") && j["download_url"].is_string()) {
            config.download_url = resolve(*base, j["download_url"].get<std::string>());
        }
        if (j.contains("supported_nips") && j["supported_nips"].is_array()) {
            for (const auto& nip : j["supported_nips"]) {
                if (nip.is_number_integer()) config.supported_nips.push_back(nip.get<int>());
            }
        }
        if (j.contains("plans") && j["plans"].is_object() && j["plans"].contains("free")) {
            const auto& free = j["plans"]["free"];
            if (free.contains("max_byte_size") && free["max_byte_size"].is_number_unsigned()) {
                config.max_byte_size = free["max_byte_size"].get<uint64_t>();
            }
        }
        if (j.contains("content_types") && j["content_types"].is_array()) {
            for (const auto& type : j["content_types"]) {
                if (type.is_string()) config.content_types.push_back(type.get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        return config_fail(std::string("Failed to parse server config: ") + e.what());
    }

    if (config.api_url.empty()) {
        return config_fail("Server config has no api_url");
    }

    ServerConfigResult result;
    result.success = true;
    result.config = std::move(config);
    return result;
}

ServerConfigCache::ServerConfigCache(net::Transport& transport)
    : transport_(transport) {}

ServerConfigResult ServerConfigCache::get(const std::string& server) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(server);
        if (it != entries_.end()) {
            ServerConfigResult result;
            result.success = true;
            result.config = it->second;
            return result;
        }
    }

    // Fetched without the lock; concurrent misses may fetch twice
    ServerConfigResult result = fetch(server);
    if (result.success) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[server] = result.config;
    }
    return result;
}

ServerConfigResult ServerConfigCache::fetch(const std::string& server) {
    auto base = net::ParsedUrl::parse(server);
    if (!base) {
        return config_fail("Invalid server URL: " + server);
    }

    std::string url = base->join(constants::NIP96_WELL_KNOWN_PATH).to_string();
    log_debug("[server-config] fetching %s", url.c_str());

    net::HttpResponse response = transport_.execute(net::HttpRequest::get(url));
    if (!response.error.empty() && response.status_code == 0) {
        return config_fail("Failed to fetch server config: " + response.error);
    }
    if (!response.ok()) {
        return config_fail("Failed to fetch server config: HTTP " +
                           std::to_string(response.status_code));
    }

    return parse_server_config(server, response.body_string());
}

void ServerConfigCache::invalidate(const std::string& server) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(server);
}

void ServerConfigCache::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t ServerConfigCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace blobup
