#include "blobup/upload/authorization.hpp"
#include "blobup/core/constants.hpp"
#include "blobup/crypto/encryption.hpp"
#include "blobup/net/http.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>

namespace blobup {

using json = nlohmann::json;
using namespace blobup::constants;

namespace {

bool is_lower_hex(const std::string& s, size_t expected_len) {
    if (s.size() != expected_len) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c)) && !(c >= 'a' && c <= 'f')) {
            return false;
        }
    }
    return true;
}

AuthResult auth_fail(std::string message) {
    AuthResult result;
    result.error_message = std::move(message);
    return result;
}

// Build, sign and encode one event
AuthResult build_authorization(EventSigner& signer, int kind, const EventTags& tags,
                               const std::string& content, int64_t now, int64_t expires_at) {
    std::string pubkey = signer.public_key();
    if (!is_lower_hex(pubkey, 64)) {
        return auth_fail("Signer returned a malformed public key");
    }

    std::string id = compute_event_id(pubkey, now, kind, tags, content);

    SignResult signed_id = signer.sign(id);
    if (!signed_id.success) {
        return auth_fail("Failed to sign auth event: " + signed_id.error_message);
    }
    if (!is_lower_hex(signed_id.signature, 128)) {
        return auth_fail("Signer returned a malformed signature");
    }

    json event = {
        {"id", id},
        {"pubkey", pubkey},
        {"created_at", now},
        {"kind", kind},
        {"tags", tags},
        {"content", content},
        {"sig", signed_id.signature}
    };

    std::string value = std::string(AUTH_SCHEME) + " " + net::base64_encode(event.dump());
    if (!is_valid_header_value(value)) {
        return auth_fail("Failed to create header value: invalid characters");
    }

    AuthResult result;
    result.success = true;
    result.header_value = std::move(value);
    result.expires_at = expires_at;
    return result;
}

} // namespace

std::string compute_event_id(const std::string& pubkey,
                             int64_t created_at,
                             int kind,
                             const EventTags& tags,
                             const std::string& content) {
    json serialized = json::array({0, pubkey, created_at, kind, tags, content});
    return crypto::sha256_hex(serialized.dump());
}

AuthResult build_upload_authorization(EventSigner& signer,
                                      const std::string& content_hash,
                                      int64_t now) {
    if (!is_lower_hex(content_hash, 64)) {
        return auth_fail("Invalid content hash");
    }
    int64_t expires_at = now + AUTH_EXPIRATION_SECONDS;
    EventTags tags = {
        {"t", "upload"},
        {"x", content_hash},
        {"expiration", std::to_string(expires_at)}
    };
    return build_authorization(signer, BLOSSOM_AUTH_KIND, tags,
                               "Blossom upload authorization", now, expires_at);
}

AuthResult build_http_authorization(EventSigner& signer,
                                    const std::string& url,
                                    const std::string& method,
                                    const std::string& content_hash,
                                    int64_t now) {
    if (url.empty() || method.empty()) {
        return auth_fail("HTTP authorization requires url and method");
    }
    int64_t expires_at = now + AUTH_EXPIRATION_SECONDS;
    EventTags tags = {
        {"u", url},
        {"method", method}
    };
    if (!content_hash.empty()) {
        tags.push_back({"payload", content_hash});
    }
    tags.push_back({"expiration", std::to_string(expires_at)});
    return build_authorization(signer, HTTP_AUTH_KIND, tags, "", now, expires_at);
}

bool is_valid_header_value(const std::string& value) {
    for (unsigned char c : value) {
        if (c == '\t') continue;
        if (c < 0x20 || c > 0x7E) return false;
    }
    return true;
}

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace blobup
