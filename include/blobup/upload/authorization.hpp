#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace blobup {

using EventTags = std::vector<std::vector<std::string>>;

struct SignResult {
    bool success = false;
    std::string signature;      // 128 hex chars (64-byte Schnorr signature)
    std::string error_message;
};

/// Signing capability supplied by the caller.
/// The engine never sees the private key.
class EventSigner {
public:
    virtual ~EventSigner() = default;

    /// x-only public key, 64 lowercase hex chars
    virtual std::string public_key() const = 0;

    /// Sign a 32-byte event id given as 64 hex chars
    virtual SignResult sign(const std::string& event_id_hex) = 0;
};

struct AuthResult {
    bool success = false;
    std::string header_value;   // "Nostr <base64(event json)>"
    int64_t expires_at = 0;     // unix seconds
    std::string error_message;
};

/// Event id: SHA-256 of the JSON array [0,pubkey,created_at,kind,tags,content]
std::string compute_event_id(const std::string& pubkey,
                             int64_t created_at,
                             int kind,
                             const EventTags& tags,
                             const std::string& content);

/// Blob-store upload token (kind 24242) scoped to one content hash.
/// Expires 300 seconds after now.
AuthResult build_upload_authorization(EventSigner& signer,
                                      const std::string& content_hash,
                                      int64_t now);

/// HTTP request token (kind 27235) bound to url, method and payload hash.
/// Expires 300 seconds after now.
AuthResult build_http_authorization(EventSigner& signer,
                                    const std::string& url,
                                    const std::string& method,
                                    const std::string& content_hash,
                                    int64_t now);

/// True if value can be sent verbatim as an HTTP header value
bool is_valid_header_value(const std::string& value);

/// Current unix time in seconds
int64_t unix_now();

} // namespace blobup
