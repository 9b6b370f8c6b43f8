#pragma once

#include <cstddef>
#include <cstdint>

namespace blobup::constants {

// Streaming defaults
constexpr size_t DEFAULT_CHUNK_SIZE = 64 * 1024;                       // 64KB
constexpr size_t DEFAULT_QUEUE_CAPACITY = 8;                           // chunks in flight

// Progress sampling
constexpr int DEFAULT_POLL_INTERVAL_MS = 100;
constexpr uint32_t DEFAULT_STALL_THRESHOLD = 200;                      // 200 * 100ms = 20s

// Retry defaults
constexpr uint32_t DEFAULT_RETRY_COUNT = 3;
constexpr uint32_t MAX_RETRY_COUNT = 100;
constexpr int DEFAULT_RETRY_SPACING_MS = 2000;

// HTTP defaults
constexpr int DEFAULT_CONNECT_TIMEOUT_SECONDS = 5;
constexpr int DEFAULT_REQUEST_TIMEOUT_SECONDS = 300;                   // 5 minutes
constexpr int DEFAULT_POOL_IDLE_TIMEOUT_SECONDS = 90;
constexpr size_t DEFAULT_POOL_MAX_IDLE_PER_HOST = 2;
constexpr size_t DEFAULT_MAX_RESPONSE_SIZE = 1024 * 1024;              // 1MB of JSON is plenty
constexpr const char* DEFAULT_USER_AGENT = "blobup/1.0";

// Authorization
constexpr int64_t AUTH_EXPIRATION_SECONDS = 300;
constexpr int BLOSSOM_AUTH_KIND = 24242;
constexpr int HTTP_AUTH_KIND = 27235;
constexpr const char* AUTH_SCHEME = "Nostr";

// Encryption (AES-256-GCM with a 16-byte nonce)
constexpr size_t KEY_SIZE = 32;
constexpr size_t NONCE_SIZE = 16;
constexpr size_t TAG_SIZE = 16;

// Endpoints
constexpr const char* BLOSSOM_UPLOAD_PATH = "upload";
constexpr const char* NIP96_WELL_KNOWN_PATH = "/.well-known/nostr/nip96.json";

// Metrics defaults
constexpr int DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace blobup::constants
