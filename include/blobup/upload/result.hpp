#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace blobup {

// Failure classes of an upload
enum class UploadError {
    None,
    Validation,     // bad URL, bad mime type, empty server list
    Authorization,  // token could not be minted
    Transport,      // connect/timeout/abort below HTTP
    Protocol,       // non-200 status or unparseable response
    Stall,          // no progress for stall_threshold ticks
    CallbackAbort,  // progress observer failed
    Crypto          // key generation or encryption failed
};

// Stable lowercase name, used as a metrics label and in log lines
const char* upload_error_name(UploadError error);

// Server's locator for a stored blob
struct BlobDescriptor {
    std::string url;
    std::string sha256;
    std::optional<uint64_t> size;
    std::string type;
    std::optional<int64_t> uploaded;
};

// Result of an attempt, a retried server, or a whole failover run
struct UploadResult {
    bool success = false;
    BlobDescriptor descriptor;
    UploadError error = UploadError::None;
    std::string error_message;
    int status_code = 0;     // last HTTP status seen, 0 if none
    uint32_t attempts = 0;   // transfers started
    uint64_t bytes_sent = 0; // handed to the transport by the last attempt

    static UploadResult ok(BlobDescriptor descriptor, int status_code = 200) {
        UploadResult r;
        r.success = true;
        r.descriptor = std::move(descriptor);
        r.status_code = status_code;
        return r;
    }

    static UploadResult fail(UploadError error, std::string message, int status_code = 0) {
        UploadResult r;
        r.error = error;
        r.error_message = std::move(message);
        r.status_code = status_code;
        return r;
    }
};

} // namespace blobup
