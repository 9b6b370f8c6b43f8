#pragma once

#include "blobup/core/constants.hpp"
#include "blobup/net/http.hpp"
#include "blobup/net/transport.hpp"
#include "blobup/upload/authorization.hpp"
#include "blobup/upload/progress.hpp"
#include "blobup/upload/result.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blobup {

// Server wire protocol
enum class UploadProtocol {
    Blossom,  // PUT <server>/upload, raw body, kind 24242 token
    Nip96     // POST <api_url>, multipart body, kind 27235 token
};

const char* upload_protocol_name(UploadProtocol protocol);
std::optional<UploadProtocol> parse_upload_protocol(const std::string& name);

// Where one attempt sends its bytes
struct UploadTarget {
    UploadProtocol protocol = UploadProtocol::Blossom;
    std::string url;  // Blossom: server base URL. Nip96: the advertised api_url.
};

// Bytes to upload. The buffer is shared read-only across attempts.
struct UploadPayload {
    std::shared_ptr<const std::vector<uint8_t>> data;
    std::string sha256;  // hex hash of data
    std::string mime;    // empty = not sent

    static UploadPayload from(std::vector<uint8_t> bytes, std::string mime = "");

    uint64_t size() const { return data ? data->size() : 0; }
};

struct AttemptOptions {
    size_t chunk_size = constants::DEFAULT_CHUNK_SIZE;
    size_t queue_capacity = constants::DEFAULT_QUEUE_CAPACITY;
    uint32_t stall_threshold = constants::DEFAULT_STALL_THRESHOLD;
    std::chrono::milliseconds poll_interval{constants::DEFAULT_POLL_INTERVAL_MS};
    std::chrono::milliseconds connect_timeout{constants::DEFAULT_CONNECT_TIMEOUT_SECONDS * 1000};
    std::chrono::milliseconds request_timeout{constants::DEFAULT_REQUEST_TIMEOUT_SECONDS * 1000};
    bool verify_ssl = true;
};

/// Runs one HTTP transfer while sampling progress.
///
/// The transfer is started without blocking; the calling thread then wakes
/// every poll_interval to read the bytes handed to the transport, report
/// strictly increasing percentages, and count ticks without progress. A stall
/// or an observer failure cancels the transfer, and attempt() only returns
/// once the transport has released the body.
class AttemptExecutor {
public:
    AttemptExecutor(net::Transport& transport, EventSigner& signer,
                    AttemptOptions options = {});

    /// @param observer may be null
    UploadResult attempt(const UploadTarget& target,
                         const UploadPayload& payload,
                         ProgressObserver* observer);

    const AttemptOptions& options() const { return options_; }

private:
    struct PreparedRequest {
        net::HttpRequest request;
        std::shared_ptr<net::BodySource> body;
    };

    std::optional<PreparedRequest> prepare(const UploadTarget& target,
                                           const UploadPayload& payload,
                                           const std::shared_ptr<ProgressCounter>& counter,
                                           UploadResult& failure);

    net::Transport& transport_;
    EventSigner& signer_;
    AttemptOptions options_;
};

/// Parse a 200 response body into a descriptor.
/// Blossom: {"url": ...}. Nip96: {"status":"success","nip94_event":{"tags":[["url",...]]}}.
UploadResult parse_upload_response(UploadProtocol protocol, const std::string& body);

} // namespace blobup
