#include "blobup/upload/attempt.hpp"
#include "blobup/crypto/encryption.hpp"
#include "blobup/log.hpp"
#include "blobup/upload/chunk_stream.hpp"
#include "blobup/upload/mime.hpp"

#include <nlohmann/json.hpp>

namespace blobup {

using json = nlohmann::json;

const char* upload_error_name(UploadError error) {
    switch (error) {
        case UploadError::None: return "none";
        case UploadError::Validation: return "validation";
        case UploadError::Authorization: return "authorization";
        case UploadError::Transport: return "transport";
        case UploadError::Protocol: return "protocol";
        case UploadError::Stall: return "stall";
        case UploadError::CallbackAbort: return "callback_abort";
        case UploadError::Crypto: return "crypto";
    }
    return "unknown";
}

const char* upload_protocol_name(UploadProtocol protocol) {
    switch (protocol) {
        case UploadProtocol::Blossom: return "blossom";
        case UploadProtocol::Nip96: return "nip96";
    }
    return "blossom";
}

std::optional<UploadProtocol> parse_upload_protocol(const std::string& name) {
    if (name == "blossom") return UploadProtocol::Blossom;
    if (name == "nip96") return UploadProtocol::Nip96;
    return std::nullopt;
}

UploadPayload UploadPayload::from(std::vector<uint8_t> bytes, std::string mime) {
    UploadPayload payload;
    payload.sha256 = crypto::sha256_hex(bytes);
    payload.data = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
    payload.mime = std::move(mime);
    return payload;
}

// ============================================================================
// Response parsing
// ============================================================================

namespace {

BlobDescriptor parse_blossom_descriptor(const json& j) {
    BlobDescriptor d;
    if (j.contains("url") && j["url"].is_string()) d.url = j["url"].get<std::string>();
    if (j.contains("sha256") && j["sha256"].is_string()) d.sha256 = j["sha256"].get<std::string>();
    if (j.contains("size") && j["size"].is_number_unsigned()) d.size = j["size"].get<uint64_t>();
    if (j.contains("type") && j["type"].is_string()) d.type = j["type"].get<std::string>();
    if (j.contains("uploaded") && j["uploaded"].is_number_integer()) d.uploaded = j["uploaded"].get<int64_t>();
    return d;
}

BlobDescriptor parse_nip94_descriptor(const json& event) {
    BlobDescriptor d;
    if (!event.contains("tags") || !event["tags"].is_array()) {
        return d;
    }
    for (const auto& tag : event["tags"]) {
        if (!tag.is_array() || tag.size() < 2 || !tag[0].is_string() || !tag[1].is_string()) {
            continue;
        }
        const std::string name = tag[0].get<std::string>();
        const std::string value = tag[1].get<std::string>();
        if (name == "url" && d.url.empty()) {
            d.url = value;
        } else if (name == "x") {
            d.sha256 = value;
        } else if (name == "m") {
            d.type = value;
        } else if (name == "size") {
            try {
                d.size = std::stoull(value);
            } catch (const std::exception&) {
                // Ignore a malformed size tag
            }
        }
    }
    return d;
}

} // namespace

UploadResult parse_upload_response(UploadProtocol protocol, const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        return UploadResult::fail(UploadError::Protocol,
                                  std::string("Failed to parse response: ") + e.what(), 200);
    }
    if (!j.is_object()) {
        return UploadResult::fail(UploadError::Protocol,
                                  "Failed to parse response: not a JSON object", 200);
    }

    BlobDescriptor descriptor;
    try {
        if (protocol == UploadProtocol::Blossom) {
            descriptor = parse_blossom_descriptor(j);
        } else {
            if (j.value("status", "") == "error") {
                return UploadResult::fail(UploadError::Protocol,
                                          j.value("message", "Server reported an error"), 200);
            }
            if (j.contains("nip94_event") && j["nip94_event"].is_object()) {
                descriptor = parse_nip94_descriptor(j["nip94_event"]);
            }
        }
    } catch (const json::exception& e) {
        return UploadResult::fail(UploadError::Protocol,
                                  std::string("Unexpected response shape: ") + e.what(), 200);
    }

    if (descriptor.url.empty()) {
        return UploadResult::fail(UploadError::Protocol, "Response carries no blob URL", 200);
    }
    return UploadResult::ok(std::move(descriptor), 200);
}

// ============================================================================
// AttemptExecutor
// ============================================================================

AttemptExecutor::AttemptExecutor(net::Transport& transport, EventSigner& signer,
                                 AttemptOptions options)
    : transport_(transport)
    , signer_(signer)
    , options_(options) {}

std::optional<AttemptExecutor::PreparedRequest> AttemptExecutor::prepare(
    const UploadTarget& target,
    const UploadPayload& payload,
    const std::shared_ptr<ProgressCounter>& counter,
    UploadResult& failure) {

    if (!payload.mime.empty() && !is_valid_mime_type(payload.mime)) {
        failure = UploadResult::fail(UploadError::Validation,
                                     "Invalid content type: " + payload.mime);
        return std::nullopt;
    }

    auto base = net::ParsedUrl::parse(target.url);
    if (!base) {
        failure = UploadResult::fail(UploadError::Validation, "Invalid server URL: " + target.url);
        return std::nullopt;
    }

    auto data = payload.data ? payload.data : std::make_shared<const std::vector<uint8_t>>();
    auto stream = std::make_shared<ChunkedStream>(data, options_.chunk_size, counter,
                                                  options_.queue_capacity);

    PreparedRequest prepared;
    AuthResult auth;
    const int64_t now = unix_now();

    if (target.protocol == UploadProtocol::Blossom) {
        std::string upload_url = base->join(constants::BLOSSOM_UPLOAD_PATH).to_string();
        auth = build_upload_authorization(signer_, payload.sha256, now);
        prepared.body = stream;
        prepared.request = net::HttpRequest::put(upload_url, stream);
        if (!payload.mime.empty()) {
            prepared.request.headers.set_content_type(payload.mime);
        }
    } else {
        auth = build_http_authorization(signer_, target.url, "POST", payload.sha256, now);
        auto multipart = std::make_shared<MultipartBody>(
            stream, MultipartBody::generate_boundary(), "file", "filename", payload.mime);
        prepared.body = multipart;
        prepared.request = net::HttpRequest::post(target.url, multipart);
        prepared.request.headers.set_content_type(multipart->content_type());
    }

    if (!auth.success) {
        prepared.body->close();
        failure = UploadResult::fail(UploadError::Authorization, auth.error_message);
        return std::nullopt;
    }

    prepared.request.headers.set_authorization(auth.header_value);
    prepared.request.connect_timeout = options_.connect_timeout;
    prepared.request.total_timeout = options_.request_timeout;
    prepared.request.verify_ssl = options_.verify_ssl;
    return prepared;
}

UploadResult AttemptExecutor::attempt(const UploadTarget& target,
                                      const UploadPayload& payload,
                                      ProgressObserver* observer) {
    // Counter is owned by this attempt and dies with it
    auto counter = std::make_shared<ProgressCounter>();
    const uint64_t total = payload.size();

    UploadResult failure;
    auto prepared = prepare(target, payload, counter, failure);
    if (!prepared) {
        return failure;
    }

    auto finish = [&](UploadResult result) {
        result.attempts = 1;
        result.bytes_sent = counter->get();
        return result;
    };

    if (observer && !observer->report(0, 0)) {
        prepared->body->close();
        return finish(UploadResult::fail(UploadError::CallbackAbort,
                                         "Progress callback aborted the upload"));
    }

    log_debug("[upload] %s %s (%llu bytes)", upload_protocol_name(target.protocol),
              prepared->request.url.c_str(), static_cast<unsigned long long>(total));

    std::unique_ptr<net::HttpAsyncOperation> op = transport_.start(prepared->request);

    uint64_t last_bytes = 0;
    uint32_t last_percentage = 0;
    uint32_t stall_ticks = 0;

    while (!op->wait_for(options_.poll_interval)) {
        const uint64_t bytes = counter->get();
        const uint32_t percentage = progress_percentage(bytes, total);

        if (bytes == last_bytes && percentage > 0 && percentage < 100) {
            if (++stall_ticks >= options_.stall_threshold) {
                op->cancel();
                op->wait();
                log_warn("[upload] stalled at %u%% after %u ticks: %s",
                         percentage, stall_ticks, prepared->request.url.c_str());
                return finish(UploadResult::fail(UploadError::Stall,
                                                 "Upload stalled - no progress detected"));
            }
        } else {
            stall_ticks = 0;
            last_bytes = bytes;
        }

        if (percentage > last_percentage) {
            if (observer && !observer->report(percentage, bytes)) {
                op->cancel();
                op->wait();
                return finish(UploadResult::fail(UploadError::CallbackAbort,
                                                 "Progress callback aborted the upload"));
            }
            last_percentage = percentage;
        }
    }

    net::HttpResponse response = op->wait();

    if (response.cancelled || (!response.error.empty() && response.status_code == 0)) {
        return finish(UploadResult::fail(UploadError::Transport,
                                         "Upload request failed: " + response.error));
    }

    // All bytes went out; make sure the observer sees the end
    if (last_percentage < 100 && counter->get() == total) {
        if (observer && !observer->report(100, total)) {
            return finish(UploadResult::fail(UploadError::CallbackAbort,
                                             "Progress callback aborted the upload",
                                             response.status_code));
        }
    }

    if (!response.error.empty()) {
        return finish(UploadResult::fail(UploadError::Protocol, response.error,
                                         response.status_code));
    }

    if (response.status_code != 200) {
        std::string text = response.body_string();
        if (text.empty()) text = "Unknown error";
        log_error("[upload] %s failed with status %d", prepared->request.url.c_str(),
                  response.status_code);
        return finish(UploadResult::fail(
            UploadError::Protocol,
            "Upload failed with status " + std::to_string(response.status_code) + ": " + text,
            response.status_code));
    }

    return finish(parse_upload_response(target.protocol, response.body_string()));
}

} // namespace blobup
