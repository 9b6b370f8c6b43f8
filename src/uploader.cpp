#include "blobup/upload/uploader.hpp"
#include "blobup/log.hpp"
#include "blobup/metrics.hpp"

#include <optional>

namespace blobup {

BlobUploader::BlobUploader(UploadConfig config,
                           net::Transport& transport,
                           EventSigner& signer,
                           UploadMetrics* metrics)
    : config_(std::move(config))
    , metrics_(metrics)
    , executor_(transport, signer, config_.attempt_options())
    , failover_(config_.retry_policy())
    , server_configs_(transport) {
    if (config_.verbose) {
        set_verbose(true);
    }
    if (!metrics_ && !config_.metrics_file.empty()) {
        owned_metrics_ = std::make_unique<UploadMetrics>(
            config_.metrics_file, std::chrono::seconds(config_.metrics_interval_secs));
        owned_metrics_->start();
        metrics_ = owned_metrics_.get();
        log_info("[uploader] writing metrics to %s every %zus",
                 config_.metrics_file.string().c_str(), config_.metrics_interval_secs);
    }
    if (metrics_) {
        failover_.on_server_failed([this](const std::string&, const UploadResult&) {
            metrics_->record_failover();
        });
    }
}

// Out of line: UploadMetrics is incomplete in the header.
// The owned exporter writes a final snapshot when destroyed.
BlobUploader::~BlobUploader() = default;

EncryptedUploadResult BlobUploader::upload_encrypted(const std::vector<uint8_t>& plaintext,
                                                     const std::string& mime,
                                                     ProgressObserver* observer) {
    EncryptedUploadResult out;
    out.mime = mime.empty() ? config_.mime_type : mime;
    out.plaintext_sha256 = crypto::sha256_hex(plaintext);

    std::vector<uint8_t> ciphertext;
    try {
        out.params = crypto::generate_params();
        ciphertext = crypto::encrypt(plaintext, out.params);
    } catch (const crypto::CryptoError& e) {
        log_error("[upload] encryption failed: %s", e.what());
        out.params = {};
        out.result = UploadResult::fail(UploadError::Crypto, e.what());
        if (metrics_) metrics_->record_upload(out.result);
        return out;
    }

    out.ciphertext_size = ciphertext.size();
    UploadPayload payload = UploadPayload::from(std::move(ciphertext), out.mime);
    out.ciphertext_sha256 = payload.sha256;

    out.result = upload_payload(payload, observer);
    return out;
}

UploadResult BlobUploader::upload(std::vector<uint8_t> data,
                                  const std::string& mime,
                                  ProgressObserver* observer) {
    UploadPayload payload =
        UploadPayload::from(std::move(data), mime.empty() ? config_.mime_type : mime);
    return upload_payload(payload, observer);
}

UploadResult BlobUploader::upload_payload(const UploadPayload& payload,
                                          ProgressObserver* observer) {
    std::optional<ScopedTimer> timer;
    if (metrics_) {
        timer.emplace(metrics_->upload_duration());
        metrics_->uploads_in_flight().Increment();
    }

    UploadResult result = failover_.run(
        config_.servers,
        [&](const std::string& server, uint32_t) {
            return upload_to_server(server, payload, observer);
        },
        observer, &cancelled_);

    if (metrics_) {
        metrics_->uploads_in_flight().Decrement();
        metrics_->record_upload(result);
    }

    if (result.success) {
        log_info("[upload] stored %llu bytes at %s after %u attempt(s)",
                 static_cast<unsigned long long>(payload.size()),
                 result.descriptor.url.c_str(), result.attempts);
    } else {
        log_error("[upload] %s: %s", upload_error_name(result.error),
                  result.error_message.c_str());
    }
    return result;
}

UploadResult BlobUploader::upload_to_server(const std::string& server,
                                            const UploadPayload& payload,
                                            ProgressObserver* observer) {
    UploadTarget target;
    target.protocol = config_.protocol;
    target.url = server;

    if (config_.protocol == UploadProtocol::Nip96) {
        ServerConfigResult discovered = server_configs_.get(server);
        if (!discovered.success) {
            return UploadResult::fail(UploadError::Protocol, discovered.error_message);
        }
        target.url = discovered.config.api_url;
    }

    std::optional<ScopedTimer> timer;
    if (metrics_) {
        timer.emplace(metrics_->attempt_duration());
    }

    UploadResult result = executor_.attempt(target, payload, observer);

    if (metrics_) {
        metrics_->record_attempt(result);
    }
    return result;
}

} // namespace blobup
