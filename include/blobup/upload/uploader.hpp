#pragma once

#include "blobup/config.hpp"
#include "blobup/crypto/encryption.hpp"
#include "blobup/net/transport.hpp"
#include "blobup/upload/attempt.hpp"
#include "blobup/upload/authorization.hpp"
#include "blobup/upload/failover.hpp"
#include "blobup/upload/progress.hpp"
#include "blobup/upload/result.hpp"
#include "blobup/upload/server_config.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace blobup {

class UploadMetrics;

/// Outcome of encrypt-then-upload. params is the only copy of the key.
struct EncryptedUploadResult {
    UploadResult result;
    crypto::EncryptionParams params;
    std::string plaintext_sha256;
    std::string ciphertext_sha256;
    uint64_t ciphertext_size = 0;
    std::string mime;
};

/// Entry point of the upload engine.
///
/// Wires the attempt executor, retry policy and failover controller over
/// the configured servers. For file-storage (nip96) servers the upload
/// endpoint is discovered through the server config cache first.
class BlobUploader {
public:
    /// @param metrics may be null. When null and config.metrics_file is
    ///        set, the uploader runs its own exporter writing that file.
    BlobUploader(UploadConfig config,
                 net::Transport& transport,
                 EventSigner& signer,
                 UploadMetrics* metrics = nullptr);
    ~BlobUploader();

    BlobUploader(const BlobUploader&) = delete;
    BlobUploader& operator=(const BlobUploader&) = delete;

    /// Hash, encrypt with fresh params, and upload the ciphertext.
    /// @param mime  empty: config.mime_type
    EncryptedUploadResult upload_encrypted(const std::vector<uint8_t>& plaintext,
                                           const std::string& mime,
                                           ProgressObserver* observer);

    /// Upload an already prepared buffer as-is.
    UploadResult upload(std::vector<uint8_t> data,
                        const std::string& mime,
                        ProgressObserver* observer);

    /// Abort between attempts and servers. A transfer in flight finishes its
    /// current attempt first. Later uploads on this instance fail at once.
    void cancel() { cancelled_.store(true, std::memory_order_release); }

    const UploadConfig& config() const { return config_; }
    ServerConfigCache& server_configs() { return server_configs_; }

private:
    UploadResult upload_payload(const UploadPayload& payload, ProgressObserver* observer);
    UploadResult upload_to_server(const std::string& server,
                                  const UploadPayload& payload,
                                  ProgressObserver* observer);

    UploadConfig config_;
    std::unique_ptr<UploadMetrics> owned_metrics_;
    UploadMetrics* metrics_;
    AttemptExecutor executor_;
    FailoverController failover_;
    ServerConfigCache server_configs_;
    std::atomic<bool> cancelled_{false};
};

} // namespace blobup
