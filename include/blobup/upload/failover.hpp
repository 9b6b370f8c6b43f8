#pragma once

#include "blobup/upload/progress.hpp"
#include "blobup/upload/result.hpp"
#include "blobup/upload/retry_policy.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace blobup {

/// Tries servers in priority order until one accepts the blob.
///
/// Each server gets the full retry policy. Entries that are not valid
/// http/https URLs are skipped without retries. After a server fails the
/// observer is reset to 0% so the next server's progress starts clean.
class FailoverController {
public:
    using ServerUploadFn =
        std::function<UploadResult(const std::string& server, uint32_t attempt_index)>;
    using ServerFailedFn =
        std::function<void(const std::string& server, const UploadResult& result)>;

    explicit FailoverController(RetryPolicy policy = {});

    UploadResult run(const std::vector<std::string>& servers,
                     const ServerUploadFn& upload_fn,
                     ProgressObserver* observer,
                     const std::atomic<bool>* cancel = nullptr) const;

    // Called once per server that failed (invalid URL included)
    void on_server_failed(ServerFailedFn fn) { server_failed_ = std::move(fn); }

    const RetryPolicy& policy() const { return policy_; }

    // Empty if url is an absolute http(s) URL with a host, else the reason
    static std::string validate_server_url(const std::string& url);

private:
    RetryPolicy policy_;
    ServerFailedFn server_failed_;
};

} // namespace blobup
