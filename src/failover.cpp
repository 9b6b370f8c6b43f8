#include "blobup/upload/failover.hpp"
#include "blobup/log.hpp"
#include "blobup/net/http.hpp"

namespace blobup {

FailoverController::FailoverController(RetryPolicy policy)
    : policy_(policy) {}

std::string FailoverController::validate_server_url(const std::string& url) {
    auto parsed = net::ParsedUrl::parse(url);
    if (!parsed) {
        return "Invalid server URL: " + url;
    }
    if (parsed->scheme != "http" && parsed->scheme != "https") {
        return "Invalid server URL: unsupported scheme '" + parsed->scheme + "'";
    }
    if (parsed->host.empty()) {
        return "Invalid server URL: missing host";
    }
    return "";
}

UploadResult FailoverController::run(const std::vector<std::string>& servers,
                                     const ServerUploadFn& upload_fn,
                                     ProgressObserver* observer,
                                     const std::atomic<bool>* cancel) const {
    if (servers.empty()) {
        return UploadResult::fail(UploadError::Validation, "No servers available");
    }

    UploadResult last = UploadResult::fail(UploadError::Validation, "No servers available");
    uint32_t total_attempts = 0;

    for (size_t index = 0; index < servers.size(); ++index) {
        const std::string& server = servers[index];

        if (cancel && cancel->load(std::memory_order_acquire)) {
            last = UploadResult::fail(UploadError::CallbackAbort, "Upload cancelled");
            break;
        }

        std::string invalid = validate_server_url(server);
        if (!invalid.empty()) {
            log_error("[failover] %s", invalid.c_str());
            last = UploadResult::fail(UploadError::Validation, invalid);
            if (server_failed_) server_failed_(server, last);
            continue;
        }

        log_info("[failover] Attempting upload to server %zu of %zu: %s",
                 index + 1, servers.size(), server.c_str());

        UploadResult result = policy_.run(
            [&](uint32_t attempt_index) { return upload_fn(server, attempt_index); },
            cancel);
        total_attempts += result.attempts;

        if (result.success) {
            log_info("[failover] Upload successful to: %s", server.c_str());
            result.attempts = total_attempts;
            return result;
        }

        log_error("[failover] Upload failed to %s: %s", server.c_str(),
                  result.error_message.c_str());
        last = std::move(result);
        if (server_failed_) server_failed_(server, last);

        // Next server starts from zero. A failing observer is ignored here.
        if (observer) {
            observer->report(0, 0);
        }
    }

    last.attempts = total_attempts;
    last.error_message = "All servers failed. Last error: " + last.error_message;
    return last;
}

} // namespace blobup
