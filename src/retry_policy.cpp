#include "blobup/upload/retry_policy.hpp"
#include "blobup/log.hpp"

#include <algorithm>
#include <thread>

namespace blobup {

namespace {

// Sleep in short slices so a cancel flag is honoured promptly.
// Returns false if cancelled.
bool interruptible_sleep(std::chrono::milliseconds duration, const std::atomic<bool>* cancel) {
    constexpr auto slice = std::chrono::milliseconds(50);
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cancel && cancel->load(std::memory_order_acquire)) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(slice, remaining));
    }
    return !(cancel && cancel->load(std::memory_order_acquire));
}

} // namespace

UploadResult RetryPolicy::run(const AttemptFn& fn, const std::atomic<bool>* cancel) const {
    UploadResult last = UploadResult::fail(UploadError::Transport, "No upload attempts were made");
    uint32_t attempts = 0;

    // 64-bit counter: retry_count + 1 must not wrap
    for (uint64_t attempt = 0; attempt <= uint64_t{retry_count}; ++attempt) {
        if (attempt > 0) {
            if (!interruptible_sleep(retry_spacing, cancel)) {
                break;
            }
            log_debug("[retry] attempt %llu of %llu", static_cast<unsigned long long>(attempt + 1),
                      static_cast<unsigned long long>(retry_count) + 1);
        }

        UploadResult result = fn(static_cast<uint32_t>(attempt));
        attempts++;
        result.attempts = attempts;
        if (result.success) {
            return result;
        }

        log_warn("[retry] attempt %llu failed (%s): %s",
                 static_cast<unsigned long long>(attempt + 1),
                 upload_error_name(result.error), result.error_message.c_str());
        last = std::move(result);
    }

    last.attempts = attempts;
    return last;
}

} // namespace blobup
