#pragma once

#include "blobup/core/constants.hpp"
#include "blobup/upload/result.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace blobup {

// Bounded retries with fixed spacing for one server
struct RetryPolicy {
    uint32_t retry_count = constants::DEFAULT_RETRY_COUNT;
    std::chrono::milliseconds retry_spacing{constants::DEFAULT_RETRY_SPACING_MS};

    using AttemptFn = std::function<UploadResult(uint32_t attempt_index)>;

    // Calls fn up to retry_count + 1 times, sleeping retry_spacing between
    // calls. Returns the first success, or the last failure with attempts
    // set. A set cancel flag ends the wait and returns the last failure.
    UploadResult run(const AttemptFn& fn,
                     const std::atomic<bool>* cancel = nullptr) const;
};

} // namespace blobup
