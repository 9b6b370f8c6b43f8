#pragma once

#include <cstdint>
#include <mutex>

namespace blobup {

// Receives upload progress. report() returning false aborts the transfer.
// Called from the thread driving the upload, never concurrently.
class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;
    virtual bool report(uint32_t percentage, uint64_t bytes_sent) = 0;
};

// floor(bytes * 100 / total), 0 when total is 0
inline uint32_t progress_percentage(uint64_t bytes_sent, uint64_t total) {
    if (total == 0) return 0;
    if (bytes_sent >= total) return 100;
    return static_cast<uint32_t>(bytes_sent * 100 / total);
}

// Bytes handed to the transport during one attempt.
// One writer (the chunk consumer), any number of readers.
class ProgressCounter {
public:
    void add(uint64_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        bytes_ += n;
    }

    uint64_t get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return bytes_;
    }

private:
    mutable std::mutex mutex_;
    uint64_t bytes_ = 0;
};

} // namespace blobup
