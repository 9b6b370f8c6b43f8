#pragma once

#include "blobup/net/http.hpp"
#include "blobup/upload/progress.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace blobup {

// Capacity-limited blocking queue between one producer and one consumer.
// close() is the termination signal for both sides.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    // Blocks while full. False once the queue is closed; the item is dropped.
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return items_.size() < capacity_ || closed_; });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Blocks while empty. nullopt when closed and drained.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_ = false;
};

// Request body that slices a shared buffer into chunks on a producer thread
// and feeds them to the transport through a bounded queue. Every chunk the
// transport pulls is added to the attempt's progress counter.
class ChunkedStream : public net::BodySource {
public:
    ChunkedStream(std::shared_ptr<const std::vector<uint8_t>> data,
                  size_t chunk_size,
                  std::shared_ptr<ProgressCounter> counter,
                  size_t queue_capacity = 8);
    ~ChunkedStream() override;

    ChunkedStream(const ChunkedStream&) = delete;
    ChunkedStream& operator=(const ChunkedStream&) = delete;

    uint64_t size() const override { return data_->size(); }
    size_t read(uint8_t* buffer, size_t max) override;
    void close() override;

    // Chunks the producer has queued so far
    size_t chunk_count() const;

    // Chunks handed to the transport so far
    size_t chunks_delivered() const;

    size_t chunk_size() const { return chunk_size_; }

private:
    void produce();

    std::shared_ptr<const std::vector<uint8_t>> data_;
    size_t chunk_size_;
    std::shared_ptr<ProgressCounter> counter_;
    BoundedQueue<std::vector<uint8_t>> queue_;

    // Consumer side (transport thread only)
    std::vector<uint8_t> current_;
    size_t current_pos_ = 0;
    std::atomic<bool> closed_{false};

    mutable std::mutex stats_mutex_;
    size_t produced_ = 0;
    size_t delivered_ = 0;

    std::thread producer_;
};

// multipart/form-data framing around a file body.
// Only the file bytes move the progress counter.
class MultipartBody : public net::BodySource {
public:
    MultipartBody(std::shared_ptr<net::BodySource> inner,
                  std::string boundary,
                  const std::string& field,
                  const std::string& filename,
                  const std::string& mime);

    uint64_t size() const override;
    size_t read(uint8_t* buffer, size_t max) override;
    void close() override;

    // Value for the request's Content-Type header
    std::string content_type() const;

    const std::string& boundary() const { return boundary_; }

    // Random boundary token
    static std::string generate_boundary();

private:
    enum class Section { Preamble, File, Epilogue, Done };

    std::shared_ptr<net::BodySource> inner_;
    std::string boundary_;
    std::string preamble_;
    std::string epilogue_;
    Section section_ = Section::Preamble;
    size_t pos_ = 0;         // offset within preamble or epilogue
    uint64_t file_read_ = 0;
};

} // namespace blobup
