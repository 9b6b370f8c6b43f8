#include "blobup/upload/chunk_stream.hpp"

#include <algorithm>
#include <cstring>
#include <random>

namespace blobup {

// ============================================================================
// ChunkedStream
// ============================================================================

ChunkedStream::ChunkedStream(std::shared_ptr<const std::vector<uint8_t>> data,
                             size_t chunk_size,
                             std::shared_ptr<ProgressCounter> counter,
                             size_t queue_capacity)
    : data_(std::move(data))
    , chunk_size_(chunk_size == 0 ? 1 : chunk_size)
    , counter_(std::move(counter))
    , queue_(queue_capacity) {
    producer_ = std::thread([this]() { produce(); });
}

ChunkedStream::~ChunkedStream() {
    close();
    if (producer_.joinable()) {
        producer_.join();
    }
}

void ChunkedStream::produce() {
    const size_t total = data_->size();
    for (size_t offset = 0; offset < total; offset += chunk_size_) {
        size_t len = std::min(chunk_size_, total - offset);
        std::vector<uint8_t> chunk(data_->begin() + offset, data_->begin() + offset + len);
        if (!queue_.push(std::move(chunk))) {
            // Consumer went away
            return;
        }
        std::lock_guard<std::mutex> lock(stats_mutex_);
        produced_++;
    }
    queue_.close();
}

size_t ChunkedStream::read(uint8_t* buffer, size_t max) {
    if (closed_.load(std::memory_order_acquire) || max == 0) {
        return 0;
    }

    if (current_pos_ >= current_.size()) {
        auto chunk = queue_.pop();
        if (!chunk || closed_.load(std::memory_order_acquire)) {
            return 0;
        }
        current_ = std::move(*chunk);
        current_pos_ = 0;
        if (counter_) {
            counter_->add(current_.size());
        }
        std::lock_guard<std::mutex> lock(stats_mutex_);
        delivered_++;
    }

    size_t n = std::min(max, current_.size() - current_pos_);
    std::memcpy(buffer, current_.data() + current_pos_, n);
    current_pos_ += n;
    return n;
}

void ChunkedStream::close() {
    closed_.store(true, std::memory_order_release);
    queue_.close();
}

size_t ChunkedStream::chunk_count() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return produced_;
}

size_t ChunkedStream::chunks_delivered() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return delivered_;
}

// ============================================================================
// MultipartBody
// ============================================================================

MultipartBody::MultipartBody(std::shared_ptr<net::BodySource> inner,
                             std::string boundary,
                             const std::string& field,
                             const std::string& filename,
                             const std::string& mime)
    : inner_(std::move(inner))
    , boundary_(std::move(boundary)) {
    preamble_ = "--" + boundary_ + "\r\n"
                "Content-Disposition: form-data; name=\"" + field +
                "\"; filename=\"" + filename + "\"\r\n"
                "Content-Type: " + (mime.empty() ? "application/octet-stream" : mime) +
                "\r\n\r\n";
    epilogue_ = "\r\n--" + boundary_ + "--\r\n";
}

uint64_t MultipartBody::size() const {
    return preamble_.size() + inner_->size() + epilogue_.size();
}

size_t MultipartBody::read(uint8_t* buffer, size_t max) {
    while (max > 0) {
        switch (section_) {
            case Section::Preamble: {
                size_t n = std::min(max, preamble_.size() - pos_);
                std::memcpy(buffer, preamble_.data() + pos_, n);
                pos_ += n;
                if (pos_ == preamble_.size()) {
                    section_ = Section::File;
                    pos_ = 0;
                }
                return n;
            }
            case Section::File: {
                if (file_read_ >= inner_->size()) {
                    section_ = Section::Epilogue;
                    continue;
                }
                size_t n = inner_->read(buffer, max);
                if (n == 0) {
                    // Inner body closed before it was exhausted
                    section_ = Section::Done;
                    return 0;
                }
                file_read_ += n;
                return n;
            }
            case Section::Epilogue: {
                size_t n = std::min(max, epilogue_.size() - pos_);
                std::memcpy(buffer, epilogue_.data() + pos_, n);
                pos_ += n;
                if (pos_ == epilogue_.size()) {
                    section_ = Section::Done;
                }
                return n;
            }
            case Section::Done:
                return 0;
        }
    }
    return 0;
}

void MultipartBody::close() {
    inner_->close();
}

std::string MultipartBody::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::string MultipartBody::generate_boundary() {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> dist(0, sizeof(alphabet) - 2);

    std::string boundary = "----blobup";
    for (int i = 0; i < 24; ++i) {
        boundary += alphabet[dist(rng)];
    }
    return boundary;
}

} // namespace blobup
