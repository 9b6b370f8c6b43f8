#pragma once

#include "blobup/upload/result.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace blobup {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        double secs = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Upload engine metrics.
///
/// Owns a prometheus::Registry with every metric family. With a non-empty
/// file path, start() launches a writer thread that periodically serializes
/// the registry to a .prom file (temp + rename) for the node_exporter
/// textfile collector.
class UploadMetrics {
public:
    /// @param prom_file_path  .prom output file, empty to keep metrics in memory
    /// @param write_interval  How often to write the file
    /// @param labels          Constant labels applied to all metrics
    explicit UploadMetrics(const std::filesystem::path& prom_file_path = {},
                           std::chrono::seconds write_interval = std::chrono::seconds(15),
                           const std::map<std::string, std::string>& labels = {});
    ~UploadMetrics();

    UploadMetrics(const UploadMetrics&) = delete;
    UploadMetrics& operator=(const UploadMetrics&) = delete;

    /// Start the background writer thread (no-op without a file path).
    void start();

    /// Stop the writer thread and write one final snapshot.
    void stop();

    // One finished transfer (success or failure)
    void record_attempt(const UploadResult& result);

    // One finished failover run
    void record_upload(const UploadResult& result);

    // A server was given up on
    void record_failover() { failovers_total_->Increment(); }

    // Text exposition of the whole registry
    std::string serialize() const;

    // --- Counter accessors ---
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& attempts(UploadError error);
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& stalls_total() { return *stalls_total_; }
    prometheus::Counter& failovers_total() { return *failovers_total_; }

    // --- Gauge accessors ---
    prometheus::Gauge& uploads_in_flight() { return *uploads_in_flight_; }

    // --- Histogram accessors ---
    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& attempt_duration() { return *attempt_duration_; }

private:
    void writer_loop();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Family<prometheus::Counter>* attempts_family_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* stalls_total_;
    prometheus::Counter* failovers_total_;

    // --- Gauges ---
    prometheus::Gauge* uploads_in_flight_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* attempt_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace blobup
