#include "blobup/metrics.hpp"
#include "blobup/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace blobup {

UploadMetrics::UploadMetrics(const std::filesystem::path& prom_file_path,
                             std::chrono::seconds write_interval,
                             const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& uploads_family = prometheus::BuildCounter()
        .Name("blobup_uploads_total")
        .Help("Total uploads finished, after retries and failover")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    attempts_family_ = &prometheus::BuildCounter()
        .Name("blobup_attempts_total")
        .Help("Total transfer attempts by outcome")
        .Labels(labels)
        .Register(*registry_);

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("blobup_upload_bytes_total")
        .Help("Total bytes handed to the transport")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    stalls_total_ = &prometheus::BuildCounter()
        .Name("blobup_stalls_total")
        .Help("Total attempts aborted by stall detection")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    failovers_total_ = &prometheus::BuildCounter()
        .Name("blobup_failovers_total")
        .Help("Total servers given up on")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    uploads_in_flight_ = &prometheus::BuildGauge()
        .Name("blobup_uploads_in_flight")
        .Help("Uploads currently running")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("blobup_upload_duration_seconds")
        .Help("Upload duration in seconds, across all attempts and servers")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600});

    attempt_duration_ = &prometheus::BuildHistogram()
        .Name("blobup_attempt_duration_seconds")
        .Help("Single transfer attempt duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});

    // Pre-create the success series so it shows up before the first upload
    attempts(UploadError::None);
}

UploadMetrics::~UploadMetrics() {
    stop();
}

prometheus::Counter& UploadMetrics::attempts(UploadError error) {
    const char* result = error == UploadError::None ? "success" : upload_error_name(error);
    return attempts_family_->Add({{"result", result}});
}

void UploadMetrics::record_attempt(const UploadResult& result) {
    attempts(result.success ? UploadError::None : result.error).Increment();
    upload_bytes_total_->Increment(static_cast<double>(result.bytes_sent));
    if (result.error == UploadError::Stall) {
        stalls_total_->Increment();
    }
}

void UploadMetrics::record_upload(const UploadResult& result) {
    if (result.success) {
        uploads_success_->Increment();
    } else {
        uploads_failure_->Increment();
    }
}

std::string UploadMetrics::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void UploadMetrics::start() {
    if (prom_file_path_.empty()) return;
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&UploadMetrics::writer_loop, this);
}

void UploadMetrics::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    if (!prom_file_path_.empty()) {
        write_file();
    }
}

void UploadMetrics::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

void UploadMetrics::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_error("[metrics] cannot open %s", tmp_path.c_str());
        return;
    }
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) {
        log_error("[metrics] write failed: %s", tmp_path.c_str());
        return;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_error("[metrics] rename to %s failed: %s", prom_file_path_.c_str(),
                  ec.message().c_str());
    }
}

}  // namespace blobup
