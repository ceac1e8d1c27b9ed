#pragma once

#include "ddsxfer/hash.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace ddsxfer {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

enum class RetryKind {
    CONNECTION,    // PUT to a signed URL hit a network error
    FORBIDDEN,     // signed chunk URL refused, re-issued
    EXPIRED_URL,   // signed download URL expired, refetched
    PARTIAL,       // range stream ended short
    TOO_LARGE,     // range stream ran past its end
};

const char* retry_kind_to_string(RetryKind kind);
std::optional<RetryKind> retry_kind_from_string(const std::string& name);

/// Transfer counters kept in a prometheus::Registry. With a file path set,
/// a writer thread serializes the registry to a .prom file (temp+rename)
/// every interval and once more on stop().
class TransferMetrics {
public:
    /// @param prom_file_path  Output file; empty keeps metrics in memory only.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    explicit TransferMetrics(const std::filesystem::path& prom_file_path = {},
                             std::chrono::seconds write_interval = std::chrono::seconds(15),
                             const std::map<std::string, std::string>& labels = {});
    ~TransferMetrics();

    TransferMetrics(const TransferMetrics&) = delete;
    TransferMetrics& operator=(const TransferMetrics&) = delete;

    void start();
    void stop();

    void record_retry(RetryKind kind);
    void record_file_status(HashStatus status);

    prometheus::Counter& chunks_sent() { return *chunks_sent_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& files_uploaded() { return *files_uploaded_; }
    prometheus::Counter& consistency_waits() { return *consistency_waits_; }

    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& download_duration() { return *download_duration_; }

    /// Text exposition of the current registry.
    std::string serialize() const;

private:
    void writer_loop();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Counter* chunks_sent_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* files_uploaded_;
    prometheus::Counter* consistency_waits_;
    std::map<RetryKind, prometheus::Counter*> retries_;
    std::map<HashStatus, prometheus::Counter*> files_downloaded_;

    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* download_duration_;

    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace ddsxfer
