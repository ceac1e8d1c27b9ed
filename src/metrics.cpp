#include "ddsxfer/metrics.hpp"
#include "ddsxfer/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace ddsxfer {

const char* retry_kind_to_string(RetryKind kind) {
    switch (kind) {
        case RetryKind::CONNECTION: return "connection";
        case RetryKind::FORBIDDEN: return "forbidden";
        case RetryKind::EXPIRED_URL: return "expired_url";
        case RetryKind::PARTIAL: return "partial";
        case RetryKind::TOO_LARGE: return "too_large";
    }
    return "connection";
}

std::optional<RetryKind> retry_kind_from_string(const std::string& name) {
    for (auto kind : {RetryKind::CONNECTION, RetryKind::FORBIDDEN, RetryKind::EXPIRED_URL,
                      RetryKind::PARTIAL, RetryKind::TOO_LARGE}) {
        if (name == retry_kind_to_string(kind)) return kind;
    }
    return std::nullopt;
}

TransferMetrics::TransferMetrics(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    auto counter_reg = [&](const std::string& name, const std::string& help) -> prometheus::Counter& {
        return prometheus::BuildCounter()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    chunks_sent_ = &counter_reg("ddsxfer_chunks_sent_total", "Upload chunks acknowledged by the store");
    upload_bytes_total_ = &counter_reg("ddsxfer_upload_bytes_total", "Total bytes uploaded");
    download_bytes_total_ = &counter_reg("ddsxfer_download_bytes_total", "Total bytes downloaded");
    files_uploaded_ = &counter_reg("ddsxfer_files_uploaded_total", "Files created or versioned");
    consistency_waits_ = &counter_reg("ddsxfer_consistency_waits_total",
                                      "Runs of retries waiting for the service to converge");

    auto& retry_family = prometheus::BuildCounter()
        .Name("ddsxfer_retries_total")
        .Help("Transfer retries by cause")
        .Labels(labels)
        .Register(*registry_);
    for (auto kind : {RetryKind::CONNECTION, RetryKind::FORBIDDEN, RetryKind::EXPIRED_URL,
                      RetryKind::PARTIAL, RetryKind::TOO_LARGE}) {
        retries_[kind] = &retry_family.Add({{"kind", retry_kind_to_string(kind)}});
    }

    auto& files_family = prometheus::BuildCounter()
        .Name("ddsxfer_files_downloaded_total")
        .Help("Downloaded files by hash status")
        .Labels(labels)
        .Register(*registry_);
    files_downloaded_[HashStatus::OK] = &files_family.Add({{"status", "ok"}});
    files_downloaded_[HashStatus::WARNING] = &files_family.Add({{"status", "warning"}});
    files_downloaded_[HashStatus::FAILED] = &files_family.Add({{"status", "failed"}});

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("ddsxfer_upload_duration_seconds")
        .Help("Per-file upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 5, 10, 30, 60, 300, 900, 3600});

    download_duration_ = &prometheus::BuildHistogram()
        .Name("ddsxfer_download_duration_seconds")
        .Help("Per-file download duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 5, 10, 30, 60, 300, 900, 3600});
}

TransferMetrics::~TransferMetrics() {
    stop();
}

void TransferMetrics::record_retry(RetryKind kind) {
    retries_.at(kind)->Increment();
}

void TransferMetrics::record_file_status(HashStatus status) {
    files_downloaded_.at(status)->Increment();
}

void TransferMetrics::start() {
    if (prom_file_path_.empty()) return;
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&TransferMetrics::writer_loop, this);
}

void TransferMetrics::stop() {
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

void TransferMetrics::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

std::string TransferMetrics::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void TransferMetrics::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_error("cannot write metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) {
        log_error("failed writing metrics file %s", tmp_path.c_str());
        return;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_error("rename %s: %s", tmp_path.c_str(), ec.message().c_str());
    }
}

}  // namespace ddsxfer
