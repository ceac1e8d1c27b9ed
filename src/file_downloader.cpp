#include "ddsxfer/file_downloader.hpp"
#include "ddsxfer/consistency.hpp"
#include "ddsxfer/constants.hpp"
#include "ddsxfer/errors.hpp"
#include "ddsxfer/log.hpp"
#include "ddsxfer/transfer_messages.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

namespace ddsxfer {

namespace {

// Byte progress is batched into messages of at least this size.
constexpr uint64_t PROGRESS_REPORT_BYTES = 1024 * 1024;

// Read-write descriptor on an existing, pre-sized file. Never truncates.
class RangeFile {
public:
    explicit RangeFile(const std::string& path)
        : path_(path), fd_(::open(path.c_str(), O_RDWR)) {
        if (fd_ < 0) {
            throw std::runtime_error("Cannot open " + path + " for writing: " + std::string(strerror(errno)));
        }
    }

    ~RangeFile() { ::close(fd_); }

    RangeFile(const RangeFile&) = delete;
    RangeFile& operator=(const RangeFile&) = delete;

    void write_at(const uint8_t* data, size_t size, uint64_t offset) {
        while (size > 0) {
            ssize_t written = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
            if (written < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error("Write to " + path_ + " failed: " + std::string(strerror(errno)));
            }
            data += written;
            size -= static_cast<size_t>(written);
            offset += static_cast<uint64_t>(written);
        }
    }

private:
    std::string path_;
    int fd_;
};

struct RangeAttempt {
    DownloadState state = DownloadState::DOWNLOADING;
    int status_code = 0;
    uint64_t bytes_read = 0;
};

// One streaming GET of `range`. Bytes land at range.start + bytes read so far.
void download_range_once(DataServiceApi& data_service, const ExternalUrl& url, const std::string& path,
                         const ByteRange& range, const MessageSender& sender, RangeAttempt& attempt) {
    RangeFile file(path);
    const uint64_t expected = range.size();
    uint64_t unreported = 0;
    uint64_t too_large_bytes = 0;
    std::string write_error;

    auto report = [&]() {
        if (unreported > 0) {
            sender.send(messages::progress(0, static_cast<int64_t>(unreported)));
            unreported = 0;
        }
    };

    HttpBodySink sink = [&](const uint8_t* data, size_t size) {
        if (sender.stop_requested()) {
            return false;
        }
        if (attempt.bytes_read + size > expected) {
            // Stop now rather than reading the rest of an oversized body.
            too_large_bytes = attempt.bytes_read + size;
            return false;
        }
        try {
            file.write_at(data, size, range.start + attempt.bytes_read);
        } catch (const std::runtime_error& e) {
            write_error = e.what();
            return false;
        }
        attempt.bytes_read += size;
        unreported += size;
        if (unreported >= PROGRESS_REPORT_BYTES) {
            report();
        }
        return true;
    };

    HttpResponse response;
    try {
        response = data_service.receive_external(url.http_verb, url.host, url.url, url.http_headers,
                                                 std::make_pair(range.start, range.end), sink);
    } catch (const ConnectionError& e) {
        report();
        log_info("Connection error downloading %s bytes %lu-%lu: %s", path.c_str(),
                 static_cast<unsigned long>(range.start), static_cast<unsigned long>(range.end), e.what());
        if (attempt.bytes_read < expected) {
            throw PartialChunkDownloadError(attempt.bytes_read, expected, path);
        }
        attempt.state = DownloadState::GOOD;
        return;
    }
    report();
    attempt.status_code = response.status_code;
    throw_if_stopped(sender.stop_token());

    if (response.status_code == 200 && range.start > 0) {
        throw ExternalStoreError("External store ignored the Range header for " + path + " bytes " +
                                 std::to_string(range.start) + "-" + std::to_string(range.end) +
                                 " and sent the whole file", response.status_code);
    }
    if (!write_error.empty()) {
        throw std::runtime_error(write_error);
    }
    if (too_large_bytes > 0) {
        throw TooLargeChunkDownloadError(too_large_bytes, expected, path);
    }
    if (response.status_code == constants::SWIFT_EXPIRED_STATUS_CODE ||
        response.status_code == constants::S3_EXPIRED_STATUS_CODE) {
        attempt.state = DownloadState::EXPIRED_URL;
        return;
    }
    if (response.status_code != 200 && response.status_code != 206) {
        throw ExternalStoreError("Failed to download " + path + " from external store. Error:" +
                                 std::to_string(response.status_code), response.status_code);
    }
    if (attempt.bytes_read < expected) {
        throw PartialChunkDownloadError(attempt.bytes_read, expected, path);
    }
    attempt.state = DownloadState::GOOD;
}

// Undo the byte progress an abandoned attempt reported.
void revert_progress(const MessageSender& sender, uint64_t bytes_read) {
    sender.send(messages::progress(0, -static_cast<int64_t>(bytes_read)));
}

}  // namespace

const char* download_state_to_string(DownloadState state) {
    switch (state) {
        case DownloadState::NEW: return "NEW";
        case DownloadState::DOWNLOADING: return "DOWNLOADING";
        case DownloadState::GOOD: return "GOOD";
        case DownloadState::ALREADY_COMPLETE: return "ALREADY_COMPLETE";
        case DownloadState::EXPIRED_URL: return "EXPIRED_URL";
        case DownloadState::ERROR: return "ERROR";
    }
    return "ERROR";
}

DownloadState download_state_from_string(const std::string& name) {
    for (auto state : {DownloadState::NEW, DownloadState::DOWNLOADING, DownloadState::GOOD,
                       DownloadState::ALREADY_COMPLETE, DownloadState::EXPIRED_URL, DownloadState::ERROR}) {
        if (name == download_state_to_string(state)) return state;
    }
    throw std::invalid_argument("Unknown download state: " + name);
}

FileUrlSource data_service_url_source(DataServiceConnection connection, TransportFactory transport_factory) {
    return [connection = std::move(connection),
            factory = std::move(transport_factory)](const std::string& file_id) {
        DataServiceApi data_service(connection, factory);
        auto resp = retry_until_resource_is_consistent([&]() {
            return data_service.get_file_url(file_id);
        }, nullptr, connection.retry);
        return ExternalUrl::from_json(resp);
    };
}

// --- FileDownloader ---

FileDownloader::FileDownloader(const TransferConfig& config, TransportFactory transport_factory,
                               FileUrlSource url_source, Watcher* watcher, TransferMetrics* metrics)
    : config_(config)
    , transport_factory_(std::move(transport_factory))
    , url_source_(std::move(url_source))
    , watcher_(watcher)
    , metrics_(metrics) {}

std::vector<ByteRange> FileDownloader::ranges_for(uint64_t file_size) const {
    return byte_ranges(file_size, download_bytes_per_chunk(file_size, config_.download_workers,
                                                           config_.download_min_chunk_size));
}

DownloadOutcome FileDownloader::download(const RemoteFile& file, const std::filesystem::path& local_path) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->download_duration());

    auto ranges = ranges_for(file.size);

    std::error_code ec;
    if (std::filesystem::is_regular_file(local_path, ec) &&
        std::filesystem::file_size(local_path, ec) == file.size && !ec) {
        auto existing = FileHashStatus::determine_for_hashes(file.hashes, local_path);
        if (existing.has_a_valid_hash()) {
            log_info("%s is already downloaded", local_path.c_str());
            if (watcher_) watcher_->transferring_item(file.path, static_cast<int>(ranges.size()), 0);
            return {DownloadState::ALREADY_COMPLETE, existing};
        }
        log_debug("%s exists but does not match, downloading again", local_path.c_str());
    }

    if (watcher_) watcher_->transferring_item(file.path, 0, 0);
    create_sparse_file(local_path, file.size);
    if (!ranges.empty()) {
        download_ranges(file, local_path, ranges);
    }

    auto status = FileHashStatus::determine_for_hashes(file.hashes, local_path);
    if (!status.has_a_valid_hash()) {
        log_error("%s", status.status_line().c_str());
        return {DownloadState::ERROR, status};
    }
    return {DownloadState::GOOD, status};
}

void FileDownloader::create_sparse_file(const std::filesystem::path& local_path, uint64_t size) const {
    int fd = ::open(local_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        throw std::runtime_error("Cannot create " + local_path.string() + ": " + std::string(strerror(errno)));
    }
    if (size > 0) {
        // Writing the last byte sizes the file without allocating the rest.
        if (::lseek(fd, static_cast<off_t>(size - 1), SEEK_SET) < 0 || ::write(fd, "", 1) != 1) {
            std::string err = strerror(errno);
            ::close(fd);
            throw std::runtime_error("Cannot size " + local_path.string() + ": " + err);
        }
    }
    if (::close(fd) != 0) {
        throw std::runtime_error("Cannot close " + local_path.string() + ": " + std::string(strerror(errno)));
    }
}

void FileDownloader::download_ranges(const RemoteFile& file, const std::filesystem::path& local_path,
                                     const std::vector<ByteRange>& ranges) {
    auto connection = DataServiceConnection::from_config(config_);
    ExternalUrl url = file.url ? *file.url : url_source_(file.id);
    std::vector<ByteRange> pending = ranges;
    int url_refreshes = 0;

    while (true) {
        ExpiredRanges expired;
        TaskExecutor executor(config_.download_workers);
        TaskRunner runner(executor);
        for (const auto& range : pending) {
            runner.add(std::nullopt, std::make_shared<DownloadRangeCommand>(
                connection, transport_factory_, file.path, local_path, url, range, expired,
                watcher_, metrics_));
        }
        runner.run();

        if (expired.ranges.empty()) return;
        if (url_refreshes >= config_.retry.expired_url_retry_times) {
            throw ExternalStoreError("Download URL for " + file.path + " kept expiring after " +
                                     std::to_string(url_refreshes) + " refreshes. Error:" +
                                     std::to_string(expired.status_code), expired.status_code);
        }
        ++url_refreshes;
        log_info("Download URL for %s expired (%d), fetching a new one (%d/%d)", file.path.c_str(),
                 expired.status_code, url_refreshes, config_.retry.expired_url_retry_times);
        if (metrics_) metrics_->record_retry(RetryKind::EXPIRED_URL);
        url = url_source_(file.id);
        pending = std::move(expired.ranges);
    }
}

// --- DownloadRangeCommand ---

DownloadRangeCommand::DownloadRangeCommand(DataServiceConnection connection, TransportFactory transport_factory,
                                           std::string item, std::filesystem::path local_path, ExternalUrl url,
                                           ByteRange range, ExpiredRanges& expired,
                                           Watcher* watcher, TransferMetrics* metrics)
    : connection_(std::move(connection))
    , transport_factory_(std::move(transport_factory))
    , item_(std::move(item))
    , local_path_(std::move(local_path))
    , url_(std::move(url))
    , range_(range)
    , expired_(expired)
    , watcher_(watcher)
    , metrics_(metrics) {}

nlohmann::json DownloadRangeCommand::create_context() {
    return {
        {"connection", connection_.to_json()},
        {"url", url_.to_json()},
        {"path", local_path_.string()},
        {"range_start", range_.start},
        {"range_end", range_.end},
    };
}

TaskFunc DownloadRangeCommand::func() const {
    return [factory = transport_factory_](const nlohmann::json& context, const MessageSender& sender) {
        return download_range_run(context, sender, factory);
    };
}

void DownloadRangeCommand::after_run(const nlohmann::json& result) {
    auto state = download_state_from_string(result.at("state").get<std::string>());
    if (state == DownloadState::EXPIRED_URL) {
        expired_.ranges.push_back(range_);
        expired_.status_code = result.value("status_code", 0);
        return;
    }
    if (metrics_) metrics_->download_bytes_total().Increment(static_cast<double>(range_.size()));
}

void DownloadRangeCommand::on_message(const nlohmann::json& message) {
    messages::dispatch(message, item_, messages::Direction::DOWNLOAD, watcher_, metrics_);
}

nlohmann::json download_range_run(const nlohmann::json& context, const MessageSender& sender,
                                  const TransportFactory& transport_factory) {
    DataServiceApi data_service(DataServiceConnection::from_json(context.at("connection")), transport_factory);
    data_service.set_stop_token(sender.stop_token());
    const auto& retry = data_service.connection().retry;
    auto url = ExternalUrl::from_json(context.at("url"));
    auto path = context.at("path").get<std::string>();
    ByteRange range{context.at("range_start").get<uint64_t>(), context.at("range_end").get<uint64_t>()};

    int retry_times = 0;
    while (true) {
        RangeAttempt attempt;
        RetryKind retry_kind = RetryKind::PARTIAL;
        std::string error_text;
        try {
            download_range_once(data_service, url, path, range, sender, attempt);
            if (attempt.state == DownloadState::EXPIRED_URL) {
                return {{"state", download_state_to_string(attempt.state)}, {"status_code", attempt.status_code}};
            }
            sender.send(messages::progress(1, 0));
            return {{"state", download_state_to_string(attempt.state)}, {"bytes", attempt.bytes_read}};
        } catch (const TooLargeChunkDownloadError& e) {
            if (retry_times >= retry.fetch_external_retry_times) throw;
            retry_kind = RetryKind::TOO_LARGE;
            error_text = e.what();
        } catch (const PartialChunkDownloadError& e) {
            if (retry_times >= retry.fetch_external_retry_times) throw;
            retry_kind = RetryKind::PARTIAL;
            error_text = e.what();
        }
        ++retry_times;
        revert_progress(sender, attempt.bytes_read);
        sender.send(messages::retry(retry_kind));
        log_info("%s, retrying in %d seconds (%d/%d)", error_text.c_str(), retry.fetch_external_retry_seconds,
                 retry_times, retry.fetch_external_retry_times);
        sleep_unless_stopped(std::chrono::seconds(retry.fetch_external_retry_seconds), sender.stop_token());
        data_service.recreate_session();
    }
}

}  // namespace ddsxfer
