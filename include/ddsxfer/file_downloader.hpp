#pragma once

#include "ddsxfer/chunking.hpp"
#include "ddsxfer/data_service.hpp"
#include "ddsxfer/hash.hpp"
#include "ddsxfer/metrics.hpp"
#include "ddsxfer/parallel.hpp"
#include "ddsxfer/transfer_config.hpp"
#include "ddsxfer/watcher.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ddsxfer {

enum class DownloadState {
    NEW,
    DOWNLOADING,
    GOOD,
    ALREADY_COMPLETE,
    EXPIRED_URL,  // signed URL rejected; refetch and rerun the range
    ERROR,
};

const char* download_state_to_string(DownloadState state);
DownloadState download_state_from_string(const std::string& name);

/// A remote file selected for download.
struct RemoteFile {
    std::string id;
    std::string path;  // relative to the destination directory
    uint64_t size = 0;
    std::vector<HashData> hashes;
    // Signed URL when the listing already carried one.
    std::optional<ExternalUrl> url;
};

/// Issues a fresh signed download URL for a file id.
using FileUrlSource = std::function<ExternalUrl(const std::string& file_id)>;

/// FileUrlSource backed by GET /files/{id}/url.
FileUrlSource data_service_url_source(DataServiceConnection connection, TransportFactory transport_factory);

struct DownloadOutcome {
    DownloadState state;
    FileHashStatus hash_status;
};

/// Downloads one file as disjoint byte ranges written in place by
/// concurrent range tasks, then checks it against the server's hashes.
class FileDownloader {
public:
    FileDownloader(const TransferConfig& config, TransportFactory transport_factory,
                   FileUrlSource url_source, Watcher* watcher, TransferMetrics* metrics = nullptr);

    /// Skips the transfer (ALREADY_COMPLETE) when `local_path` already holds
    /// content that validates. Otherwise the state is GOOD or ERROR
    /// depending on the hash check.
    DownloadOutcome download(const RemoteFile& file, const std::filesystem::path& local_path);

    /// Ranges the file is split into with this downloader's settings.
    std::vector<ByteRange> ranges_for(uint64_t file_size) const;

private:
    void create_sparse_file(const std::filesystem::path& local_path, uint64_t size) const;
    void download_ranges(const RemoteFile& file, const std::filesystem::path& local_path,
                         const std::vector<ByteRange>& ranges);

    const TransferConfig& config_;
    TransportFactory transport_factory_;
    FileUrlSource url_source_;
    Watcher* watcher_;
    TransferMetrics* metrics_;
};

/// Ranges whose signed URL expired during a round, with the status seen.
struct ExpiredRanges {
    std::vector<ByteRange> ranges;
    int status_code = 0;
};

/// Background work for one byte range of one file.
class DownloadRangeCommand : public TaskCommand {
public:
    DownloadRangeCommand(DataServiceConnection connection, TransportFactory transport_factory,
                         std::string item, std::filesystem::path local_path, ExternalUrl url,
                         ByteRange range, ExpiredRanges& expired,
                         Watcher* watcher, TransferMetrics* metrics);

    nlohmann::json create_context() override;
    TaskFunc func() const override;
    void after_run(const nlohmann::json& result) override;
    void on_message(const nlohmann::json& message) override;

private:
    DataServiceConnection connection_;
    TransportFactory transport_factory_;
    std::string item_;
    std::filesystem::path local_path_;
    ExternalUrl url_;
    ByteRange range_;
    ExpiredRanges& expired_;
    Watcher* watcher_;
    TransferMetrics* metrics_;
};

/// Worker body of DownloadRangeCommand.
/// Streams the range into the pre-sized file, retrying short and oversized
/// responses up to fetch_external_retry_times and rolling back reported
/// progress on each retry. Result: {"state": "GOOD" | "EXPIRED_URL", ...}.
nlohmann::json download_range_run(const nlohmann::json& context, const MessageSender& sender,
                                  const TransportFactory& transport_factory);

}  // namespace ddsxfer
