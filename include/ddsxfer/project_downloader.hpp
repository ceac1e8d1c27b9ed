#pragma once

#include "ddsxfer/file_downloader.hpp"
#include "ddsxfer/hash.hpp"
#include "ddsxfer/metrics.hpp"
#include "ddsxfer/transfer_config.hpp"
#include "ddsxfer/watcher.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ddsxfer {

/// Downloads a list of remote files under a destination directory.
///
/// Every file is attempted even when an earlier one fails its hash check.
/// The per-file status table is logged at the end, then HashValidationError
/// is thrown if any file lacks a valid hash. Remote paths that would land
/// outside the destination directory are rejected before any transfer starts.
class ProjectDownloader {
public:
    /// An empty `url_source` fetches URLs from the data service.
    ProjectDownloader(const TransferConfig& config, TransportFactory transport_factory,
                      Watcher* watcher, TransferMetrics* metrics = nullptr,
                      FileUrlSource url_source = {});

    std::vector<FileHashStatus> run(const std::filesystem::path& dest_dir, const std::vector<RemoteFile>& files);

    /// Progress units for `files`: one per byte range.
    uint64_t count_ranges(const std::vector<RemoteFile>& files) const;

    /// `dest_dir / remote_path`, after checking that `remote_path` is relative
    /// and stays inside `dest_dir`. Throws std::invalid_argument otherwise.
    static std::filesystem::path local_path_for(const std::filesystem::path& dest_dir,
                                                const std::string& remote_path);

private:
    const TransferConfig& config_;
    FileDownloader downloader_;
    TransferMetrics* metrics_;
};

}  // namespace ddsxfer
