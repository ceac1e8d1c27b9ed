#include "ddsxfer/project_downloader.hpp"
#include "ddsxfer/errors.hpp"
#include "ddsxfer/log.hpp"

#include <stdexcept>

namespace ddsxfer {

namespace {

FileUrlSource or_data_service(FileUrlSource url_source, const TransferConfig& config,
                              const TransportFactory& transport_factory) {
    if (url_source) return url_source;
    return data_service_url_source(DataServiceConnection::from_config(config), transport_factory);
}

}  // namespace

ProjectDownloader::ProjectDownloader(const TransferConfig& config, TransportFactory transport_factory,
                                     Watcher* watcher, TransferMetrics* metrics, FileUrlSource url_source)
    : config_(config)
    , downloader_(config, transport_factory,
                  or_data_service(std::move(url_source), config, transport_factory), watcher, metrics)
    , metrics_(metrics) {}

uint64_t ProjectDownloader::count_ranges(const std::vector<RemoteFile>& files) const {
    uint64_t total = 0;
    for (const auto& file : files) {
        total += downloader_.ranges_for(file.size).size();
    }
    return total;
}

std::filesystem::path ProjectDownloader::local_path_for(const std::filesystem::path& dest_dir,
                                                       const std::string& remote_path) {
    std::filesystem::path relative(remote_path);
    if (relative.empty() || relative.has_root_path()) {
        throw std::invalid_argument("Remote path is not relative: " + remote_path);
    }
    auto normal = relative.lexically_normal();
    if (normal == "." || *normal.begin() == "..") {
        throw std::invalid_argument("Remote path leaves the destination directory: " + remote_path);
    }
    return dest_dir / normal;
}

std::vector<FileHashStatus> ProjectDownloader::run(const std::filesystem::path& dest_dir,
                                                   const std::vector<RemoteFile>& files) {
    log_debug("downloading %zu files into %s with %zu workers", files.size(), dest_dir.c_str(),
              config_.download_workers);

    std::vector<std::filesystem::path> local_paths;
    local_paths.reserve(files.size());
    for (const auto& file : files) {
        local_paths.push_back(local_path_for(dest_dir, file.path));
    }

    std::vector<FileHashStatus> statuses;
    statuses.reserve(files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        const auto& file = files[i];
        const auto& local_path = local_paths[i];
        std::filesystem::create_directories(local_path.parent_path());
        auto outcome = downloader_.download(file, local_path);
        log_debug("%s: %s", file.path.c_str(), download_state_to_string(outcome.state));
        if (metrics_) metrics_->record_file_status(outcome.hash_status.status());
        statuses.push_back(outcome.hash_status);
    }

    size_t invalid = 0;
    log_info("File status:");
    for (const auto& status : statuses) {
        log_info("  %s", status.status_line().c_str());
        if (!status.has_a_valid_hash()) ++invalid;
    }
    if (invalid > 0) {
        throw HashValidationError("Hash validation failed for " + std::to_string(invalid) + " of " +
                                  std::to_string(statuses.size()) + " downloaded files");
    }
    return statuses;
}

}  // namespace ddsxfer
