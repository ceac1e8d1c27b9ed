#pragma once

#include "ddsxfer/data_service.hpp"
#include "ddsxfer/local_file.hpp"
#include "ddsxfer/metrics.hpp"
#include "ddsxfer/parallel.hpp"
#include "ddsxfer/transfer_config.hpp"
#include "ddsxfer/watcher.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ddsxfer {

/// The upload protocol, one step per method:
/// create upload, create a chunk URL, send the chunk, complete the upload
/// and create or version the file.
/// Calls that follow a causally prior write wait out consistency lag.
class FileUploadOperations {
public:
    FileUploadOperations(DataServiceApi& data_service, Watcher* waiting_monitor);

    /// Returns the upload id.
    std::string create_upload(const std::string& project_id, const PathData& path_data,
                              const HashData& hash_data);

    /// `chunk_num` is 0-based; the service numbers chunks from 1.
    ExternalUrl create_file_chunk_url(const std::string& upload_id, uint64_t chunk_num,
                                      const std::vector<uint8_t>& chunk);

    void send_file_external(const ExternalUrl& url, const std::vector<uint8_t>& chunk);

    /// Create a URL and send the chunk. A 403 on the one-time URL gets a fresh
    /// URL and another try, up to send_external_forbidden_retry_times attempts.
    void send_chunk(const std::string& upload_id, uint64_t chunk_num, const std::vector<uint8_t>& chunk);

    /// Complete the upload, then create a new file under `parent` or a new
    /// version of `remote_file_id`. Returns the file id.
    std::string finish_upload(const std::string& upload_id, const HashData& hash_data,
                              const ParentRef& parent, const std::optional<std::string>& remote_file_id);

private:
    DataServiceApi& data_service_;
    Watcher* waiting_monitor_;
};

/// Uploads one file in chunks spread across upload_workers threads.
class FileUploader {
public:
    FileUploader(const TransferConfig& config, TransportFactory transport_factory,
                 Watcher* watcher, TransferMetrics* metrics = nullptr);

    /// Returns the id of the created or updated remote file.
    std::string upload(const std::string& project_id, const UploadItem& item);

private:
    const TransferConfig& config_;
    TransportFactory transport_factory_;
    Watcher* watcher_;
    TransferMetrics* metrics_;
};

/// Sends every chunk of an existing upload, one task per work parcel.
class ParallelChunkProcessor {
public:
    ParallelChunkProcessor(const TransferConfig& config, TransportFactory transport_factory,
                           std::string upload_id, PathData path_data,
                           Watcher* watcher, TransferMetrics* metrics);

    void run();

private:
    const TransferConfig& config_;
    TransportFactory transport_factory_;
    std::string upload_id_;
    PathData path_data_;
    Watcher* watcher_;
    TransferMetrics* metrics_;
};

/// Background work for one parcel: chunks [index, index + num_chunks).
class SendChunksCommand : public TaskCommand {
public:
    SendChunksCommand(DataServiceConnection connection, TransportFactory transport_factory,
                      std::string upload_id, std::string path, uint64_t chunk_size,
                      uint64_t index, uint64_t num_chunks,
                      Watcher* watcher, TransferMetrics* metrics);

    nlohmann::json create_context() override;
    TaskFunc func() const override;
    void on_message(const nlohmann::json& message) override;

private:
    DataServiceConnection connection_;
    TransportFactory transport_factory_;
    std::string upload_id_;
    std::string path_;
    uint64_t chunk_size_;
    uint64_t index_;
    uint64_t num_chunks_;
    Watcher* watcher_;
    TransferMetrics* metrics_;
};

/// Worker body of SendChunksCommand, callable without an executor.
nlohmann::json send_chunks_run(const nlohmann::json& context, const MessageSender& sender,
                               const TransportFactory& transport_factory);

}  // namespace ddsxfer
