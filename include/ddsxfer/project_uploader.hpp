#pragma once

#include "ddsxfer/data_service.hpp"
#include "ddsxfer/local_file.hpp"
#include "ddsxfer/metrics.hpp"
#include "ddsxfer/parallel.hpp"
#include "ddsxfer/transfer_config.hpp"
#include "ddsxfer/watcher.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ddsxfer {

/// Uploads a batch of local files into one project.
///
/// Files that fit in a single chunk go through the task graph as a chain of
/// three tasks (create upload -> send chunk -> complete), all chains running
/// side by side. Larger files follow one at a time, each split across the
/// upload workers by FileUploader. The first failure stops the run.
class ProjectUploader {
public:
    ProjectUploader(const TransferConfig& config, TransportFactory transport_factory,
                    Watcher* watcher, TransferMetrics* metrics = nullptr);

    /// Returns local path -> remote file id.
    std::map<std::string, std::string> run(const std::string& project_id, const std::vector<UploadItem>& items);

    /// Progress units for `items`: one per chunk.
    static uint64_t count_chunks(const std::vector<UploadItem>& items, uint64_t upload_bytes_per_chunk);

private:
    void upload_small_files(const std::string& project_id, const std::vector<const UploadItem*>& items,
                            std::map<std::string, std::string>& file_ids);
    void upload_large_files(const std::string& project_id, const std::vector<const UploadItem*>& items,
                            std::map<std::string, std::string>& file_ids);

    const TransferConfig& config_;
    TransportFactory transport_factory_;
    Watcher* watcher_;
    TransferMetrics* metrics_;
};

/// Root of a small-file chain. Hashes the file and creates its upload.
/// Result: {"upload_id": ..., "hash": {"algorithm": ..., "value": ...}}.
class CreateUploadCommand : public TaskCommand {
public:
    CreateUploadCommand(DataServiceConnection connection, TransportFactory transport_factory,
                        std::string project_id, std::string path,
                        Watcher* watcher, TransferMetrics* metrics);

    void before_run(const nlohmann::json& parent_task_result) override;
    nlohmann::json create_context() override;
    TaskFunc func() const override;
    void on_message(const nlohmann::json& message) override;

private:
    DataServiceConnection connection_;
    TransportFactory transport_factory_;
    std::string project_id_;
    std::string path_;
    Watcher* watcher_;
    TransferMetrics* metrics_;
};

/// Sends the whole file as chunk 1 of the upload its parent created.
/// Passes the parent result through.
class SendChunkCommand : public TaskCommand {
public:
    SendChunkCommand(DataServiceConnection connection, TransportFactory transport_factory,
                     std::string path, Watcher* watcher, TransferMetrics* metrics);

    void before_run(const nlohmann::json& parent_task_result) override;
    nlohmann::json create_context() override;
    TaskFunc func() const override;
    void on_message(const nlohmann::json& message) override;

private:
    DataServiceConnection connection_;
    TransportFactory transport_factory_;
    std::string path_;
    Watcher* watcher_;
    TransferMetrics* metrics_;
    nlohmann::json upload_;
};

/// Completes the upload and creates (or versions) the remote file.
/// The new file id lands in `file_ids` under the local path.
class CompleteUploadCommand : public TaskCommand {
public:
    CompleteUploadCommand(DataServiceConnection connection, TransportFactory transport_factory,
                          const UploadItem& item, std::map<std::string, std::string>& file_ids,
                          Watcher* watcher, TransferMetrics* metrics);

    void before_run(const nlohmann::json& parent_task_result) override;
    nlohmann::json create_context() override;
    TaskFunc func() const override;
    void after_run(const nlohmann::json& result) override;
    void on_message(const nlohmann::json& message) override;

private:
    DataServiceConnection connection_;
    TransportFactory transport_factory_;
    UploadItem item_;
    std::map<std::string, std::string>& file_ids_;
    Watcher* watcher_;
    TransferMetrics* metrics_;
    nlohmann::json upload_;
};

// Worker bodies of the commands above.
nlohmann::json create_upload_run(const nlohmann::json& context, const MessageSender& sender,
                                 const TransportFactory& transport_factory);
nlohmann::json send_chunk_run(const nlohmann::json& context, const MessageSender& sender,
                              const TransportFactory& transport_factory);
nlohmann::json complete_upload_run(const nlohmann::json& context, const MessageSender& sender,
                                   const TransportFactory& transport_factory);

}  // namespace ddsxfer
