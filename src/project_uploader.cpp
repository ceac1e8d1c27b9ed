#include "ddsxfer/project_uploader.hpp"
#include "ddsxfer/chunking.hpp"
#include "ddsxfer/file_uploader.hpp"
#include "ddsxfer/log.hpp"
#include "ddsxfer/transfer_messages.hpp"

namespace ddsxfer {

namespace {

// API client, waiting monitor and upload steps for one worker task.
struct WorkerUploadSession {
    DataServiceApi data_service;
    ChannelWaitingMonitor monitor;
    FileUploadOperations operations;

    WorkerUploadSession(const nlohmann::json& context, const MessageSender& sender,
                        const TransportFactory& transport_factory)
        : data_service(DataServiceConnection::from_json(context.at("connection")), transport_factory)
        , monitor(sender)
        , operations(data_service, &monitor) {
        data_service.set_retry_observer([&sender](RetryKind kind) { sender.send(messages::retry(kind)); });
        data_service.set_stop_token(sender.stop_token());
    }
};

nlohmann::json hash_to_json(const HashData& hash) {
    return {{"algorithm", hash.algorithm}, {"value", hash.value}};
}

HashData hash_from_json(const nlohmann::json& j) {
    return {j.at("algorithm").get<std::string>(), j.at("value").get<std::string>()};
}

}  // namespace

// --- ProjectUploader ---

ProjectUploader::ProjectUploader(const TransferConfig& config, TransportFactory transport_factory,
                                 Watcher* watcher, TransferMetrics* metrics)
    : config_(config)
    , transport_factory_(std::move(transport_factory))
    , watcher_(watcher)
    , metrics_(metrics) {}

uint64_t ProjectUploader::count_chunks(const std::vector<UploadItem>& items, uint64_t upload_bytes_per_chunk) {
    uint64_t total = 0;
    for (const auto& item : items) {
        total += num_chunks(upload_bytes_per_chunk, std::filesystem::file_size(item.path));
    }
    return total;
}

std::map<std::string, std::string> ProjectUploader::run(const std::string& project_id,
                                                        const std::vector<UploadItem>& items) {
    std::vector<const UploadItem*> small_items;
    std::vector<const UploadItem*> large_items;
    for (const auto& item : items) {
        if (std::filesystem::file_size(item.path) <= config_.upload_bytes_per_chunk) {
            small_items.push_back(&item);
        } else {
            large_items.push_back(&item);
        }
    }
    log_debug("uploading %zu small and %zu large files to project %s",
              small_items.size(), large_items.size(), project_id.c_str());

    std::map<std::string, std::string> file_ids;
    upload_small_files(project_id, small_items, file_ids);
    upload_large_files(project_id, large_items, file_ids);
    return file_ids;
}

void ProjectUploader::upload_small_files(const std::string& project_id,
                                         const std::vector<const UploadItem*>& items,
                                         std::map<std::string, std::string>& file_ids) {
    if (items.empty()) return;
    auto connection = DataServiceConnection::from_config(config_);

    TaskExecutor executor(config_.upload_workers);
    TaskRunner runner(executor);
    for (const UploadItem* item : items) {
        auto path = item->path.string();
        TaskId create_id = runner.add(std::nullopt, std::make_shared<CreateUploadCommand>(
            connection, transport_factory_, project_id, path, watcher_, metrics_));
        TaskId send_id = runner.add(create_id, std::make_shared<SendChunkCommand>(
            connection, transport_factory_, path, watcher_, metrics_));
        runner.add(send_id, std::make_shared<CompleteUploadCommand>(
            connection, transport_factory_, *item, file_ids, watcher_, metrics_));
    }
    runner.run();
}

void ProjectUploader::upload_large_files(const std::string& project_id,
                                         const std::vector<const UploadItem*>& items,
                                         std::map<std::string, std::string>& file_ids) {
    FileUploader uploader(config_, transport_factory_, watcher_, metrics_);
    for (const UploadItem* item : items) {
        auto path = item->path.string();
        if (watcher_) watcher_->transferring_item(path, 0, 0);
        file_ids[path] = uploader.upload(project_id, *item);
    }
}

// --- CreateUploadCommand ---

CreateUploadCommand::CreateUploadCommand(DataServiceConnection connection, TransportFactory transport_factory,
                                         std::string project_id, std::string path,
                                         Watcher* watcher, TransferMetrics* metrics)
    : connection_(std::move(connection))
    , transport_factory_(std::move(transport_factory))
    , project_id_(std::move(project_id))
    , path_(std::move(path))
    , watcher_(watcher)
    , metrics_(metrics) {}

void CreateUploadCommand::before_run(const nlohmann::json& parent_task_result) {
    (void)parent_task_result;
    if (watcher_) watcher_->transferring_item(path_, 0, 0);
}

nlohmann::json CreateUploadCommand::create_context() {
    return {
        {"connection", connection_.to_json()},
        {"project_id", project_id_},
        {"path", path_},
    };
}

TaskFunc CreateUploadCommand::func() const {
    return [factory = transport_factory_](const nlohmann::json& context, const MessageSender& sender) {
        return create_upload_run(context, sender, factory);
    };
}

void CreateUploadCommand::on_message(const nlohmann::json& message) {
    messages::dispatch(message, path_, messages::Direction::UPLOAD, watcher_, metrics_);
}

nlohmann::json create_upload_run(const nlohmann::json& context, const MessageSender& sender,
                                 const TransportFactory& transport_factory) {
    WorkerUploadSession session(context, sender, transport_factory);
    PathData path_data(context.at("path").get<std::string>());
    auto hash_data = path_data.get_hash();
    auto upload_id = session.operations.create_upload(context.at("project_id").get<std::string>(),
                                                      path_data, hash_data);
    return {{"upload_id", upload_id}, {"hash", hash_to_json(hash_data)}};
}

// --- SendChunkCommand ---

SendChunkCommand::SendChunkCommand(DataServiceConnection connection, TransportFactory transport_factory,
                                   std::string path, Watcher* watcher, TransferMetrics* metrics)
    : connection_(std::move(connection))
    , transport_factory_(std::move(transport_factory))
    , path_(std::move(path))
    , watcher_(watcher)
    , metrics_(metrics) {}

void SendChunkCommand::before_run(const nlohmann::json& parent_task_result) {
    upload_ = parent_task_result;
}

nlohmann::json SendChunkCommand::create_context() {
    return {
        {"connection", connection_.to_json()},
        {"upload", upload_},
        {"path", path_},
    };
}

TaskFunc SendChunkCommand::func() const {
    return [factory = transport_factory_](const nlohmann::json& context, const MessageSender& sender) {
        return send_chunk_run(context, sender, factory);
    };
}

void SendChunkCommand::on_message(const nlohmann::json& message) {
    messages::dispatch(message, path_, messages::Direction::UPLOAD, watcher_, metrics_);
}

nlohmann::json send_chunk_run(const nlohmann::json& context, const MessageSender& sender,
                              const TransportFactory& transport_factory) {
    WorkerUploadSession session(context, sender, transport_factory);
    PathData path_data(context.at("path").get<std::string>());
    const auto& upload = context.at("upload");

    auto chunk = path_data.read_chunk(0, path_data.size());
    session.operations.send_chunk(upload.at("upload_id").get<std::string>(), 0, chunk);
    sender.send(messages::progress(1, static_cast<int64_t>(chunk.size())));
    return upload;
}

// --- CompleteUploadCommand ---

CompleteUploadCommand::CompleteUploadCommand(DataServiceConnection connection, TransportFactory transport_factory,
                                             const UploadItem& item, std::map<std::string, std::string>& file_ids,
                                             Watcher* watcher, TransferMetrics* metrics)
    : connection_(std::move(connection))
    , transport_factory_(std::move(transport_factory))
    , item_(item)
    , file_ids_(file_ids)
    , watcher_(watcher)
    , metrics_(metrics) {}

void CompleteUploadCommand::before_run(const nlohmann::json& parent_task_result) {
    upload_ = parent_task_result;
}

nlohmann::json CompleteUploadCommand::create_context() {
    nlohmann::json context = {
        {"connection", connection_.to_json()},
        {"upload", upload_},
        {"parent", {{"kind", item_.parent.kind}, {"id", item_.parent.id}}},
    };
    if (item_.remote_file_id) {
        context["remote_file_id"] = *item_.remote_file_id;
    }
    return context;
}

TaskFunc CompleteUploadCommand::func() const {
    return [factory = transport_factory_](const nlohmann::json& context, const MessageSender& sender) {
        return complete_upload_run(context, sender, factory);
    };
}

void CompleteUploadCommand::after_run(const nlohmann::json& result) {
    file_ids_[item_.path.string()] = result.at("file_id").get<std::string>();
    if (metrics_) metrics_->files_uploaded().Increment();
}

void CompleteUploadCommand::on_message(const nlohmann::json& message) {
    messages::dispatch(message, item_.path.string(), messages::Direction::UPLOAD, watcher_, metrics_);
}

nlohmann::json complete_upload_run(const nlohmann::json& context, const MessageSender& sender,
                                   const TransportFactory& transport_factory) {
    WorkerUploadSession session(context, sender, transport_factory);
    const auto& upload = context.at("upload");
    const auto& parent = context.at("parent");

    std::optional<std::string> remote_file_id;
    if (context.contains("remote_file_id")) {
        remote_file_id = context.at("remote_file_id").get<std::string>();
    }
    auto file_id = session.operations.finish_upload(
        upload.at("upload_id").get<std::string>(), hash_from_json(upload.at("hash")),
        ParentRef{parent.at("kind").get<std::string>(), parent.at("id").get<std::string>()},
        remote_file_id);
    return {{"file_id", file_id}};
}

}  // namespace ddsxfer
