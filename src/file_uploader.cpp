#include "ddsxfer/file_uploader.hpp"
#include "ddsxfer/chunking.hpp"
#include "ddsxfer/consistency.hpp"
#include "ddsxfer/errors.hpp"
#include "ddsxfer/log.hpp"
#include "ddsxfer/transfer_messages.hpp"

#include <algorithm>

namespace ddsxfer {

// --- FileUploadOperations ---

FileUploadOperations::FileUploadOperations(DataServiceApi& data_service, Watcher* waiting_monitor)
    : data_service_(data_service), waiting_monitor_(waiting_monitor) {}

std::string FileUploadOperations::create_upload(const std::string& project_id, const PathData& path_data,
                                                const HashData& hash_data) {
    auto resp = retry_until_resource_is_consistent([&]() {
        return data_service_.create_upload(project_id, path_data.name(), path_data.mime_type(),
                                           path_data.size(), hash_data);
    }, waiting_monitor_, data_service_.connection().retry, data_service_.stop_token());
    return resp.at("id").get<std::string>();
}

ExternalUrl FileUploadOperations::create_file_chunk_url(const std::string& upload_id, uint64_t chunk_num,
                                                        const std::vector<uint8_t>& chunk) {
    auto hash_data = HashUtil::hash_chunk(chunk, constants::DEFAULT_HASH_ALGORITHM);
    auto resp = retry_until_resource_is_consistent([&]() {
        return data_service_.create_upload_url(upload_id, chunk_num + 1, chunk.size(), hash_data);
    }, waiting_monitor_, data_service_.connection().retry, data_service_.stop_token());
    return ExternalUrl::from_json(resp);
}

void FileUploadOperations::send_file_external(const ExternalUrl& url, const std::vector<uint8_t>& chunk) {
    data_service_.send_external(url.http_verb, url.host, url.url, url.http_headers, chunk);
}

void FileUploadOperations::send_chunk(const std::string& upload_id, uint64_t chunk_num,
                                      const std::vector<uint8_t>& chunk) {
    const int max_attempts = std::max(1, data_service_.connection().retry.send_external_forbidden_retry_times);
    int attempts = 0;
    while (true) {
        auto url = create_file_chunk_url(upload_id, chunk_num, chunk);
        try {
            send_file_external(url, chunk);
            return;
        } catch (const ForbiddenSendExternalError& e) {
            ++attempts;
            if (attempts >= max_attempts) {
                throw;
            }
            log_info("Chunk %lu of upload %s was refused (%s), requesting a new URL",
                     static_cast<unsigned long>(chunk_num + 1), upload_id.c_str(), e.what());
            data_service_.report_retry(RetryKind::FORBIDDEN);
        }
    }
}

std::string FileUploadOperations::finish_upload(const std::string& upload_id, const HashData& hash_data,
                                                const ParentRef& parent,
                                                const std::optional<std::string>& remote_file_id) {
    const auto& retry = data_service_.connection().retry;
    retry_until_resource_is_consistent([&]() {
        return data_service_.complete_upload(upload_id, hash_data);
    }, waiting_monitor_, retry, data_service_.stop_token());
    if (remote_file_id) {
        retry_until_resource_is_consistent([&]() {
            return data_service_.update_file(*remote_file_id, upload_id);
        }, waiting_monitor_, retry, data_service_.stop_token());
        return *remote_file_id;
    }
    auto resp = retry_until_resource_is_consistent([&]() {
        return data_service_.create_file(parent, upload_id);
    }, waiting_monitor_, retry, data_service_.stop_token());
    return resp.at("id").get<std::string>();
}

// --- FileUploader ---

FileUploader::FileUploader(const TransferConfig& config, TransportFactory transport_factory,
                           Watcher* watcher, TransferMetrics* metrics)
    : config_(config)
    , transport_factory_(std::move(transport_factory))
    , watcher_(watcher)
    , metrics_(metrics) {}

std::string FileUploader::upload(const std::string& project_id, const UploadItem& item) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->upload_duration());

    PathData path_data(item.path);
    DataServiceApi data_service(DataServiceConnection::from_config(config_), transport_factory_);
    FileUploadOperations upload_operations(data_service, watcher_);

    auto hash_data = path_data.get_hash();
    auto upload_id = upload_operations.create_upload(project_id, path_data, hash_data);
    log_debug("created upload %s for %s", upload_id.c_str(), item.path.c_str());

    ParallelChunkProcessor(config_, transport_factory_, upload_id, path_data, watcher_, metrics_).run();

    auto file_id = upload_operations.finish_upload(upload_id, hash_data, item.parent, item.remote_file_id);
    if (metrics_) metrics_->files_uploaded().Increment();
    return file_id;
}

// --- ParallelChunkProcessor ---

ParallelChunkProcessor::ParallelChunkProcessor(const TransferConfig& config, TransportFactory transport_factory,
                                               std::string upload_id, PathData path_data,
                                               Watcher* watcher, TransferMetrics* metrics)
    : config_(config)
    , transport_factory_(std::move(transport_factory))
    , upload_id_(std::move(upload_id))
    , path_data_(std::move(path_data))
    , watcher_(watcher)
    , metrics_(metrics) {}

void ParallelChunkProcessor::run() {
    uint64_t chunks = num_chunks(config_.upload_bytes_per_chunk, path_data_.size());
    auto parcels = work_parcels(config_.upload_workers, chunks);
    auto connection = DataServiceConnection::from_config(config_);

    TaskExecutor executor(config_.upload_workers);
    TaskRunner runner(executor);
    for (const auto& parcel : parcels) {
        runner.add(std::nullopt, std::make_shared<SendChunksCommand>(
            connection, transport_factory_, upload_id_, path_data_.path().string(),
            config_.upload_bytes_per_chunk, parcel.start_index, parcel.num_items,
            watcher_, metrics_));
    }
    runner.run();
}

// --- SendChunksCommand ---

SendChunksCommand::SendChunksCommand(DataServiceConnection connection, TransportFactory transport_factory,
                                     std::string upload_id, std::string path, uint64_t chunk_size,
                                     uint64_t index, uint64_t num_chunks,
                                     Watcher* watcher, TransferMetrics* metrics)
    : connection_(std::move(connection))
    , transport_factory_(std::move(transport_factory))
    , upload_id_(std::move(upload_id))
    , path_(std::move(path))
    , chunk_size_(chunk_size)
    , index_(index)
    , num_chunks_(num_chunks)
    , watcher_(watcher)
    , metrics_(metrics) {}

nlohmann::json SendChunksCommand::create_context() {
    return {
        {"connection", connection_.to_json()},
        {"upload_id", upload_id_},
        {"path", path_},
        {"chunk_size", chunk_size_},
        {"index", index_},
        {"num_chunks", num_chunks_},
    };
}

TaskFunc SendChunksCommand::func() const {
    return [factory = transport_factory_](const nlohmann::json& context, const MessageSender& sender) {
        return send_chunks_run(context, sender, factory);
    };
}

void SendChunksCommand::on_message(const nlohmann::json& message) {
    messages::dispatch(message, path_, messages::Direction::UPLOAD, watcher_, metrics_);
}

nlohmann::json send_chunks_run(const nlohmann::json& context, const MessageSender& sender,
                               const TransportFactory& transport_factory) {
    DataServiceApi data_service(DataServiceConnection::from_json(context.at("connection")), transport_factory);
    data_service.set_retry_observer([&sender](RetryKind kind) { sender.send(messages::retry(kind)); });
    data_service.set_stop_token(sender.stop_token());
    ChannelWaitingMonitor monitor(sender);
    FileUploadOperations upload_operations(data_service, &monitor);

    PathData path_data(context.at("path").get<std::string>());
    auto upload_id = context.at("upload_id").get<std::string>();
    auto chunk_size = context.at("chunk_size").get<uint64_t>();
    auto index = context.at("index").get<uint64_t>();
    auto num_chunks_to_send = context.at("num_chunks").get<uint64_t>();
    uint64_t file_size = path_data.size();

    for (uint64_t i = 0; i < num_chunks_to_send; ++i) {
        throw_if_stopped(sender.stop_token());
        auto descriptor = describe_chunk(index + i, chunk_size, file_size);
        auto chunk = path_data.read_chunk(descriptor.offset, descriptor.size);
        upload_operations.send_chunk(upload_id, descriptor.index, chunk);
        sender.send(messages::progress(1, static_cast<int64_t>(chunk.size())));
    }
    return {{"chunks_sent", num_chunks_to_send}};
}

}  // namespace ddsxfer
