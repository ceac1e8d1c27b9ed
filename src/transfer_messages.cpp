#include "ddsxfer/transfer_messages.hpp"
#include "ddsxfer/log.hpp"

namespace ddsxfer {

namespace messages {

nlohmann::json progress(int increment, int64_t bytes) {
    return {{"kind", "progress"}, {"increment", increment}, {"bytes", bytes}};
}

nlohmann::json start_waiting() {
    return {{"kind", "start_waiting"}};
}

nlohmann::json done_waiting() {
    return {{"kind", "done_waiting"}};
}

nlohmann::json retry(RetryKind kind) {
    return {{"kind", "retry"}, {"cause", retry_kind_to_string(kind)}};
}

void dispatch(const nlohmann::json& message, const std::string& item, Direction direction,
              Watcher* watcher, TransferMetrics* metrics) {
    auto kind = message.value("kind", "");
    if (kind == "progress") {
        int increment = message.value("increment", 0);
        int64_t bytes = message.value("bytes", int64_t{0});
        if (watcher) {
            watcher->transferring_item(item, increment, bytes);
        }
        if (metrics && direction == Direction::UPLOAD) {
            if (increment > 0) metrics->chunks_sent().Increment(increment);
            if (bytes > 0) metrics->upload_bytes_total().Increment(static_cast<double>(bytes));
        }
    } else if (kind == "start_waiting") {
        if (watcher) watcher->start_waiting();
        if (metrics) metrics->consistency_waits().Increment();
    } else if (kind == "done_waiting") {
        if (watcher) watcher->done_waiting();
    } else if (kind == "retry") {
        auto cause = retry_kind_from_string(message.value("cause", ""));
        if (metrics && cause) metrics->record_retry(*cause);
    } else {
        log_debug("ignoring message of kind '%s' for %s", kind.c_str(), item.c_str());
    }
}

}  // namespace messages

void ChannelWaitingMonitor::transferring_item(const std::string& item, int increment_amt,
                                              int64_t transferred_bytes) {
    (void)item;
    sender_.send(messages::progress(increment_amt, transferred_bytes));
}

void ChannelWaitingMonitor::start_waiting() {
    sender_.send(messages::start_waiting());
}

void ChannelWaitingMonitor::done_waiting() {
    sender_.send(messages::done_waiting());
}

}  // namespace ddsxfer
