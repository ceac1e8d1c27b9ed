#pragma once

#include "ddsxfer/metrics.hpp"
#include "ddsxfer/parallel.hpp"
#include "ddsxfer/watcher.hpp"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace ddsxfer {

// Messages transfer workers post to the controller:
//   {"kind": "progress", "increment": <units>, "bytes": <delta>}
//   {"kind": "start_waiting"} / {"kind": "done_waiting"}
//   {"kind": "retry", "cause": "connection" | "forbidden" | ...}
namespace messages {

nlohmann::json progress(int increment, int64_t bytes);
nlohmann::json start_waiting();
nlohmann::json done_waiting();
nlohmann::json retry(RetryKind kind);

enum class Direction { UPLOAD, DOWNLOAD };

/// Controller side: forward one worker message about `item` to the watcher
/// and metrics (either may be null).
void dispatch(const nlohmann::json& message, const std::string& item, Direction direction,
              Watcher* watcher, TransferMetrics* metrics);

}  // namespace messages

/// Watcher used inside a worker: waiting notifications become channel messages.
class ChannelWaitingMonitor : public Watcher {
public:
    explicit ChannelWaitingMonitor(const MessageSender& sender) : sender_(sender) {}

    void transferring_item(const std::string& item, int increment_amt, int64_t transferred_bytes) override;
    void start_waiting() override;
    void done_waiting() override;

private:
    const MessageSender& sender_;
};

}  // namespace ddsxfer
