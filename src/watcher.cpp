#include "ddsxfer/watcher.hpp"
#include "ddsxfer/log.hpp"

#include <algorithm>

namespace ddsxfer {

ProgressPrinter::ProgressPrinter(uint64_t total, std::string msg_verb)
    : total_(total), msg_verb_(std::move(msg_verb)) {}

void ProgressPrinter::transferring_item(const std::string& item, int increment_amt, int64_t transferred_bytes) {
    int percent_done = total_ == 0 ? 100
        : static_cast<int>(std::min<uint64_t>(100, cnt_ * 100 / total_));
    if (percent_done != last_percent_ || item != last_item_) {
        log_info("Progress: %d%% - %s %s", percent_done, msg_verb_.c_str(), item.c_str());
        last_percent_ = percent_done;
        last_item_ = item;
    }
    if (increment_amt > 0) {
        cnt_ += static_cast<uint64_t>(increment_amt);
    }
    bytes_ += transferred_bytes;
}

void ProgressPrinter::start_waiting() {
    if (!waiting_) {
        log_info("Waiting for the data service to finish processing...");
        waiting_ = true;
    }
}

void ProgressPrinter::done_waiting() {
    if (waiting_) {
        log_info("Resuming %s.", msg_verb_.c_str());
        waiting_ = false;
    }
}

void ProgressPrinter::finished() {
    log_info("Done: 100%%");
}

}  // namespace ddsxfer
