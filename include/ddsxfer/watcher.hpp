#pragma once

#include <cstdint>
#include <string>

namespace ddsxfer {

/// Progress notifications from the transfer engines. Always called from the
/// controller thread.
class Watcher {
public:
    virtual ~Watcher() = default;

    /// `item` is about to be (or is being) transferred. `increment_amt` counts
    /// finished units (files or chunks); `transferred_bytes` is a byte delta
    /// and goes negative when a failed range attempt is rolled back.
    virtual void transferring_item(const std::string& item, int increment_amt, int64_t transferred_bytes) = 0;

    /// The service has not converged yet; the run is polling.
    virtual void start_waiting() = 0;
    virtual void done_waiting() = 0;
};

/// Watcher that reports percentage progress through the log.
/// A line is only written when the percentage or the item changes.
class ProgressPrinter : public Watcher {
public:
    ProgressPrinter(uint64_t total, std::string msg_verb);

    void transferring_item(const std::string& item, int increment_amt, int64_t transferred_bytes) override;
    void start_waiting() override;
    void done_waiting() override;

    /// Print the final "Done" line.
    void finished();

    uint64_t count() const { return cnt_; }
    int64_t transferred_bytes() const { return bytes_; }

private:
    uint64_t total_;
    std::string msg_verb_;
    uint64_t cnt_ = 0;
    int64_t bytes_ = 0;
    int last_percent_ = -1;
    std::string last_item_;
    bool waiting_ = false;
};

}  // namespace ddsxfer
