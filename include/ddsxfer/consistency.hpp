#pragma once

#include "ddsxfer/errors.hpp"
#include "ddsxfer/log.hpp"
#include "ddsxfer/parallel.hpp"
#include "ddsxfer/transfer_config.hpp"
#include "ddsxfer/watcher.hpp"

#include <chrono>
#include <stop_token>

namespace ddsxfer {

/// Run `func`, retrying while the service reports ResourceNotConsistentError.
///
/// The service converges on its own shortly after a write, so by default the
/// wait has no limit. A non-zero `retry.resource_not_consistent_max_retries`
/// rethrows the error once that many retries have been spent.
/// `monitor` sees start_waiting()/done_waiting() once per run of retries.
/// Any other exception propagates untouched. Triggering `stop_token` ends
/// the wait with TaskCancelledError.
template <typename Func>
auto retry_until_resource_is_consistent(Func&& func, Watcher* monitor, const RetrySettings& retry,
                                        const std::stop_token& stop_token = {}) -> decltype(func()) {
    bool waiting = false;
    int retries = 0;
    while (true) {
        try {
            auto result = func();
            if (waiting && monitor) {
                monitor->done_waiting();
            }
            return result;
        } catch (const ResourceNotConsistentError& e) {
            if (retry.resource_not_consistent_max_retries > 0 &&
                retries >= retry.resource_not_consistent_max_retries) {
                if (waiting && monitor) {
                    monitor->done_waiting();
                }
                throw;
            }
            if (!waiting) {
                log_debug("%s not consistent yet, waiting", e.url_suffix().c_str());
                if (monitor) {
                    monitor->start_waiting();
                }
                waiting = true;
            }
            ++retries;
        }
        try {
            sleep_unless_stopped(std::chrono::seconds(retry.resource_not_consistent_retry_seconds), stop_token);
        } catch (const TaskCancelledError&) {
            if (monitor) {
                monitor->done_waiting();
            }
            throw;
        }
    }
}

}  // namespace ddsxfer
