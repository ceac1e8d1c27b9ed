#include "ddsxfer/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace ddsxfer {

namespace {

std::atomic<bool> verbose_logging{false};

// Worker threads log concurrently; keep each line whole.
std::mutex log_mutex;

}  // namespace

void log_info(const char* fmt, ...) {
    std::lock_guard lock(log_mutex);
    va_list args;
    va_start(args, fmt);
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

void log_error(const char* fmt, ...) {
    std::lock_guard lock(log_mutex);
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "ERROR: ");
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

void log_debug(const char* fmt, ...) {
    if (!verbose_logging.load(std::memory_order_relaxed)) return;
    std::lock_guard lock(log_mutex);
    va_list args;
    va_start(args, fmt);
    fprintf(stdout, "DEBUG: ");
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

void set_verbose(bool verbose) {
    verbose_logging.store(verbose);
}

bool is_verbose() {
    return verbose_logging.load();
}

}  // namespace ddsxfer
