#pragma once

namespace ddsxfer {

// Process-wide log output. Info lines go to stdout, errors to stderr.
// Debug lines are only printed while verbose logging is on.

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_verbose(bool verbose);
bool is_verbose();

}  // namespace ddsxfer
