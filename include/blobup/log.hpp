#pragma once

namespace blobup {

// printf-style line loggers. info/debug go to stdout, warn/error to stderr.
// Never pass authorization values or key material.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Only printed when verbose logging is on
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_verbose(bool verbose);
bool is_verbose();

} // namespace blobup
