#pragma once

namespace coldpack {

// Line-oriented logging to stdout/stderr. Callers gate verbose output on
// the config's `verbose` flag; the CLI redirects both streams to --log-file.

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace coldpack
