#pragma once

namespace chunkvault {

/// Enable or disable log_debug() output (off by default).
void set_log_verbose(bool verbose);
bool log_verbose();

/// printf-style logging. Info and debug go to stdout, warnings and
/// errors to stderr with a severity prefix. Each call emits one line.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace chunkvault
