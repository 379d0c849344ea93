#include "chunkvault/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace chunkvault {

namespace {

std::atomic<bool> g_verbose{false};

void vlog(FILE* stream, const char* prefix, const char* fmt, va_list args) {
    if (prefix) fputs(prefix, stream);
    vfprintf(stream, fmt, args);
    fputc('\n', stream);
    fflush(stream);
}

}  // namespace

void set_log_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool log_verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stdout, nullptr, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "WARNING: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    if (!log_verbose()) return;
    va_list args;
    va_start(args, fmt);
    vlog(stdout, "DEBUG: ", fmt, args);
    va_end(args);
}

}  // namespace chunkvault
