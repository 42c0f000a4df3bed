#include "objxfer/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace objxfer {

namespace {

std::atomic<bool> g_verbose{false};

// Serializes lines written from the listing and removal threads.
std::mutex g_log_mutex;

void write_line(FILE* out, const char* prefix, const char* fmt, va_list args) {
    std::lock_guard lock(g_log_mutex);
    if (prefix) fputs(prefix, out);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

void set_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool is_verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stdout, nullptr, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "WARNING: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    if (!is_verbose()) return;
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "DEBUG: ", fmt, args);
    va_end(args);
}

}  // namespace objxfer
