#pragma once

namespace objxfer {

// Enable or disable log_debug output.
void set_verbose(bool verbose);
bool is_verbose();

// printf-style loggers. log_info goes to stdout; the rest go to stderr.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace objxfer
