#pragma once

#include <cstdio>
#include <string>

namespace dispatch {

enum log_level {
    LOG_LEVEL_DEBUG,
    LOG_LEVEL_INFO,
    LOG_LEVEL_WARN,
    LOG_LEVEL_ERROR,
    LOG_LEVEL_NONE
};

const char* log_level_to_string(log_level level);

// Parse "debug", "info", "warn", "error", "none" (returns false if unknown)
bool log_level_from_string(const std::string& str, log_level& level);

void dispatch_log_set_level(log_level level);
log_level dispatch_log_get_level();

// Redirect output to a file (empty path = stderr)
bool dispatch_log_set_file(const std::string& path);

#if defined(__GNUC__)
__attribute__((format(printf, 2, 3)))
#endif
void dispatch_log_write(log_level level, const char* fmt, ...);

} // namespace dispatch

#define LOG_DBG(...) ::dispatch::dispatch_log_write(::dispatch::LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_INF(...) ::dispatch::dispatch_log_write(::dispatch::LOG_LEVEL_INFO,  __VA_ARGS__)
#define LOG_WRN(...) ::dispatch::dispatch_log_write(::dispatch::LOG_LEVEL_WARN,  __VA_ARGS__)
#define LOG_ERR(...) ::dispatch::dispatch_log_write(::dispatch::LOG_LEVEL_ERROR, __VA_ARGS__)
