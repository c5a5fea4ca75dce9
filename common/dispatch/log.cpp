#include "log.h"
#include "util.h"

#include <atomic>
#include <cstdarg>
#include <mutex>
#include <vector>

namespace dispatch {

namespace {

struct log_state {
    std::mutex mutex;
    std::atomic<int> level{LOG_LEVEL_INFO};
    FILE* file = nullptr;  // nullptr = stderr

    ~log_state() {
        if (file) {
            fclose(file);
        }
    }
};

log_state& state() {
    static log_state s;
    return s;
}

char level_tag(log_level level) {
    switch (level) {
        case LOG_LEVEL_DEBUG: return 'D';
        case LOG_LEVEL_INFO:  return 'I';
        case LOG_LEVEL_WARN:  return 'W';
        case LOG_LEVEL_ERROR: return 'E';
        case LOG_LEVEL_NONE:  return ' ';
    }
    return '?';
}

} // namespace

const char* log_level_to_string(log_level level) {
    switch (level) {
        case LOG_LEVEL_DEBUG: return "debug";
        case LOG_LEVEL_INFO:  return "info";
        case LOG_LEVEL_WARN:  return "warn";
        case LOG_LEVEL_ERROR: return "error";
        case LOG_LEVEL_NONE:  return "none";
        default:              return "unknown";
    }
}

bool log_level_from_string(const std::string& str, log_level& level) {
    if (str == "debug")      level = LOG_LEVEL_DEBUG;
    else if (str == "info")  level = LOG_LEVEL_INFO;
    else if (str == "warn")  level = LOG_LEVEL_WARN;
    else if (str == "error") level = LOG_LEVEL_ERROR;
    else if (str == "none")  level = LOG_LEVEL_NONE;
    else return false;
    return true;
}

void dispatch_log_set_level(log_level level) {
    state().level.store(level);
}

log_level dispatch_log_get_level() {
    return static_cast<log_level>(state().level.load());
}

bool dispatch_log_set_file(const std::string& path) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    FILE* next = nullptr;
    if (!path.empty()) {
        next = fopen(path.c_str(), "a");
        if (!next) {
            return false;
        }
    }
    if (s.file) {
        fclose(s.file);
    }
    s.file = next;
    return true;
}

void dispatch_log_write(log_level level, const char* fmt, ...) {
    auto& s = state();
    if (level < s.level.load() || level == LOG_LEVEL_NONE) {
        return;
    }

    va_list args;
    va_start(args, fmt);
    va_list args_copy;
    va_copy(args_copy, args);
    const int n = vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    std::vector<char> buf(n > 0 ? n + 1 : 1);
    vsnprintf(buf.data(), buf.size(), fmt, args);
    va_end(args);

    const int64_t ts = get_timestamp_ms();

    std::lock_guard<std::mutex> lock(s.mutex);
    FILE* out = s.file ? s.file : stderr;
    fprintf(out, "%lld.%03lld %c %s",
            static_cast<long long>(ts / 1000),
            static_cast<long long>(ts % 1000),
            level_tag(level), buf.data());
    fflush(out);
}

} // namespace dispatch
