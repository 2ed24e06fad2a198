#pragma once
#include <fmt/format.h>
#include <atomic>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

namespace colprof {

enum class log_level { debug = 0, info = 1, warn = 2, error = 3, off = 4 };

inline std::atomic<log_level>& log_threshold() {
    static std::atomic<log_level> level{log_level::warn};
    return level;
}

inline void set_log_level(log_level l) { log_threshold().store(l); }

inline bool log_enabled(log_level l) {
    return static_cast<int>(l) >= static_cast<int>(log_threshold().load());
}

inline const char* log_prefix(log_level l) {
    switch (l) {
        case log_level::debug: return "DEBUG";
        case log_level::info:  return "INFO";
        case log_level::warn:  return "WARN";
        default:               return "ERROR";
    }
}

// One fmt::print per message, so lines from worker threads do not interleave.
template <typename... Args>
void log_at(log_level l, std::string_view fmt_str, Args&&... args) {
    if (!log_enabled(l)) return;
    const std::string msg = fmt::format(fmt::runtime(fmt_str), std::forward<Args>(args)...);
    fmt::print(stderr, "{}: {}\n", log_prefix(l), msg);
}

template <typename... Args>
void log_debug(std::string_view f, Args&&... args) { log_at(log_level::debug, f, std::forward<Args>(args)...); }
template <typename... Args>
void log_info(std::string_view f, Args&&... args)  { log_at(log_level::info, f, std::forward<Args>(args)...); }
template <typename... Args>
void log_warn(std::string_view f, Args&&... args)  { log_at(log_level::warn, f, std::forward<Args>(args)...); }
template <typename... Args>
void log_error(std::string_view f, Args&&... args) { log_at(log_level::error, f, std::forward<Args>(args)...); }

}
