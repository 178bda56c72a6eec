#pragma once
// Levelled stderr logger shared by every backend and the admin tool.
// Messages are printf-style; callers prefix them with "[component]".
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <mutex>

namespace cachex {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

inline LogLevel g_log_level = LogLevel::INFO;

// Worker threads of the async adapter log concurrently; one line at a time.
inline std::mutex g_log_mutex;

inline const char* log_level_str(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DBG";
        case LogLevel::INFO:  return "INF";
        case LogLevel::WARN:  return "WRN";
        case LogLevel::ERROR: return "ERR";
    }
    return "???";
}

inline void log(LogLevel level, const char* fmt, ...) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    struct tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::fprintf(stderr, "[%04d-%02d-%02d %02d:%02d:%02d.%03d] [%s] ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms),
        log_level_str(level));

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

#define LOG_DBG(...) ::cachex::log(::cachex::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INF(...) ::cachex::log(::cachex::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WRN(...) ::cachex::log(::cachex::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERR(...) ::cachex::log(::cachex::LogLevel::ERROR, __VA_ARGS__)

} // namespace cachex
