#pragma once
// Leveled stderr logger shared by the gateway threads (warm-up, HTTP workers)
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>

namespace phxgw {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

inline LogLevel g_log_level = LogLevel::INFO;

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

inline LogLevel parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "warn")  return LogLevel::WARN;
    if (s == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

inline void log(LogLevel level, const char* fmt, ...) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    struct tm tm_buf{};
    localtime_r(&t, &tm_buf);

    const char* prefix = "???";
    switch (level) {
        case LogLevel::DEBUG: prefix = "DBG"; break;
        case LogLevel::INFO:  prefix = "INF"; break;
        case LogLevel::WARN:  prefix = "WRN"; break;
        case LogLevel::ERROR: prefix = "ERR"; break;
    }

    // One line per call, even with several HTTP worker threads logging
    std::lock_guard<std::mutex> lock(log_mutex());
    std::fprintf(stderr, "[%04d-%02d-%02d %02d:%02d:%02d.%03d] [%s] ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms),
        prefix);

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

#define LOG_DBG(...) ::phxgw::log(::phxgw::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INF(...) ::phxgw::log(::phxgw::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WRN(...) ::phxgw::log(::phxgw::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERR(...) ::phxgw::log(::phxgw::LogLevel::ERROR, __VA_ARGS__)

} // namespace phxgw
