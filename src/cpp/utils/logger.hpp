#pragma once
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>

namespace mdingest {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

inline LogLevel g_log_level = LogLevel::INFO;

// Serializes whole lines; worker threads log concurrently
inline std::mutex g_log_mutex;

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
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    const char* prefix = "???";
    switch (level) {
        case LogLevel::DEBUG: prefix = "DBG"; break;
        case LogLevel::INFO:  prefix = "INF"; break;
        case LogLevel::WARN:  prefix = "WRN"; break;
        case LogLevel::ERROR: prefix = "ERR"; break;
    }

    char line[2048];
    int head = std::snprintf(line, sizeof(line),
        "[%04d-%02d-%02d %02d:%02d:%02d.%03d] [%s] ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms),
        prefix);
    if (head < 0) head = 0;

    va_list args;
    va_start(args, fmt);
    int body = std::vsnprintf(line + head, sizeof(line) - static_cast<size_t>(head), fmt, args);
    va_end(args);

    size_t len = static_cast<size_t>(head) + (body > 0 ? static_cast<size_t>(body) : 0);
    if (len > sizeof(line) - 2) len = sizeof(line) - 2;  // truncated message
    line[len++] = '\n';

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::fwrite(line, 1, len, stderr);
}

#define LOG_DBG(...) ::mdingest::log(::mdingest::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INF(...) ::mdingest::log(::mdingest::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WRN(...) ::mdingest::log(::mdingest::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERR(...) ::mdingest::log(::mdingest::LogLevel::ERROR, __VA_ARGS__)

} // namespace mdingest
