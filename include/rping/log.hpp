#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace rping {

/**
 * Diagnostic logging to stderr. Ping output itself goes to stdout and never
 * passes through here.
 */
enum class LogLevel { DEBUG, INFO, WARN, ERROR };

inline LogLevel g_log_threshold = LogLevel::WARN;

inline const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

inline void set_log_level(LogLevel lvl) {
    g_log_threshold = lvl;
}

inline void log(LogLevel lvl, const std::string& msg) {
    if (lvl < g_log_threshold) return;
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    std::fprintf(stderr, "[%s] %s: %s\n", buf, level_name(lvl), msg.c_str());
}

} // namespace rping
