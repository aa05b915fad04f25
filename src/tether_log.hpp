// =============================================================================
// Tether - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with optional file output.
// Usage: TLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>
#include <atomic>
#include <cctype>

#include <sys/syscall.h>
#include <unistd.h>

namespace tether::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Info};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// "debug" / "WARN" / "warning" -> Level; unknown names fall back to `def`
inline Level parseLevel(const std::string& name, Level def = Level::Info) {
    std::string s;
    for (char c : name) s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "info")  return Level::Info;
    if (s == "warn" || s == "warning") return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "fatal") return Level::Fatal;
    return def;
}

inline void setLogLevel(Level l) { g_min_level = l; }

inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "w");  // overwrite mode: one log per daemon run
    return g_log_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < g_min_level.load(std::memory_order_relaxed)) return;
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);
    char time_str[32];
    snprintf(time_str, sizeof(time_str), "%02d:%02d:%02d.%03d",
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)ms.count());
    long tid = static_cast<long>(::syscall(SYS_gettid));
    char msg[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);
    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "%s [%s] [%s] (T%ld) %s\n", time_str, levelStr(level), tag, tid, msg);
    if (g_log_file) {
        fprintf(g_log_file, "%s [%s] [%s] (T%ld) %s\n",
                time_str, levelStr(level), tag, tid, msg);
        fflush(g_log_file);
    }
}

} // namespace tether::log

#define TLOG_TRACE(tag, fmt, ...) tether::log::write(tether::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define TLOG_DEBUG(tag, fmt, ...) tether::log::write(tether::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define TLOG_INFO(tag, fmt, ...)  tether::log::write(tether::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define TLOG_WARN(tag, fmt, ...)  tether::log::write(tether::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define TLOG_ERROR(tag, fmt, ...) tether::log::write(tether::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define TLOG_FATAL(tag, fmt, ...) tether::log::write(tether::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
