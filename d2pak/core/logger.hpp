#pragma once

#include "config.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace d2pak::core {

class Logger {
public:
    static Logger& instance();

    // Applies logging settings (level, optional file sink).
    void init(const LoggingConfig& cfg);
    void shutdown();

    bool should_log(LogLevel level) const;

    void vlog(LogLevel level, const char* tag, const char* fmt, va_list args);

private:
    Logger();

    void write_line(std::FILE* sink, double t, LogLevel level, const char* tag,
                    const char* fmt, va_list args);

    std::FILE* file_{nullptr};
    // Read by should_log() without the mutex.
    std::atomic<bool> enabled_{true};
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::chrono::steady_clock::time_point start_;
    std::mutex mutex_;
};

// Initializes the logger for a scope and shuts it down (closing any file
// sink) when the scope ends, whichever way it is left.
class LogSession {
public:
    explicit LogSession(const LoggingConfig& cfg) { Logger::instance().init(cfg); }
    ~LogSession() { Logger::instance().shutdown(); }

    LogSession(const LogSession&) = delete;
    LogSession& operator=(const LogSession&) = delete;
};

// printf-style logging through Logger::instance().
// Output: "[<seconds>][LEVEL][tag] message".
void logf(LogLevel level, const char* tag, const char* fmt, ...);

} // namespace d2pak::core
