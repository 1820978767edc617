#include "logger.hpp"

namespace d2pak::core {

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : start_(std::chrono::steady_clock::now()) {}

void Logger::init(const LoggingConfig& cfg) {
    shutdown();

    std::lock_guard lock(mutex_);

    enabled_.store(cfg.enabled);
    level_.store(cfg.level);
    start_ = std::chrono::steady_clock::now();

    if (!cfg.enabled || cfg.file.empty()) {
        return;
    }

    file_ = std::fopen(cfg.file.c_str(), "a");
    if (!file_) {
        std::fprintf(stderr, "[0.000][WARN][log] cannot open log file %s\n", cfg.file.c_str());
    }
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);

    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

bool Logger::should_log(LogLevel level) const {
    if (!enabled_.load() || level == LogLevel::None) {
        return false;
    }
    return static_cast<int>(level) >= static_cast<int>(level_.load());
}

void Logger::write_line(std::FILE* sink, double t, LogLevel level, const char* tag,
                        const char* fmt, va_list args) {
    std::fprintf(sink, "[%.3f][%s][%s] ", t, log_level_name(level), tag);
    std::vfprintf(sink, fmt, args);
    std::fputc('\n', sink);
}

void Logger::vlog(LogLevel level, const char* tag, const char* fmt, va_list args) {
    std::lock_guard lock(mutex_);

    if (!should_log(level)) {
        return;
    }

    const double t = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();

    if (file_) {
        va_list args_copy;
        va_copy(args_copy, args);

        write_line(file_, t, level, tag, fmt, args);
        std::fflush(file_);

        write_line(stderr, t, level, tag, fmt, args_copy);

        va_end(args_copy);
    } else {
        write_line(stderr, t, level, tag, fmt, args);
    }
}

void logf(LogLevel level, const char* tag, const char* fmt, ...) {
    Logger& logger = Logger::instance();
    if (!logger.should_log(level)) {
        return;
    }

    va_list args;
    va_start(args, fmt);
    logger.vlog(level, tag, fmt, args);
    va_end(args);
}

} // namespace d2pak::core
