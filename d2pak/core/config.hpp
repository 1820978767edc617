#pragma once

#include <cstdint>
#include <string>

namespace d2pak::core {

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    None = 5,
};

struct LoggingConfig {
    bool enabled{true};
    LogLevel level{LogLevel::Info};
    std::string file{};
};

struct ExtractConfig {
    // When false, an existing destination file aborts extraction.
    bool overwrite{true};
};

struct PackConfig {
    // Maximum data bytes per segment before a linked segment is started. 0 = no split.
    std::uint64_t split_size{0};
    bool verbose{false};
};

struct ToolConfig {
    LoggingConfig logging{};
    ExtractConfig extract{};
    PackConfig pack{};
};

class Config {
public:
    static Config& instance();

    // Reads an INI file on top of the current values.
    // @return false if the file cannot be opened.
    bool load_from_file(const std::string& path);

    // Restores defaults (tests and tools that reload).
    void reset();

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const ToolConfig& get() const { return config_; }
    ToolConfig& mutable_get() { return config_; }

    const LoggingConfig& logging() const { return config_.logging; }
    const ExtractConfig& extract() const { return config_.extract; }
    const PackConfig& pack() const { return config_.pack; }

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static std::uint64_t parse_u64(const std::string& v, std::uint64_t default_value);
    static LogLevel log_level_from_string(const std::string& v, LogLevel default_value);

private:
    Config() = default;

    ToolConfig config_{};

    std::string loaded_from_path_{};

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

const char* log_level_name(LogLevel level);

} // namespace d2pak::core
