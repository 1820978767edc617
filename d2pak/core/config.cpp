#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

namespace d2pak::core {

namespace {

std::string strip_quotes(std::string s) {
    s = Config::trim(std::move(s));

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

} // namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::None: return "NONE";
        default: break;
    }
    return "INFO";
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

void Config::reset() {
    config_ = ToolConfig{};
    loaded_from_path_.clear();
}

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

std::uint64_t Config::parse_u64(const std::string& v, std::uint64_t default_value) {
    const std::string s = trim(v);
    if (s.empty() || s.front() == '-') {
        return default_value;
    }
    try {
        std::size_t idx = 0;
        const unsigned long long out = std::stoull(s, &idx, 10);
        if (idx != s.size()) {
            return default_value;
        }
        return static_cast<std::uint64_t>(out);
    } catch (const std::invalid_argument&) {
        return default_value;
    } catch (const std::out_of_range&) {
        return default_value;
    }
}

LogLevel Config::log_level_from_string(const std::string& v, LogLevel default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, LogLevel> map = {
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warning", LogLevel::Warn}, {"warn", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"none", LogLevel::None}, {"off", LogLevel::None},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    // Allow numeric.
    const std::uint64_t n = parse_u64(s, static_cast<std::uint64_t>(default_value));
    if (n > static_cast<std::uint64_t>(LogLevel::None)) {
        return default_value;
    }
    return static_cast<LogLevel>(n);
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "logging") {
        if (k == "enabled") config_.logging.enabled = parse_bool(v, config_.logging.enabled);
        else if (k == "level") config_.logging.level = log_level_from_string(v, config_.logging.level);
        else if (k == "file") config_.logging.file = v;
        return;
    }

    if (sec == "extract") {
        if (k == "overwrite") config_.extract.overwrite = parse_bool(v, config_.extract.overwrite);
        return;
    }

    if (sec == "pack") {
        if (k == "split_size") config_.pack.split_size = parse_u64(v, config_.pack.split_size);
        else if (k == "verbose") config_.pack.verbose = parse_bool(v, config_.pack.verbose);
        return;
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Strip comments (# or ;): cut at first occurrence.
        auto hash = line.find('#');
        auto semi = line.find(';');
        std::size_t cut = std::string::npos;
        if (hash != std::string::npos) cut = hash;
        if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }

    loaded_from_path_ = path;
    return true;
}

} // namespace d2pak::core
