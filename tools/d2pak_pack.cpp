// d2pak_pack - CLI tool for packing a directory into .d2p segments.
//
// Usage:
//   d2pak_pack --input <dir> --output <file.d2p> [options]
//
// Options:
//   --input, -i <dir>       Source directory.
//   --output, -o <file>     First segment path. Further segments are named
//                           <stem>1<ext>, <stem>2<ext>, ... next to it.
//   --split <bytes>         Start a new linked segment when the data region
//                           would exceed this size (0 = single segment).
//   --property <key=value>  Property written to the first segment (repeatable).
//   --exclude <pattern>     Pattern for files to exclude (can be repeated).
//   --config, -c <file>     INI configuration ([logging], [pack]).
//   --verbose, -v           Print files being added.
//   --help, -h              Show this help message.

#include <d2pak/archive/link_resolver.hpp>
#include <d2pak/core/config.hpp>
#include <d2pak/core/logger.hpp>
#include <d2pak/format/pak_format.hpp>
#include <d2pak/format/segment_writer.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

using d2pak::core::LogLevel;
using d2pak::core::logf;

struct Options {
    fs::path inputDir;
    fs::path outputFile;
    std::vector<std::string> excludePatterns;
    std::vector<std::pair<std::string, std::string>> properties;
    std::optional<std::uint64_t> splitSize;
    std::string configFile;
    bool verbose{false};
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " --input <dir> --output <file.d2p> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --input, -i <dir>       Source directory.\n"
              << "  --output, -o <file>     First segment path.\n"
              << "  --split <bytes>         Maximum data bytes per segment (0 = no split).\n"
              << "  --property <key=value>  Property written to the first segment (repeatable).\n"
              << "  --exclude <pattern>     Pattern for files to exclude (can be repeated).\n"
              << "  --config, -c <file>     INI configuration ([logging], [pack]).\n"
              << "  --verbose, -v           Print files being added.\n"
              << "  --help, -h              Show this help message.\n";
}

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return false;
        } else if (arg == "--input" || arg == "-i") {
            if (++i >= argc) {
                std::cerr << "Error: --input requires a directory path.\n";
                return false;
            }
            opts.inputDir = argv[i];
        } else if (arg == "--output" || arg == "-o") {
            if (++i >= argc) {
                std::cerr << "Error: --output requires a file path.\n";
                return false;
            }
            opts.outputFile = argv[i];
        } else if (arg == "--split") {
            if (++i >= argc) {
                std::cerr << "Error: --split requires a byte count.\n";
                return false;
            }
            constexpr std::uint64_t kInvalid = ~std::uint64_t{0};
            const std::uint64_t v = d2pak::core::Config::parse_u64(argv[i], kInvalid);
            if (v == kInvalid) {
                std::cerr << "Error: --split expects a non-negative integer, got: " << argv[i] << "\n";
                return false;
            }
            opts.splitSize = v;
        } else if (arg == "--property") {
            if (++i >= argc) {
                std::cerr << "Error: --property requires key=value.\n";
                return false;
            }
            const std::string kv = argv[i];
            const auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Error: --property expects key=value, got: " << kv << "\n";
                return false;
            }
            if (kv.substr(0, eq) == d2pak::format::PAK_LINK_PROPERTY) {
                std::cerr << "Error: the \"link\" property is reserved for segment chaining.\n";
                return false;
            }
            opts.properties.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
        } else if (arg == "--exclude") {
            if (++i >= argc) {
                std::cerr << "Error: --exclude requires a pattern.\n";
                return false;
            }
            opts.excludePatterns.push_back(argv[i]);
        } else if (arg == "--config" || arg == "-c") {
            if (++i >= argc) {
                std::cerr << "Error: --config requires a file path.\n";
                return false;
            }
            opts.configFile = argv[i];
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return false;
        }
    }

    if (opts.inputDir.empty()) {
        std::cerr << "Error: --input is required.\n";
        return false;
    }
    if (opts.outputFile.empty()) {
        std::cerr << "Error: --output is required.\n";
        return false;
    }

    return true;
}

bool matches_pattern(const std::string& filename, const std::string& pattern) {
    if (pattern.empty()) {
        return false;
    }

    if (pattern[0] == '*') {
        std::string suffix = pattern.substr(1);
        if (filename.length() >= suffix.length()) {
            return filename.compare(filename.length() - suffix.length(), suffix.length(), suffix) == 0;
        }
        return false;
    }

    return filename == pattern;
}

bool should_exclude(const std::string& relativePath, const std::vector<std::string>& patterns) {
    fs::path p(relativePath);
    std::string filename = p.filename().string();

    for (const auto& pattern : patterns) {
        if (matches_pattern(filename, pattern) || matches_pattern(relativePath, pattern)) {
            return true;
        }
    }
    return false;
}

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        return 1;
    }

    auto& config = d2pak::core::Config::instance();
    if (!opts.configFile.empty() && !config.load_from_file(opts.configFile)) {
        std::cerr << "Error: Cannot read config file: " << opts.configFile << "\n";
        return 1;
    }
    d2pak::core::LogSession logSession(config.logging());

    const std::uint64_t splitSize = opts.splitSize.value_or(config.pack().split_size);
    const bool verbose = opts.verbose || config.pack().verbose;

    std::error_code ec;
    if (!fs::is_directory(opts.inputDir, ec) || ec) {
        std::cerr << "Error: Input directory does not exist: " << opts.inputDir << "\n";
        return 1;
    }

    struct FileEntry {
        fs::path absolutePath;
        std::string archivePath;
        std::uint64_t size{0};
    };
    std::vector<FileEntry> files;

    for (const auto& entry : fs::recursive_directory_iterator(opts.inputDir, ec)) {
        if (ec) {
            std::cerr << "Error iterating directory: " << ec.message() << "\n";
            return 1;
        }

        if (!entry.is_regular_file()) {
            continue;
        }

        fs::path relativePath = fs::relative(entry.path(), opts.inputDir, ec);
        if (ec) {
            continue;
        }

        std::string archivePath = relativePath.generic_string();

        if (should_exclude(archivePath, opts.excludePatterns)) {
            if (verbose) {
                std::cout << "Excluding: " << archivePath << "\n";
            }
            continue;
        }

        const auto size = entry.file_size(ec);
        if (ec) {
            std::cerr << "Error: Cannot stat " << entry.path() << ": " << ec.message() << "\n";
            return 1;
        }

        files.push_back({entry.path(), archivePath, size});
    }

    if (files.empty()) {
        std::cerr << "Error: No files to pack.\n";
        return 1;
    }

    std::sort(files.begin(), files.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.archivePath < b.archivePath; });

    fs::path outputDir = opts.outputFile.parent_path();
    if (!outputDir.empty() && !fs::exists(outputDir, ec)) {
        fs::create_directories(outputDir, ec);
        if (ec) {
            std::cerr << "Error: Cannot create output directory: " << ec.message() << "\n";
            return 1;
        }
    }

    d2pak::Error err;
    std::vector<fs::path> written;

    // Segments are written one after another; each is finalized before the next begins.
    d2pak::format::SegmentWriter writer;
    fs::path segmentPath = opts.outputFile;

    auto abort_all = [&](const std::string& what) {
        std::cerr << "Error: " << what << ": " << err.to_string() << "\n";
        writer.cancel();
        for (const auto& p : written) {
            std::error_code rmEc;
            fs::remove(p, rmEc);
        }
        return 1;
    };

    if (!writer.begin(segmentPath, &err)) {
        return abort_all("Cannot create output file " + segmentPath.string());
    }
    for (const auto& [key, value] : opts.properties) {
        if (!writer.set_property(key, value, &err)) {
            return abort_all("Cannot set property " + key);
        }
    }

    std::uint64_t totalSize = 0;
    std::uint32_t fileCount = 0;

    for (const auto& file : files) {
        if (splitSize > 0 && writer.data_size() > 0 && writer.data_size() + file.size > splitSize) {
            const std::string nextName =
                d2pak::archive::segment_file_name(opts.outputFile, static_cast<std::uint32_t>(written.size() + 1));

            if (!writer.set_property(d2pak::format::PAK_LINK_PROPERTY, nextName, &err) ||
                !writer.finalize(&err)) {
                return abort_all("Failed to finalize segment " + segmentPath.string());
            }
            written.push_back(segmentPath);

            segmentPath = d2pak::archive::resolve_link(opts.outputFile, nextName);
            logf(LogLevel::Info, "pack", "starting segment %s", segmentPath.generic_string().c_str());
            if (!writer.begin(segmentPath, &err)) {
                return abort_all("Cannot create output file " + segmentPath.string());
            }
        }

        if (!writer.add_file_from_disk(file.archivePath, file.absolutePath, &err)) {
            return abort_all("Failed to add file " + file.archivePath);
        }

        totalSize += file.size;
        ++fileCount;

        if (verbose) {
            std::cout << file.archivePath << "\n";
        }
    }

    if (!writer.finalize(&err)) {
        return abort_all("Failed to finalize segment " + segmentPath.string());
    }
    written.push_back(segmentPath);

    // Report.
    std::uint64_t outputSize = 0;
    for (const auto& p : written) {
        const auto size = fs::file_size(p, ec);
        if (!ec) {
            outputSize += size;
        }
    }

    std::cout << "Packed " << fileCount << " files into " << written.size() << " segment(s) starting at "
              << opts.outputFile << "\n";
    std::cout << "  Input size:  " << (totalSize / 1024) << " KB\n";
    std::cout << "  Output size: " << (outputSize / 1024) << " KB\n";

    return 0;
}
