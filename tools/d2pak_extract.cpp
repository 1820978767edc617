// d2pak_extract - CLI tool for extracting (possibly split) .d2p archives.
//
// Usage:
//   d2pak_extract [options] <archive.d2p> <destination>
//   d2pak_extract --list <archive.d2p> [directory]
//
// Options:
//   --config, -c <file>   INI configuration ([logging], [extract]).
//   --list, -l            List files and sizes instead of extracting. With a
//                         directory, list only its direct entries.
//   --verbose, -v         Print files being written.
//   --help, -h            Show this help message.

#include <d2pak/archive/extract.hpp>
#include <d2pak/archive/merge_reader.hpp>
#include <d2pak/core/config.hpp>
#include <d2pak/core/logger.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using d2pak::core::LogLevel;
using d2pak::core::logf;

struct Options {
    fs::path archive;
    fs::path destination;
    std::string listDirectory;
    std::string configFile;
    bool list{false};
    bool verbose{false};
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <archive.d2p> <destination>\n"
              << "       " << program << " --list <archive.d2p> [directory]\n"
              << "\n"
              << "Options:\n"
              << "  --config, -c <file>   INI configuration ([logging], [extract]).\n"
              << "  --list, -l            List files and sizes (optionally of one directory).\n"
              << "  --verbose, -v         Print files being written.\n"
              << "  --help, -h            Show this help message.\n";
}

bool parse_args(int argc, char* argv[], Options& opts) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return false;
        } else if (arg == "--config" || arg == "-c") {
            if (++i >= argc) {
                std::cerr << "Error: --config requires a file path.\n";
                return false;
            }
            opts.configFile = argv[i];
        } else if (arg == "--list" || arg == "-l") {
            opts.list = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    const bool valid = opts.list ? (positional.size() == 1 || positional.size() == 2) : positional.size() == 2;
    if (!valid) {
        std::cerr << "Error: expected "
                  << (opts.list ? "<archive.d2p> [directory]" : "<archive.d2p> <destination>") << ".\n";
        print_usage(argv[0]);
        return false;
    }

    opts.archive = positional[0];
    if (opts.list) {
        if (positional.size() == 2) {
            opts.listDirectory = positional[1];
        }
    } else {
        opts.destination = positional[1];
    }
    return true;
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

    d2pak::Error err;
    d2pak::archive::MergeReader reader;
    if (!reader.open(opts.archive, &err)) {
        std::cerr << "Error: Cannot open archive " << opts.archive << ": " << err.to_string() << "\n";
        return 1;
    }

    if (opts.list && !opts.listDirectory.empty()) {
        std::string prefix = opts.listDirectory;
        while (!prefix.empty() && prefix.front() == '/') {
            prefix.erase(0, 1);
        }
        if (!prefix.empty() && prefix.back() != '/') {
            prefix += '/';
        }

        const auto entries = reader.list_directory(opts.listDirectory);
        for (const auto& entry : entries) {
            if (entry.back() == '/') {
                std::cout << "-\t" << entry << "\n";
            } else {
                std::cout << reader.get_chunk(prefix + entry)->size() << "\t" << entry << "\n";
            }
        }
        std::cout << entries.size() << " entries in " << opts.listDirectory << "\n";
        return 0;
    }

    if (opts.list) {
        std::vector<std::string> names;
        names.reserve(reader.size());
        for (const auto& [name, chunk] : reader.chunks()) {
            names.push_back(name);
        }
        std::sort(names.begin(), names.end());

        for (const auto& name : names) {
            std::cout << reader.get_chunk(name)->size() << "\t" << name << "\n";
        }
        std::cout << names.size() << " files in " << reader.segment_count() << " segment(s)\n";
        return 0;
    }

    logf(LogLevel::Info, "extract", "extracting %zu files into %s", reader.size(),
         opts.destination.generic_string().c_str());

    std::uint64_t totalSize = 0;

    d2pak::archive::ExtractOptions extractOpts;
    extractOpts.overwrite = config.extract().overwrite;
    extractOpts.onFile = [&](const std::string& name, std::uint64_t size) {
        totalSize += size;
        if (opts.verbose) {
            std::cout << name << "\n";
        }
    };

    auto written = d2pak::archive::extract(reader, opts.destination, extractOpts, &err);
    if (!written) {
        std::cerr << "Error: Extraction failed: " << err.to_string() << "\n";
        return 1;
    }

    // Report.
    std::cout << "Extracted " << *written << " files from " << reader.segment_count()
              << " segment(s) into " << opts.destination << "\n";
    std::cout << "  Total size: " << (totalSize / 1024) << " KB\n";

    return 0;
}
