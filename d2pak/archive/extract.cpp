#include "extract.hpp"

#include <d2pak/core/logger.hpp>

#include <fstream>

namespace d2pak::archive {

using core::LogLevel;
using core::logf;

std::optional<std::filesystem::path> extraction_path(const std::filesystem::path& destination,
                                                     const std::string& fullFileName) {
    // Archives written on Windows may use backslashes.
    std::string generic = fullFileName;
    for (char& c : generic) {
        if (c == '\\') c = '/';
    }

    const std::filesystem::path relative(generic);
    if (generic.empty() || relative.is_absolute() || relative.has_root_name() || generic.front() == '/') {
        return std::nullopt;
    }

    for (const auto& part : relative) {
        if (part == "..") {
            return std::nullopt;
        }
    }

    return destination / relative;
}

std::optional<std::size_t> extract(const MergeReader& reader, const std::filesystem::path& destination,
                                   const ExtractOptions& options, Error* outError) {
    std::size_t written = 0;

    for (const auto& [name, chunk] : reader.chunks()) {
        const auto output = extraction_path(destination, name);
        if (!output) {
            logf(LogLevel::Error, "extract", "refusing to extract \"%s\" outside %s", name.c_str(),
                 destination.generic_string().c_str());
            fail(outError, ErrorCode::IoFailure, "\"" + name + "\" escapes the destination directory");
            return std::nullopt;
        }

        std::error_code ec;
        if (!options.overwrite && std::filesystem::exists(*output, ec)) {
            fail(outError, ErrorCode::IoFailure, output->generic_string() + " already exists");
            return std::nullopt;
        }

        std::filesystem::create_directories(output->parent_path(), ec);
        if (ec) {
            fail(outError, ErrorCode::IoFailure,
                 "cannot create " + output->parent_path().generic_string() + ": " + ec.message());
            return std::nullopt;
        }

        auto data = chunk.data(outError);
        if (!data) {
            if (outError) outError->message = "\"" + name + "\": " + outError->message;
            return std::nullopt;
        }

        std::ofstream file(*output, std::ios::binary | std::ios::trunc);
        if (!file) {
            fail(outError, ErrorCode::IoFailure, "cannot create " + output->generic_string());
            return std::nullopt;
        }
        file.write(reinterpret_cast<const char*>(data->data()), static_cast<std::streamsize>(data->size()));
        if (!file) {
            fail(outError, ErrorCode::IoFailure, "write failed for " + output->generic_string());
            return std::nullopt;
        }

        ++written;
        logf(LogLevel::Trace, "extract", "%s (%zu bytes)", name.c_str(), data->size());
        if (options.onFile) {
            options.onFile(name, data->size());
        }
    }

    return written;
}

} // namespace d2pak::archive
