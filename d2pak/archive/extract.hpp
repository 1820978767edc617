#pragma once

#include "merge_reader.hpp"

#include <d2pak/core/error.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace d2pak::archive {

struct ExtractOptions {
    // Replace files that already exist under the destination.
    bool overwrite{true};
    // Called after each file is written.
    std::function<void(const std::string& fullFileName, std::uint64_t size)> onFile{};
};

// Logical chunk name mapped under `destination`, or nullopt if the name is
// absolute or climbs out with "..".
std::optional<std::filesystem::path> extraction_path(const std::filesystem::path& destination,
                                                     const std::string& fullFileName);

// Writes every chunk of `reader` below `destination`, recreating the logical
// directory hierarchy. Stops at the first failure.
// @return Number of files written, or nullopt on error.
std::optional<std::size_t> extract(const MergeReader& reader, const std::filesystem::path& destination,
                                   const ExtractOptions& options = {}, Error* outError = nullptr);

} // namespace d2pak::archive
