#pragma once

#include "pak_format.hpp"

#include <d2pak/core/error.hpp>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace d2pak::format {

// D2P segment writer.
// Layout produced: header, chunk data, chunk table, property table, Info.
class SegmentWriter {
public:
    SegmentWriter();
    ~SegmentWriter();

    // Non-copyable.
    SegmentWriter(const SegmentWriter&) = delete;
    SegmentWriter& operator=(const SegmentWriter&) = delete;

    // Begin writing to a new segment file.
    bool begin(const std::filesystem::path& segmentPath, Error* outError = nullptr);

    // Add a file to the segment.
    // @param archivePath  Logical path inside the archive (e.g., "gfx/items/1.png").
    // @param data         File contents.
    bool add_file(const std::string& archivePath, std::span<const std::uint8_t> data,
                  Error* outError = nullptr);

    // Add a file from disk.
    bool add_file_from_disk(const std::string& archivePath, const std::filesystem::path& sourcePath,
                            Error* outError = nullptr);

    // Set a property (replaces an existing key). Use PAK_LINK_PROPERTY to chain segments.
    bool set_property(const std::string& key, const std::string& value, Error* outError = nullptr);

    // Write chunk table, property table and Info, then close the file.
    bool finalize(Error* outError = nullptr);

    // Cancel and remove incomplete segment.
    void cancel();

    std::uint32_t file_count() const { return static_cast<std::uint32_t>(entries_.size()); }

    // Bytes of chunk data written so far.
    std::uint64_t data_size() const { return currentOffset_ - PAK_HEADER_SIZE; }

private:
    std::filesystem::path outputPath_;
    FILE* file_{nullptr};
    std::vector<Chunk> entries_;
    std::vector<Property> properties_;
    std::uint64_t currentOffset_{PAK_HEADER_SIZE};  // Start after header
    bool finalized_{false};
};

// Builds a complete segment in memory with the same layout as SegmentWriter.
bool encode_segment(const std::vector<std::pair<std::string, std::vector<std::uint8_t>>>& files,
                    const std::vector<Property>& properties,
                    std::vector<std::uint8_t>* outBytes,
                    Error* outError = nullptr);

} // namespace d2pak::format
