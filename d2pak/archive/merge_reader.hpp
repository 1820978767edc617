#pragma once

#include <d2pak/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace d2pak::archive {

// Opens a segment path as a readable, seekable stream. nullptr means the path cannot be opened.
using StreamFactory = std::function<std::unique_ptr<std::istream>(const std::filesystem::path&)>;

// Binary std::ifstream, or nullptr if the file cannot be opened.
std::unique_ptr<std::istream> open_file_stream(const std::filesystem::path& path);

// One open segment stream. Shared by every chunk stored in that segment;
// reads are serialized on the handle's mutex.
class SegmentHandle {
public:
    SegmentHandle(std::filesystem::path path, std::unique_ptr<std::istream> stream);

    SegmentHandle(const SegmentHandle&) = delete;
    SegmentHandle& operator=(const SegmentHandle&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Seek to `offset` and read exactly `size` bytes.
    bool read_at(std::uint64_t offset, std::uint64_t size, std::vector<std::uint8_t>* out,
                 Error* outError);

private:
    std::filesystem::path path_;
    std::unique_ptr<std::istream> stream_;
    std::mutex mutex_;
};

// A chunk of the merged archive. Holds its absolute position and a shared
// reference to its segment; bytes are only read by data().
class MergedChunk {
public:
    MergedChunk(std::uint64_t offset, std::uint64_t size, std::shared_ptr<SegmentHandle> segment);

    // Absolute position in the segment stream (Info.offset + chunk offset).
    std::uint64_t offset() const { return offset_; }
    std::uint64_t size() const { return size_; }

    const std::filesystem::path& segment_path() const { return segment_->path(); }

    // Seeks and reads the chunk each call; nothing is cached.
    std::optional<std::vector<std::uint8_t>> data(Error* outError = nullptr) const;

private:
    std::uint64_t offset_{0};
    std::uint64_t size_{0};
    std::shared_ptr<SegmentHandle> segment_;
};

// D2P merge reader.
// Follows the "link" chain from an initial segment and exposes every chunk and
// property of every segment as one archive. On name collisions the segment
// loaded last wins.
class MergeReader {
public:
    using ChunkMap = std::unordered_map<std::string, MergedChunk>;
    using PropertyMap = std::unordered_map<std::string, std::string>;

    MergeReader();
    ~MergeReader();

    // Non-copyable, movable.
    MergeReader(const MergeReader&) = delete;
    MergeReader& operator=(const MergeReader&) = delete;
    MergeReader(MergeReader&& other) noexcept;
    MergeReader& operator=(MergeReader&& other) noexcept;

    // Merge an archive from disk.
    // @return true on success. On failure the reader is left empty.
    bool open(const std::filesystem::path& initialPath, Error* outError = nullptr);

    // Merge an archive with a caller-supplied stream factory (in-memory streams in tests).
    // The first error aborts the whole merge; no partial archive is kept.
    bool merge(const std::filesystem::path& initialPath, const StreamFactory& factory,
               Error* outError = nullptr);

    // Release all segments not referenced by outstanding MergedChunk copies.
    void close();

    bool is_open() const { return !segments_.empty(); }

    // Initial archive path.
    const std::filesystem::path& path() const { return initialPath_; }

    // Segment paths in load order.
    const std::vector<std::filesystem::path>& segments() const { return segments_; }
    std::size_t segment_count() const { return segments_.size(); }

    // Read a file by logical name. NotFound (without any I/O) if absent.
    std::optional<std::vector<std::uint8_t>> read_file(const std::string& fullFileName,
                                                       Error* outError = nullptr) const;

    bool has_file(const std::string& fullFileName) const;
    const MergedChunk* get_chunk(const std::string& fullFileName) const;

    // Every chunk of the merged archive. Iteration order is unspecified.
    const ChunkMap& chunks() const { return chunks_; }
    std::size_t size() const { return chunks_.size(); }

    const PropertyMap& properties() const { return properties_; }
    std::optional<std::string> property(const std::string& key) const;

    // List files in a directory within the archive.
    // @param dirPath  Directory path (e.g., "gfx/"). Empty string for root.
    // @return Sorted entry names (files end without '/', dirs end with '/').
    std::vector<std::string> list_directory(const std::string& dirPath) const;

private:
    std::filesystem::path initialPath_;
    std::vector<std::filesystem::path> segments_;
    ChunkMap chunks_;
    PropertyMap properties_;
};

} // namespace d2pak::archive
