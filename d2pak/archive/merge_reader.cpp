#include "merge_reader.hpp"

#include "link_resolver.hpp"

#include <d2pak/core/byte_stream.hpp>
#include <d2pak/core/logger.hpp>
#include <d2pak/format/pak_codec.hpp>

#include <deque>
#include <fstream>
#include <set>
#include <unordered_set>

namespace d2pak::archive {

using core::LogLevel;
using core::logf;

std::unique_ptr<std::istream> open_file_stream(const std::filesystem::path& path) {
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!file->is_open()) {
        return nullptr;
    }
    return file;
}

// ---------------------------------------------------------------------------
// SegmentHandle
// ---------------------------------------------------------------------------

SegmentHandle::SegmentHandle(std::filesystem::path path, std::unique_ptr<std::istream> stream)
    : path_(std::move(path))
    , stream_(std::move(stream)) {}

bool SegmentHandle::read_at(std::uint64_t offset, std::uint64_t size, std::vector<std::uint8_t>* out,
                            Error* outError) {
    std::lock_guard lock(mutex_);

    StreamReader reader(*stream_);

    // Sizes come from the chunk table; check them before allocating.
    std::uint64_t len = 0;
    if (!reader.length(&len, outError)) {
        return false;
    }
    if (offset > len || size > len - offset) {
        return fail(outError, ErrorCode::TruncatedStream,
                    path_.generic_string() + ": " + std::to_string(size) + " bytes at " +
                    std::to_string(offset) + " run past the " + std::to_string(len) + "-byte segment");
    }

    if (!reader.seek(offset, outError)) {
        return false;
    }

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    if (!reader.read_bytes(data.data(), data.size(), outError)) {
        return false;
    }

    *out = std::move(data);
    return true;
}

// ---------------------------------------------------------------------------
// MergedChunk
// ---------------------------------------------------------------------------

MergedChunk::MergedChunk(std::uint64_t offset, std::uint64_t size, std::shared_ptr<SegmentHandle> segment)
    : offset_(offset)
    , size_(size)
    , segment_(std::move(segment)) {}

std::optional<std::vector<std::uint8_t>> MergedChunk::data(Error* outError) const {
    std::vector<std::uint8_t> bytes;
    if (size_ == 0) {
        return bytes;  // Empty file.
    }

    if (!segment_->read_at(offset_, size_, &bytes, outError)) {
        return std::nullopt;
    }
    return bytes;
}

// ---------------------------------------------------------------------------
// MergeReader
// ---------------------------------------------------------------------------

MergeReader::MergeReader() = default;

MergeReader::~MergeReader() = default;

MergeReader::MergeReader(MergeReader&& other) noexcept
    : initialPath_(std::move(other.initialPath_))
    , segments_(std::move(other.segments_))
    , chunks_(std::move(other.chunks_))
    , properties_(std::move(other.properties_)) {
    other.close();
}

MergeReader& MergeReader::operator=(MergeReader&& other) noexcept {
    if (this != &other) {
        initialPath_ = std::move(other.initialPath_);
        segments_ = std::move(other.segments_);
        chunks_ = std::move(other.chunks_);
        properties_ = std::move(other.properties_);
        other.close();
    }
    return *this;
}

bool MergeReader::open(const std::filesystem::path& initialPath, Error* outError) {
    return merge(initialPath, &open_file_stream, outError);
}

bool MergeReader::merge(const std::filesystem::path& initialPath, const StreamFactory& factory,
                        Error* outError) {
    close();

    if (!factory) {
        return fail(outError, ErrorCode::InvalidArgument, "stream factory is empty");
    }

    ChunkMap chunks;
    PropertyMap properties;
    std::vector<std::filesystem::path> loaded;

    std::deque<std::filesystem::path> pending;
    pending.push_back(initialPath);

    // A link back to an already merged segment would otherwise loop forever.
    std::unordered_set<std::string> visited;

    while (!pending.empty()) {
        std::filesystem::path segmentPath = std::move(pending.front());
        pending.pop_front();

        const std::string key = segmentPath.lexically_normal().generic_string();
        if (!visited.insert(key).second) {
            logf(LogLevel::Warn, "merge", "%s is linked again, skipping (cyclic chain)",
                 segmentPath.generic_string().c_str());
            continue;
        }

        std::unique_ptr<std::istream> stream = factory(segmentPath);
        if (!stream) {
            logf(LogLevel::Error, "merge", "cannot open segment %s", segmentPath.generic_string().c_str());
            return fail(outError, ErrorCode::IoFailure, "cannot open segment " + segmentPath.generic_string());
        }

        format::Segment segment;
        Error err;
        if (!format::load_segment(*stream, &segment, &err)) {
            err.message = segmentPath.generic_string() + ": " + err.message;
            logf(LogLevel::Error, "merge", "%s", err.to_string().c_str());
            if (outError) *outError = std::move(err);
            return false;
        }

        auto handle = std::make_shared<SegmentHandle>(segmentPath, std::move(stream));

        for (auto& [name, chunk] : segment.chunks) {
            if (chunk.offset < 0 || chunk.size < 0) {
                logf(LogLevel::Error, "merge", "%s: chunk \"%s\" has negative offset or size",
                     segmentPath.generic_string().c_str(), name.c_str());
                return fail(outError, ErrorCode::TruncatedStream,
                            segmentPath.generic_string() + ": chunk \"" + name +
                            "\" has negative offset or size");
            }

            MergedChunk merged(segment.info.offset + static_cast<std::uint64_t>(chunk.offset),
                               static_cast<std::uint64_t>(chunk.size), handle);
            chunks.insert_or_assign(name, std::move(merged));
        }

        for (auto& [propKey, prop] : segment.properties) {
            if (propKey == format::PAK_LINK_PROPERTY) {
                std::filesystem::path next = resolve_link(initialPath, prop.value);
                logf(LogLevel::Debug, "merge", "%s links to %s", segmentPath.generic_string().c_str(),
                     next.generic_string().c_str());
                pending.push_back(std::move(next));
            }
            properties.insert_or_assign(propKey, std::move(prop.value));
        }

        logf(LogLevel::Debug, "merge", "loaded %s (%zu chunks, %zu properties, data at %llu)",
             segmentPath.generic_string().c_str(), segment.chunks.size(), segment.properties.size(),
             static_cast<unsigned long long>(segment.info.offset));

        loaded.push_back(std::move(segmentPath));
    }

    initialPath_ = initialPath;
    segments_ = std::move(loaded);
    chunks_ = std::move(chunks);
    properties_ = std::move(properties);

    logf(LogLevel::Info, "merge", "merged %s: %zu segments, %zu files",
         initialPath_.generic_string().c_str(), segments_.size(), chunks_.size());
    return true;
}

void MergeReader::close() {
    chunks_.clear();
    properties_.clear();
    segments_.clear();
    initialPath_.clear();
}

std::optional<std::vector<std::uint8_t>> MergeReader::read_file(const std::string& fullFileName,
                                                                Error* outError) const {
    const MergedChunk* chunk = get_chunk(fullFileName);
    if (!chunk) {
        fail(outError, ErrorCode::NotFound, "\"" + fullFileName + "\" is not in the archive");
        return std::nullopt;
    }
    return chunk->data(outError);
}

bool MergeReader::has_file(const std::string& fullFileName) const {
    return chunks_.find(fullFileName) != chunks_.end();
}

const MergedChunk* MergeReader::get_chunk(const std::string& fullFileName) const {
    auto it = chunks_.find(fullFileName);
    if (it == chunks_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<std::string> MergeReader::property(const std::string& key) const {
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> MergeReader::list_directory(const std::string& dirPath) const {
    std::string prefix = dirPath;
    while (!prefix.empty() && prefix.front() == '/') {
        prefix.erase(0, 1);
    }
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += '/';
    }

    std::set<std::string> children;
    for (const auto& [name, chunk] : chunks_) {
        if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        // Sub-directories keep their trailing '/'.
        const auto slash = name.find('/', prefix.size());
        const auto end = slash == std::string::npos ? name.size() : slash + 1;
        children.insert(name.substr(prefix.size(), end - prefix.size()));
    }

    return {children.begin(), children.end()};
}

} // namespace d2pak::archive
