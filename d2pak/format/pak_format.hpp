#pragma once

// D2P archive format (Pak Protocol 2)
//
// Uncompressed archive of named byte blobs. A logical archive may be split
// into several segment files; a segment names the next one through the
// reserved "link" property. All integers are big-endian.
//
// Layout of one segment:
// ┌─────────────────────────────────────┐
// │ Header (2 bytes, offset 0)          │
// │   u8 = 2, u8 = 1                    │
// ├─────────────────────────────────────┤
// │ Chunk data (variable)               │
// │   starts at Info.offset             │
// ├─────────────────────────────────────┤
// │ Chunk table (at Info.chunksOffset)  │
// │   For each chunk:                   │
// │     name_len    : u16               │
// │     name        : utf8[name_len]    │
// │     offset      : i32 (data-rel.)   │
// │     size        : i32               │
// ├─────────────────────────────────────┤
// │ Property table (at Info.propsOffset)│
// │   For each property:                │
// │     key_len, key, val_len, val      │
// ├─────────────────────────────────────┤
// │ Info (last 24 bytes)                │
// │   offset, size, chunks_offset,      │
// │   chunks_count, properties_offset,  │
// │   properties_count : i32 each       │
// └─────────────────────────────────────┘
//
// Table positions are absolute; readers must not assume the order above.

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace d2pak::format {

constexpr std::uint8_t PAK_HEADER_BYTE_0 = 2;
constexpr std::uint8_t PAK_HEADER_BYTE_1 = 1;

constexpr std::size_t PAK_HEADER_SIZE = 2;

// Info trailer, read from end of stream.
constexpr std::size_t PAK_INFO_SIZE = 24;

// Property whose value names the next segment.
constexpr const char* PAK_LINK_PROPERTY = "link";

constexpr const char* PAK_DEFAULT_EXTENSION = ".d2p";

struct Info {
    // Base for all chunk data in this segment.
    std::uint64_t offset{0};
    // Declared size of the data region. Informational only.
    std::int32_t size{0};
    std::uint64_t chunksOffset{0};
    std::int32_t chunksCount{0};
    std::uint64_t propertiesOffset{0};
    std::int32_t propertiesCount{0};

    bool operator==(const Info&) const = default;
};

struct Property {
    std::string key;
    std::string value;

    bool operator==(const Property&) const = default;
};

struct Chunk {
    std::string fullFileName;
    // Relative to Info::offset.
    std::int32_t offset{0};
    std::int32_t size{0};

    bool operator==(const Chunk&) const = default;
};

using PropertyMap = std::unordered_map<std::string, Property>;
using ChunkMap = std::unordered_map<std::string, Chunk>;

// One parsed segment: footer plus both tables.
struct Segment {
    Info info;
    ChunkMap chunks;
    PropertyMap properties;
};

} // namespace d2pak::format
