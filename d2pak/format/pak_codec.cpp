#include "pak_codec.hpp"

#include <algorithm>

namespace d2pak::format {

namespace {

// A table may not run into the next structure that starts after it:
// the other table, the data region, or the Info trailer.
// Offsets of empty tables (and of the data region when there are no chunks)
// carry no meaning and are not boundaries.
std::uint64_t table_region_end(const Info& info, std::uint64_t tableOffset, std::uint64_t streamLength) {
    std::uint64_t end = streamLength;
    if (streamLength >= PAK_INFO_SIZE && tableOffset <= streamLength - PAK_INFO_SIZE) {
        end = streamLength - PAK_INFO_SIZE;
    }

    auto clamp_to = [&](std::uint64_t boundary) {
        if (boundary > tableOffset && boundary < end) {
            end = boundary;
        }
    };

    if (info.chunksCount > 0) {
        clamp_to(info.chunksOffset);
        clamp_to(info.offset);
    }
    if (info.propertiesCount > 0) {
        clamp_to(info.propertiesOffset);
    }
    return end;
}

bool begin_table(StreamReader& reader, const Info& info, std::uint64_t tableOffset,
                 const char* what, Error* outError) {
    std::uint64_t len = 0;
    if (!reader.length(&len, outError)) return false;

    if (!reader.seek(tableOffset, outError)) {
        if (outError) outError->message = std::string(what) + " table: " + outError->message;
        return false;
    }

    reader.set_limit(table_region_end(info, tableOffset, len));
    return true;
}

// Counts come from the file; do not trust them for allocation.
constexpr std::size_t kMaxReserve = 4096;

std::size_t reserve_hint(std::int32_t count) {
    return std::min(static_cast<std::size_t>(count), kMaxReserve);
}

std::uint64_t to_offset(std::int32_t raw) {
    // Offsets are stored as i32 but address up to 4 GiB.
    return static_cast<std::uint64_t>(static_cast<std::uint32_t>(raw));
}

} // namespace

bool validate_header(std::istream& in, Error* outError) {
    StreamReader reader(in);

    std::uint8_t b0 = 0;
    std::uint8_t b1 = 0;
    Error ignored;
    if (!reader.read_u8(&b0, &ignored) || !reader.read_u8(&b1, &ignored)) {
        return fail(outError, ErrorCode::CorruptHeader, "stream ends before the 2-byte header");
    }

    if (b0 != PAK_HEADER_BYTE_0 || b1 != PAK_HEADER_BYTE_1) {
        return fail(outError, ErrorCode::CorruptHeader,
                    "expected header bytes (2, 1), found (" + std::to_string(b0) + ", " +
                    std::to_string(b1) + ")");
    }
    return true;
}

void write_header(ByteWriter& out) {
    out.write_u8(PAK_HEADER_BYTE_0);
    out.write_u8(PAK_HEADER_BYTE_1);
}

bool read_info(std::istream& in, Info* outInfo, Error* outError) {
    StreamReader reader(in);
    if (!reader.seek_from_end(PAK_INFO_SIZE, outError)) {
        return false;
    }

    std::int32_t offset = 0;
    std::int32_t chunksOffset = 0;
    std::int32_t propertiesOffset = 0;

    Info info;
    if (!reader.read_i32(&offset, outError) ||
        !reader.read_i32(&info.size, outError) ||
        !reader.read_i32(&chunksOffset, outError) ||
        !reader.read_i32(&info.chunksCount, outError) ||
        !reader.read_i32(&propertiesOffset, outError) ||
        !reader.read_i32(&info.propertiesCount, outError)) {
        return false;
    }

    info.offset = to_offset(offset);
    info.chunksOffset = to_offset(chunksOffset);
    info.propertiesOffset = to_offset(propertiesOffset);

    *outInfo = info;
    return true;
}

void write_info(ByteWriter& out, const Info& info) {
    out.write_i32(static_cast<std::int32_t>(info.offset));
    out.write_i32(info.size);
    out.write_i32(static_cast<std::int32_t>(info.chunksOffset));
    out.write_i32(info.chunksCount);
    out.write_i32(static_cast<std::int32_t>(info.propertiesOffset));
    out.write_i32(info.propertiesCount);
}

bool read_property(StreamReader& reader, Property* outProperty, Error* outError) {
    Property prop;
    if (!reader.read_string(&prop.key, outError)) return false;
    if (!reader.read_string(&prop.value, outError)) return false;
    *outProperty = std::move(prop);
    return true;
}

bool write_property(ByteWriter& out, const Property& property, Error* outError) {
    return out.write_string(property.key, outError) && out.write_string(property.value, outError);
}

bool read_chunk(StreamReader& reader, Chunk* outChunk, Error* outError) {
    Chunk chunk;
    if (!reader.read_string(&chunk.fullFileName, outError)) return false;
    if (!reader.read_i32(&chunk.offset, outError)) return false;
    if (!reader.read_i32(&chunk.size, outError)) return false;
    *outChunk = std::move(chunk);
    return true;
}

bool write_chunk(ByteWriter& out, const Chunk& chunk, Error* outError) {
    if (!out.write_string(chunk.fullFileName, outError)) {
        return false;
    }
    out.write_i32(chunk.offset);
    out.write_i32(chunk.size);
    return true;
}

bool read_properties(std::istream& in, const Info& info, PropertyMap* outProperties, Error* outError) {
    PropertyMap properties;
    const std::int32_t count = info.propertiesCount > 0 ? info.propertiesCount : 0;
    if (count == 0) {
        *outProperties = std::move(properties);
        return true;
    }

    StreamReader reader(in);
    if (!begin_table(reader, info, info.propertiesOffset, "property", outError)) {
        return false;
    }

    properties.reserve(reserve_hint(count));

    for (std::int32_t i = 0; i < count; ++i) {
        Property prop;
        if (!read_property(reader, &prop, outError)) {
            if (outError) {
                outError->message = "property " + std::to_string(i) + "/" + std::to_string(count) +
                                    ": " + outError->message;
            }
            return false;
        }
        std::string key = prop.key;
        properties[std::move(key)] = std::move(prop);
    }

    *outProperties = std::move(properties);
    return true;
}

bool read_chunks(std::istream& in, const Info& info, ChunkMap* outChunks, Error* outError) {
    ChunkMap chunks;
    const std::int32_t count = info.chunksCount > 0 ? info.chunksCount : 0;
    if (count == 0) {
        *outChunks = std::move(chunks);
        return true;
    }

    StreamReader reader(in);
    if (!begin_table(reader, info, info.chunksOffset, "chunk", outError)) {
        return false;
    }

    chunks.reserve(reserve_hint(count));

    for (std::int32_t i = 0; i < count; ++i) {
        Chunk chunk;
        if (!read_chunk(reader, &chunk, outError)) {
            if (outError) {
                outError->message = "chunk " + std::to_string(i) + "/" + std::to_string(count) +
                                    ": " + outError->message;
            }
            return false;
        }
        std::string name = chunk.fullFileName;
        chunks[std::move(name)] = std::move(chunk);
    }

    *outChunks = std::move(chunks);
    return true;
}

bool load_segment(std::istream& in, Segment* outSegment, Error* outError) {
    Segment segment;

    if (!validate_header(in, outError)) return false;
    if (!read_info(in, &segment.info, outError)) return false;
    if (!read_chunks(in, segment.info, &segment.chunks, outError)) return false;
    if (!read_properties(in, segment.info, &segment.properties, outError)) return false;

    *outSegment = std::move(segment);
    return true;
}

} // namespace d2pak::format
