/**
 * @file test_pak_codec.cpp
 * @brief Unit tests for D2P header, Info trailer and table decoding.
 *
 * Segments are assembled byte by byte here so that layouts the writer never
 * produces (tables before data, bad counts) are covered too.
 */

#include <catch2/catch_test_macros.hpp>

#include <d2pak/format/pak_codec.hpp>

#include "helpers/test_utils.hpp"

#include <sstream>

using namespace d2pak;
using namespace d2pak::format;
using test_helpers::as_stream_data;

namespace {

std::istringstream stream_of(const std::vector<std::uint8_t>& data) {
    return std::istringstream(as_stream_data(data), std::ios::in | std::ios::binary);
}

std::vector<std::uint8_t> encode_property(const Property& p) {
    ByteWriter w;
    REQUIRE(write_property(w, p, nullptr));
    return w.take();
}

std::vector<std::uint8_t> encode_chunk(const Chunk& c) {
    ByteWriter w;
    REQUIRE(write_chunk(w, c, nullptr));
    return w.take();
}

// Header, then "abcdef" as data, then the property table, then the chunk
// table, then Info. Property table sits before the chunk table on purpose.
struct PropsFirstSegment {
    std::vector<std::uint8_t> bytes;
    Info info;
};

PropsFirstSegment props_first_segment(const std::vector<Property>& props,
                                      const std::vector<Chunk>& chunks,
                                      std::int32_t declaredPropertyCount) {
    ByteWriter w;
    write_header(w);
    w.write_bytes(test_helpers::bytes("abcdef"));

    PropsFirstSegment seg;
    seg.info.offset = PAK_HEADER_SIZE;
    seg.info.size = 6;
    seg.info.propertiesOffset = w.size();
    seg.info.propertiesCount = declaredPropertyCount;
    for (const auto& p : props) {
        w.write_bytes(encode_property(p));
    }

    seg.info.chunksOffset = w.size();
    seg.info.chunksCount = static_cast<std::int32_t>(chunks.size());
    for (const auto& c : chunks) {
        w.write_bytes(encode_chunk(c));
    }

    write_info(w, seg.info);
    seg.bytes = w.take();
    return seg;
}

} // namespace

// =============================================================================
// Header
// =============================================================================

TEST_CASE("validate_header accepts (2, 1)", "[format][header]") {
    auto in = stream_of({2, 1, 0xFF});
    Error err;
    REQUIRE(validate_header(in, &err));
    REQUIRE(in.tellg() == 2);
}

TEST_CASE("validate_header rejects anything else", "[format][header]") {
    Error err;

    SECTION("reversed bytes") {
        auto in = stream_of({1, 2});
        REQUIRE_FALSE(validate_header(in, &err));
        REQUIRE(err.code == ErrorCode::CorruptHeader);
    }

    SECTION("first byte right, second wrong") {
        auto in = stream_of({2, 2});
        REQUIRE_FALSE(validate_header(in, &err));
        REQUIRE(err.code == ErrorCode::CorruptHeader);
    }

    SECTION("first byte wrong, second right") {
        auto in = stream_of({3, 1});
        REQUIRE_FALSE(validate_header(in, &err));
        REQUIRE(err.code == ErrorCode::CorruptHeader);
    }

    SECTION("one byte only") {
        auto in = stream_of({2});
        REQUIRE_FALSE(validate_header(in, &err));
        REQUIRE(err.code == ErrorCode::CorruptHeader);
    }

    SECTION("empty stream") {
        auto in = stream_of({});
        REQUIRE_FALSE(validate_header(in, &err));
        REQUIRE(err.code == ErrorCode::CorruptHeader);
    }
}

TEST_CASE("write_header emits the magic pair", "[format][header]") {
    ByteWriter w;
    write_header(w);
    REQUIRE(w.take() == std::vector<std::uint8_t>{2, 1});
}

// =============================================================================
// Info trailer
// =============================================================================

TEST_CASE("read_info reads the last 24 bytes in field order", "[format][info]") {
    ByteWriter w;
    w.write_bytes(test_helpers::bytes("garbage before the trailer"));
    w.write_i32(2);
    w.write_i32(100);
    w.write_i32(102);
    w.write_i32(3);
    w.write_i32(150);
    w.write_i32(1);

    auto in = stream_of(w.take());
    Info info;
    Error err;
    REQUIRE(read_info(in, &info, &err));

    REQUIRE(info.offset == 2);
    REQUIRE(info.size == 100);
    REQUIRE(info.chunksOffset == 102);
    REQUIRE(info.chunksCount == 3);
    REQUIRE(info.propertiesOffset == 150);
    REQUIRE(info.propertiesCount == 1);
}

TEST_CASE("read_info promotes offsets as unsigned", "[format][info]") {
    ByteWriter w;
    w.write_u32(0x80000010u);
    w.write_i32(0);
    w.write_u32(0xFFFFFFF0u);
    w.write_i32(0);
    w.write_u32(0x90000000u);
    w.write_i32(0);

    auto in = stream_of(w.take());
    Info info;
    REQUIRE(read_info(in, &info, nullptr));
    REQUIRE(info.offset == 0x80000010ull);
    REQUIRE(info.chunksOffset == 0xFFFFFFF0ull);
    REQUIRE(info.propertiesOffset == 0x90000000ull);
}

TEST_CASE("read_info fails on streams shorter than the trailer", "[format][info]") {
    auto in = stream_of(std::vector<std::uint8_t>(23, 0));
    Info info;
    Error err;
    REQUIRE_FALSE(read_info(in, &info, &err));
    REQUIRE(err.code == ErrorCode::TruncatedStream);
}

TEST_CASE("Info round-trips through write_info", "[format][info]") {
    Info original;
    original.offset = 2;
    original.size = 4096;
    original.chunksOffset = 4098;
    original.chunksCount = 17;
    original.propertiesOffset = 5000;
    original.propertiesCount = 2;

    ByteWriter w;
    write_info(w, original);
    REQUIRE(w.size() == PAK_INFO_SIZE);

    auto in = stream_of(w.take());
    Info decoded;
    REQUIRE(read_info(in, &decoded, nullptr));
    REQUIRE(decoded == original);
}

// =============================================================================
// Records
// =============================================================================

TEST_CASE("Property and Chunk records round-trip", "[format][records]") {
    const Property prop{"link", "monsters1.d2p"};
    const Chunk chunk{"gfx/monsters/1001.swf", 1234, 5678};

    ByteWriter w;
    REQUIRE(write_property(w, prop, nullptr));
    REQUIRE(write_chunk(w, chunk, nullptr));

    auto in = stream_of(w.take());
    StreamReader r(in);
    Property p2;
    Chunk c2;
    Error err;
    REQUIRE(read_property(r, &p2, &err));
    REQUIRE(read_chunk(r, &c2, &err));

    REQUIRE(p2 == prop);
    REQUIRE(c2 == chunk);
}

TEST_CASE("Chunk record layout", "[format][records]") {
    ByteWriter w;
    REQUIRE(write_chunk(w, Chunk{"ab", 1, -1}, nullptr));
    const std::vector<std::uint8_t> expected = {
        0x00, 0x02, 'a', 'b',
        0x00, 0x00, 0x00, 0x01,
        0xFF, 0xFF, 0xFF, 0xFF,
    };
    REQUIRE(w.take() == expected);
}

// =============================================================================
// Tables
// =============================================================================

TEST_CASE("read_properties keeps the last duplicate key", "[format][tables]") {
    auto seg = props_first_segment({{"k", "first"}, {"other", "x"}, {"k", "second"}}, {}, 3);
    auto in = stream_of(seg.bytes);

    PropertyMap props;
    Error err;
    REQUIRE(read_properties(in, seg.info, &props, &err));
    REQUIRE(props.size() == 2);
    REQUIRE(props.at("k").value == "second");
    REQUIRE(props.at("other").value == "x");
}

TEST_CASE("read_properties with an excessive count is TruncatedStream", "[format][tables]") {
    // One record present before the chunk table, two declared.
    auto seg = props_first_segment({{"name", "gfx"}}, {Chunk{"a.txt", 0, 6}}, 2);
    auto in = stream_of(seg.bytes);

    PropertyMap props;
    Error err;
    REQUIRE_FALSE(read_properties(in, seg.info, &props, &err));
    REQUIRE(err.code == ErrorCode::TruncatedStream);
    REQUIRE(props.empty());
}

TEST_CASE("An empty table's offset does not bound the other table", "[format][tables]") {
    // No chunks, and a stale chunks offset pointing into the property record.
    auto seg = props_first_segment({{"name", "gfx"}}, {}, 1);
    seg.info.chunksOffset = seg.info.propertiesOffset + 3;

    seg.bytes.resize(seg.bytes.size() - PAK_INFO_SIZE);
    ByteWriter trailer;
    write_info(trailer, seg.info);
    seg.bytes.insert(seg.bytes.end(), trailer.data().begin(), trailer.data().end());

    auto in = stream_of(seg.bytes);
    Segment out;
    Error err;
    const bool loaded = load_segment(in, &out, &err);
    INFO(err.to_string());
    REQUIRE(loaded);
    REQUIRE(out.chunks.empty());
    REQUIRE(out.properties.at("name").value == "gfx");
}

TEST_CASE("read_chunks with an excessive count stops at the Info trailer", "[format][tables]") {
    auto seg = props_first_segment({}, {Chunk{"a.txt", 0, 3}, Chunk{"b.txt", 3, 3}}, 0);
    seg.info.chunksCount = 3;

    // Rewrite the trailer with the inflated count.
    seg.bytes.resize(seg.bytes.size() - PAK_INFO_SIZE);
    ByteWriter trailer;
    write_info(trailer, seg.info);
    seg.bytes.insert(seg.bytes.end(), trailer.data().begin(), trailer.data().end());

    auto in = stream_of(seg.bytes);
    ChunkMap chunks;
    Error err;
    REQUIRE_FALSE(read_chunks(in, seg.info, &chunks, &err));
    REQUIRE(err.code == ErrorCode::TruncatedStream);
}

TEST_CASE("read_chunks fails when the table offset is outside the stream", "[format][tables]") {
    auto seg = props_first_segment({}, {Chunk{"a.txt", 0, 3}}, 0);
    seg.info.chunksOffset = seg.bytes.size() + 100;

    auto in = stream_of(seg.bytes);
    ChunkMap chunks;
    Error err;
    REQUIRE_FALSE(read_chunks(in, seg.info, &chunks, &err));
    REQUIRE(err.code == ErrorCode::TruncatedStream);
}

TEST_CASE("Empty and negative counts read no records", "[format][tables]") {
    auto seg = props_first_segment({}, {}, 0);
    seg.info.chunksCount = -4;
    seg.info.propertiesOffset = 1u << 30;  // Never sought for an empty table.

    auto in = stream_of(seg.bytes);
    ChunkMap chunks;
    PropertyMap props;
    REQUIRE(read_chunks(in, seg.info, &chunks, nullptr));
    REQUIRE(read_properties(in, seg.info, &props, nullptr));
    REQUIRE(chunks.empty());
    REQUIRE(props.empty());
}

TEST_CASE("Invalid UTF-8 in a chunk name is InvalidEncoding", "[format][tables]") {
    ByteWriter w;
    write_header(w);

    Info info;
    info.offset = PAK_HEADER_SIZE;
    info.chunksOffset = w.size();
    info.chunksCount = 1;
    w.write_u16(2);
    w.write_u8(0xC3);
    w.write_u8(0x28);
    w.write_i32(0);
    w.write_i32(0);
    info.propertiesOffset = w.size();
    write_info(w, info);

    auto in = stream_of(w.take());
    Segment seg;
    Error err;
    REQUIRE_FALSE(load_segment(in, &seg, &err));
    REQUIRE(err.code == ErrorCode::InvalidEncoding);
}

// =============================================================================
// Segment loader
// =============================================================================

TEST_CASE("load_segment parses a props-first layout", "[format][segment]") {
    auto seg = props_first_segment({{"name", "gfx"}}, {Chunk{"a.txt", 0, 3}, Chunk{"dir/b.txt", 3, 3}}, 1);
    auto in = stream_of(seg.bytes);

    Segment out;
    Error err;
    REQUIRE(load_segment(in, &out, &err));

    REQUIRE(out.info == seg.info);
    REQUIRE(out.chunks.size() == 2);
    REQUIRE(out.chunks.at("dir/b.txt").offset == 3);
    REQUIRE(out.chunks.at("dir/b.txt").size == 3);
    REQUIRE(out.properties.at("name").value == "gfx");
}

TEST_CASE("load_segment reports a reversed header before reading tables", "[format][segment]") {
    // Too short for an Info trailer: a table read would fail differently.
    auto in = stream_of({1, 2, 0, 0});
    Segment out;
    Error err;
    REQUIRE_FALSE(load_segment(in, &out, &err));
    REQUIRE(err.code == ErrorCode::CorruptHeader);
}

TEST_CASE("load_segment fails on a missing trailer", "[format][segment]") {
    auto in = stream_of({2, 1, 0, 0, 0});
    Segment out;
    Error err;
    REQUIRE_FALSE(load_segment(in, &out, &err));
    REQUIRE(err.code == ErrorCode::TruncatedStream);
}
