#pragma once

#include "pak_format.hpp"

#include <d2pak/core/byte_stream.hpp>
#include <d2pak/core/error.hpp>

#include <istream>

namespace d2pak::format {

// Header: reads exactly two bytes from the current position.
// Anything but (2, 1), EOF included, is CorruptHeader.
bool validate_header(std::istream& in, Error* outError);
void write_header(ByteWriter& out);

// Info trailer, read from the last 24 bytes of the stream.
// Declared offsets are not checked against the stream size here.
bool read_info(std::istream& in, Info* outInfo, Error* outError);
void write_info(ByteWriter& out, const Info& info);

// Single records at the current position.
bool read_property(StreamReader& reader, Property* outProperty, Error* outError);
bool write_property(ByteWriter& out, const Property& property, Error* outError);

bool read_chunk(StreamReader& reader, Chunk* outChunk, Error* outError);
bool write_chunk(ByteWriter& out, const Chunk& chunk, Error* outError);

// Tables: seek to the offset from `info`, then read exactly the declared count.
// Duplicate keys within one table keep the last record.
bool read_properties(std::istream& in, const Info& info, PropertyMap* outProperties, Error* outError);
bool read_chunks(std::istream& in, const Info& info, ChunkMap* outChunks, Error* outError);

// Header, info, chunk table, property table, in that order.
bool load_segment(std::istream& in, Segment* outSegment, Error* outError);

} // namespace d2pak::format
