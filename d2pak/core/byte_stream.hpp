#pragma once

#include "error.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace d2pak {

// All multi-byte integers of the format are big-endian.

// True if `s` is well-formed UTF-8 (no overlongs, surrogates or code points above U+10FFFF).
bool is_valid_utf8(std::string_view s);

// ============================================================================
// ByteWriter - Serialize data to bytes
// ============================================================================

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(std::size_t reserve) { data_.reserve(reserve); }

    // --- Primitives ---

    void write_u8(std::uint8_t v) {
        data_.push_back(v);
    }

    void write_u16(std::uint16_t v) {
        data_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>(v & 0xFF));
    }

    void write_u32(std::uint32_t v) {
        data_.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>(v & 0xFF));
    }

    void write_i32(std::int32_t v) {
        write_u32(static_cast<std::uint32_t>(v));
    }

    // --- Strings ---

    // u16 length prefix followed by the UTF-8 bytes.
    // Fails with InvalidArgument above 65535 bytes, InvalidEncoding on bad UTF-8.
    bool write_string(std::string_view s, Error* outError = nullptr);

    // --- Raw bytes ---

    void write_bytes(std::span<const std::uint8_t> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    // --- Access ---

    std::span<const std::uint8_t> data() const { return data_; }
    std::size_t size() const { return data_.size(); }
    std::vector<std::uint8_t> take() { return std::move(data_); }
    void clear() { data_.clear(); }

private:
    std::vector<std::uint8_t> data_;
};

// ============================================================================
// StreamReader - Bounds-checked cursor over a seekable std::istream
// ============================================================================

class StreamReader {
public:
    explicit StreamReader(std::istream& in) : in_(in) {}

    // --- Primitives ---
    // Each read either fully succeeds or fails; short reads are TruncatedStream.

    bool read_u8(std::uint8_t* out, Error* outError);
    bool read_u16(std::uint16_t* out, Error* outError);
    bool read_u32(std::uint32_t* out, Error* outError);
    bool read_i32(std::int32_t* out, Error* outError);

    // u16 length prefix followed by that many UTF-8 bytes.
    bool read_string(std::string* out, Error* outError);

    bool read_bytes(void* data, std::size_t size, Error* outError);

    // --- Positioning ---

    // Absolute seek from the start of the stream.
    bool seek(std::uint64_t pos, Error* outError);

    // Seek to `distance` bytes before end of stream.
    bool seek_from_end(std::uint64_t distance, Error* outError);

    // Total stream length (cached after the first call).
    bool length(std::uint64_t* out, Error* outError);

    // Reads that would cross `end` fail with TruncatedStream.
    void set_limit(std::uint64_t end) { limit_ = end; }
    void clear_limit() { limit_.reset(); }

private:
    std::istream& in_;
    std::optional<std::uint64_t> length_;
    std::optional<std::uint64_t> limit_;
};

} // namespace d2pak
