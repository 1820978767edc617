#include "byte_stream.hpp"

namespace d2pak {

bool is_valid_utf8(std::string_view s) {
    std::size_t i = 0;
    const std::size_t n = s.size();

    while (i < n) {
        const auto c = static_cast<unsigned char>(s[i]);

        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t extra = 0;
        std::uint32_t cp = 0;
        std::uint32_t minCp = 0;

        if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
            minCp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
            minCp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
            minCp = 0x10000;
        } else {
            return false;
        }

        if (i + extra >= n) {
            return false;  // Truncated sequence.
        }

        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (cp < minCp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }

        i += extra + 1;
    }

    return true;
}

bool ByteWriter::write_string(std::string_view s, Error* outError) {
    if (s.size() > 0xFFFF) {
        return fail(outError, ErrorCode::InvalidArgument,
                    "string of " + std::to_string(s.size()) + " bytes exceeds the u16 length prefix");
    }
    if (!is_valid_utf8(s)) {
        return fail(outError, ErrorCode::InvalidEncoding, "string is not valid UTF-8");
    }
    write_u16(static_cast<std::uint16_t>(s.size()));
    data_.insert(data_.end(), s.begin(), s.end());
    return true;
}

bool StreamReader::read_bytes(void* data, std::size_t size, Error* outError) {
    if (size == 0) {
        return true;
    }

    if (limit_) {
        const std::streampos pos = in_.tellg();
        if (pos < 0) {
            return fail(outError, ErrorCode::IoFailure, "cannot query stream position");
        }
        const auto start = static_cast<std::uint64_t>(pos);
        if (start + size > *limit_) {
            return fail(outError, ErrorCode::TruncatedStream,
                        "read of " + std::to_string(size) + " bytes at " + std::to_string(start) +
                        " crosses region end " + std::to_string(*limit_));
        }
    }

    in_.read(static_cast<char*>(data), static_cast<std::streamsize>(size));
    const auto got = static_cast<std::size_t>(in_.gcount());
    if (got == size) {
        return true;
    }

    if (in_.bad()) {
        return fail(outError, ErrorCode::IoFailure, "stream read error");
    }
    return fail(outError, ErrorCode::TruncatedStream,
                "expected " + std::to_string(size) + " bytes, got " + std::to_string(got));
}

bool StreamReader::read_u8(std::uint8_t* out, Error* outError) {
    return read_bytes(out, 1, outError);
}

bool StreamReader::read_u16(std::uint16_t* out, Error* outError) {
    unsigned char b[2] = {0, 0};
    if (!read_bytes(b, sizeof(b), outError)) return false;
    *out = static_cast<std::uint16_t>((static_cast<std::uint16_t>(b[0]) << 8) | static_cast<std::uint16_t>(b[1]));
    return true;
}

bool StreamReader::read_u32(std::uint32_t* out, Error* outError) {
    unsigned char b[4] = {0, 0, 0, 0};
    if (!read_bytes(b, sizeof(b), outError)) return false;
    *out = (static_cast<std::uint32_t>(b[0]) << 24) |
           (static_cast<std::uint32_t>(b[1]) << 16) |
           (static_cast<std::uint32_t>(b[2]) << 8) |
           (static_cast<std::uint32_t>(b[3]) << 0);
    return true;
}

bool StreamReader::read_i32(std::int32_t* out, Error* outError) {
    std::uint32_t u = 0;
    if (!read_u32(&u, outError)) return false;
    *out = static_cast<std::int32_t>(u);
    return true;
}

bool StreamReader::read_string(std::string* out, Error* outError) {
    std::uint16_t len = 0;
    if (!read_u16(&len, outError)) return false;

    out->clear();
    if (len == 0) return true;

    std::string tmp(static_cast<std::size_t>(len), '\0');
    if (!read_bytes(tmp.data(), tmp.size(), outError)) return false;

    if (!is_valid_utf8(tmp)) {
        return fail(outError, ErrorCode::InvalidEncoding, "string payload is not valid UTF-8");
    }

    *out = std::move(tmp);
    return true;
}

bool StreamReader::length(std::uint64_t* out, Error* outError) {
    if (length_) {
        *out = *length_;
        return true;
    }

    in_.clear();
    const std::streampos current = in_.tellg();

    in_.seekg(0, std::ios::end);
    const std::streampos end = in_.tellg();
    if (!in_ || end < 0) {
        in_.clear();
        return fail(outError, ErrorCode::IoFailure, "cannot determine stream length");
    }

    if (current >= 0) {
        in_.seekg(current);
    }

    length_ = static_cast<std::uint64_t>(end);
    *out = *length_;
    return true;
}

bool StreamReader::seek(std::uint64_t pos, Error* outError) {
    std::uint64_t len = 0;
    if (!length(&len, outError)) return false;

    if (pos > len) {
        return fail(outError, ErrorCode::TruncatedStream,
                    "seek to " + std::to_string(pos) + " past end of " + std::to_string(len) + "-byte stream");
    }

    in_.clear();
    in_.seekg(static_cast<std::streamoff>(pos), std::ios::beg);
    if (!in_) {
        return fail(outError, ErrorCode::IoFailure, "seek to " + std::to_string(pos) + " failed");
    }
    return true;
}

bool StreamReader::seek_from_end(std::uint64_t distance, Error* outError) {
    std::uint64_t len = 0;
    if (!length(&len, outError)) return false;

    if (distance > len) {
        return fail(outError, ErrorCode::TruncatedStream,
                    "stream of " + std::to_string(len) + " bytes is shorter than " + std::to_string(distance));
    }
    return seek(len - distance, outError);
}

} // namespace d2pak
