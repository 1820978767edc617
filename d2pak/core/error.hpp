#pragma once

#include <cstdint>
#include <string>

namespace d2pak {

enum class ErrorCode : std::uint8_t {
    None = 0,
    CorruptHeader,    // Magic bytes at offset 0 are not (2, 1).
    TruncatedStream,  // Short read, or seek outside the stream.
    InvalidEncoding,  // String payload is not valid UTF-8.
    IoFailure,        // Underlying device/file error.
    NotFound,         // Logical file name absent from the merged archive.
    InvalidArgument,  // Caller error (writer misuse, bad option).
};

const char* error_code_name(ErrorCode code);

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;

    bool ok() const { return code == ErrorCode::None; }

    // "<CodeName>: <message>"
    std::string to_string() const;
};

// Fills outError (if provided) and returns false, so call sites can write
// `return fail(outError, ErrorCode::X, "...");`.
bool fail(Error* outError, ErrorCode code, std::string message);

} // namespace d2pak
