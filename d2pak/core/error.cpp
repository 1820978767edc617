#include "error.hpp"

#include <utility>

namespace d2pak {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::CorruptHeader: return "CorruptHeader";
        case ErrorCode::TruncatedStream: return "TruncatedStream";
        case ErrorCode::InvalidEncoding: return "InvalidEncoding";
        case ErrorCode::IoFailure: return "IoFailure";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        default: break;
    }
    return "Unknown";
}

std::string Error::to_string() const {
    std::string out = error_code_name(code);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

bool fail(Error* outError, ErrorCode code, std::string message) {
    if (outError) {
        outError->code = code;
        outError->message = std::move(message);
    }
    return false;
}

} // namespace d2pak
