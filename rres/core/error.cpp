#include "error.hpp"

namespace rres {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InsufficientData: return "InsufficientData";
        case ErrorCode::HeaderVerificationFailed: return "HeaderVerificationFailed";
        case ErrorCode::ChunkNotFound: return "ChunkNotFound";
        case ErrorCode::InvalidCentralDirectory: return "InvalidCentralDirectory";
        case ErrorCode::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorCode::NullResource: return "NullResource";
        case ErrorCode::MalformedChunk: return "MalformedChunk";
        case ErrorCode::UnsupportedTransform: return "UnsupportedTransform";
        case ErrorCode::OpenFailed: return "OpenFailed";
    }
    return "Unknown";
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string("rres: ") + message)
    , code_(code) {}

} // namespace rres
