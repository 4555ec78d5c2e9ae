#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace rres {

// Failure kinds surfaced by the reader. None of them are retried internally.
enum class ErrorCode : std::uint8_t {
    InsufficientData,          // Source exhausted before a record or declared payload was read.
    HeaderVerificationFailed,  // Magic or version mismatch.
    ChunkNotFound,             // Requested id absent after a full scan.
    InvalidCentralDirectory,   // Directory offset does not lead to a usable CDIR chunk.
    ChecksumMismatch,          // Stored and recomputed CRC32 disagree.
    NullResource,              // Chunk has no concrete data type.
    MalformedChunk,            // Derived lengths or counts are inconsistent.
    UnsupportedTransform,      // No unpacker for the chunk's compression/cipher codes.
    OpenFailed,                // Source file could not be opened.
};

const char* error_code_name(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace rres
