#pragma once

#include "rres/format/rres_format.hpp"

#include <cstdint>

namespace rres::reader {

class ByteSource;

// rres file header (16 bytes).
struct FileHeader {
    format::FourCC magic{};
    std::uint16_t version{0};
    std::uint16_t chunkCount{0};
    std::uint32_t cdOffset{0};  // Relative to the first byte after the header.
    std::uint32_t reserved{0};
};

// Reads the 16-byte header at the current position.
// Throws Error(InsufficientData) on a truncated source. Does not verify.
FileHeader read_header(ByteSource& source);

// Magic is "rres" and version is RRES_VERSION.
bool verify(const FileHeader& header);

// read_header() + verify(); throws Error(HeaderVerificationFailed) on mismatch.
FileHeader read_verified_header(ByteSource& source);

} // namespace rres::reader
