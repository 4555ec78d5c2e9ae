#pragma once

#include "rres/format/resource_types.hpp"

#include <cstdint>
#include <string>

namespace rres::reader {

class ByteSource;

// Chunk descriptor (32 bytes), followed on disk by packedSize payload bytes.
struct ChunkInfo {
    format::FourCC type{};
    std::uint32_t id{0};
    std::uint8_t compType{0};
    std::uint8_t cipherType{0};
    std::uint16_t flags{0};
    std::uint32_t packedSize{0};  // Bytes stored on disk.
    std::uint32_t baseSize{0};    // Logical size before transform; valid only when untransformed.
    std::uint32_t nextOffset{0};  // Absolute offset of the next chunk of a multi-chunk resource, 0 = none.
    std::uint32_t reserved{0};
    std::uint32_t crc32{0};       // Over the packed payload.

    format::ResourceDataType data_type() const { return format::data_type_from_fourcc(type); }
    format::CompressionType compression() const { return format::compression_from_code(compType); }
    format::CipherType cipher() const { return format::cipher_from_code(cipherType); }

    bool type_is(format::ResourceDataType t) const { return data_type() == t; }

    // Compressed and/or encrypted: payload is opaque until unpacked.
    bool needs_transform() const { return compType != 0 || cipherType != 0; }

    std::string type_tag_string() const { return format::fourcc_to_string(type); }
};

// Reads one descriptor at the current position.
// Throws Error(InsufficientData) when fewer than 32 bytes remain.
ChunkInfo read_chunk_info(ByteSource& source);

} // namespace rres::reader
