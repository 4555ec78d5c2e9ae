#pragma once

#include "chunk_info.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace rres::reader {

// Decoded chunk payload.
struct ChunkData {
    std::vector<std::uint32_t> props;  // On-disk order. Empty for transformed chunks.
    std::vector<std::uint8_t> raw;     // Remaining payload, or the whole packed payload if transformed.

    std::uint32_t prop_count() const { return static_cast<std::uint32_t>(props.size()); }
};

struct Chunk {
    ChunkInfo info;
    ChunkData data;
};

// Resource stored across several chunks linked through ChunkInfo::nextOffset.
struct ResourceMulti {
    std::vector<Chunk> chunks;

    std::uint32_t chunk_count() const { return static_cast<std::uint32_t>(chunks.size()); }
};

// Verifies and decodes the payload that follows `info` on disk.
// `packed` must be exactly info.packedSize bytes.
//
// Order of checks:
//   1. Null or unrecognized type        -> Error(NullResource)
//   2. crc32(packed) != info.crc32      -> Error(ChecksumMismatch)
//   3. untransformed and baseSize smaller than 4 + 4 * propCount
//                                       -> Error(MalformedChunk)
// A payload shorter than its declared properties/raw data throws
// Error(InsufficientData).
ChunkData decode_chunk_data(const ChunkInfo& info, std::span<const std::uint8_t> packed);

// Plain payload layout: propCount, props, raw[baseSize - 4 - 4 * propCount].
// No checksum or type checks.
ChunkData decode_plain_payload(std::span<const std::uint8_t> payload, std::uint32_t baseSize);

} // namespace rres::reader
