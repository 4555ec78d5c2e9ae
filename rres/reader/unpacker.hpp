#pragma once

#include "chunk_data.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace rres::reader {

// Decompression/decryption provider. The reader never implements any codec or
// cipher itself; applications plug one in here.
class Unpacker {
public:
    virtual ~Unpacker() = default;

    virtual bool supports(format::CompressionType compression, format::CipherType cipher) const = 0;

    // Reverses compression and/or encryption of `packed` (the chunk's on-disk
    // bytes) and returns the plain payload, baseSize bytes long.
    virtual std::vector<std::uint8_t> unpack(const ChunkInfo& info, std::span<const std::uint8_t> packed) = 0;
};

// Turns a chunk returned by the reader into its untransformed form.
//
// Untransformed chunks are returned unchanged. Otherwise the unpacker must
// support the chunk's codes (else Error(UnsupportedTransform)) and produce
// exactly baseSize bytes (else Error(MalformedChunk)); properties are then
// decoded from the result. The returned info reports no compression and no
// cipher, packedSize == baseSize and the CRC32 of the unpacked bytes.
//
// The stored CRC32 covers the packed bytes and was already checked when the
// chunk was read.
Chunk unpack_chunk(const Chunk& chunk, Unpacker& unpacker);

} // namespace rres::reader
