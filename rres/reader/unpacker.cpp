#include "unpacker.hpp"

#include "rres/core/error.hpp"
#include "rres/format/crc32.hpp"

#include <string>

#include <raylib.h>

namespace rres::reader {

Chunk unpack_chunk(const Chunk& chunk, Unpacker& unpacker) {
    const ChunkInfo& info = chunk.info;
    if (!info.needs_transform()) {
        return chunk;
    }

    const auto compression = info.compression();
    const auto cipher = info.cipher();
    if (!unpacker.supports(compression, cipher)) {
        throw Error(ErrorCode::UnsupportedTransform,
                    std::string("no unpacker for compression ") + format::compression_name(compression) +
                        " / cipher " + format::cipher_name(cipher) + " (chunk " + std::to_string(info.id) + ")");
    }

    std::vector<std::uint8_t> plain = unpacker.unpack(info, chunk.data.raw);
    if (plain.size() != info.baseSize) {
        throw Error(ErrorCode::MalformedChunk,
                    "unpacked chunk " + std::to_string(info.id) + " is " + std::to_string(plain.size()) +
                        " bytes, expected " + std::to_string(info.baseSize));
    }

    Chunk out;
    out.info = info;
    out.info.compType = 0;
    out.info.cipherType = 0;
    out.info.packedSize = info.baseSize;
    out.info.crc32 = format::crc32(plain);
    out.data = decode_plain_payload(plain, info.baseSize);

    TraceLog(LOG_DEBUG, "[rres] Unpacked chunk %u: %u -> %u bytes (%s/%s)", static_cast<unsigned>(info.id),
             static_cast<unsigned>(info.packedSize), static_cast<unsigned>(info.baseSize),
             format::compression_name(compression), format::cipher_name(cipher));
    return out;
}

} // namespace rres::reader
