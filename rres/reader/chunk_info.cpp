#include "chunk_info.hpp"

#include "byte_source.hpp"
#include "rres/core/byte_buffer.hpp"

#include <array>

namespace rres::reader {

ChunkInfo read_chunk_info(ByteSource& source) {
    std::array<std::uint8_t, format::RRES_CHUNK_INFO_SIZE> raw{};
    source.read_into(raw);

    ByteReader in(raw);
    ChunkInfo info;
    info.type = in.read_fourcc();
    info.id = in.read_u32();
    info.compType = in.read_u8();
    info.cipherType = in.read_u8();
    info.flags = in.read_u16();
    info.packedSize = in.read_u32();
    info.baseSize = in.read_u32();
    info.nextOffset = in.read_u32();
    info.reserved = in.read_u32();
    info.crc32 = in.read_u32();
    return info;
}

} // namespace rres::reader
