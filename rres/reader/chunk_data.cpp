#include "chunk_data.hpp"

#include "rres/core/byte_buffer.hpp"
#include "rres/core/error.hpp"
#include "rres/format/crc32.hpp"

#include <string>

#include <raylib.h>

namespace rres::reader {

ChunkData decode_plain_payload(std::span<const std::uint8_t> payload, std::uint32_t baseSize) {
    ByteReader in(payload);
    // The count field must be present before baseSize can be checked against
    // it: a payload under 4 bytes is InsufficientData whatever baseSize says.
    const std::uint32_t propCount = in.read_u32();

    // 64-bit so that a huge propCount cannot wrap the overhead.
    const std::uint64_t overhead = format::RRES_PROP_SIZE +
                                   static_cast<std::uint64_t>(propCount) * format::RRES_PROP_SIZE;
    if (overhead > baseSize) {
        throw Error(ErrorCode::MalformedChunk,
                    "base size " + std::to_string(baseSize) + " smaller than property table (" +
                        std::to_string(propCount) + " props)");
    }

    if (overhead - format::RRES_PROP_SIZE > in.remaining()) {
        throw Error(ErrorCode::InsufficientData,
                    "payload too short for " + std::to_string(propCount) + " props");
    }

    ChunkData data;
    data.props.reserve(propCount);
    for (std::uint32_t i = 0; i < propCount; ++i) {
        data.props.push_back(in.read_u32());
    }

    const auto rawSize = static_cast<std::size_t>(baseSize - overhead);
    const auto raw = in.read_bytes(rawSize);
    data.raw.assign(raw.begin(), raw.end());
    return data;
}

ChunkData decode_chunk_data(const ChunkInfo& info, std::span<const std::uint8_t> packed) {
    const std::uint32_t crc = format::crc32(packed);

    const auto type = info.data_type();
    if (type == format::ResourceDataType::Null || type == format::ResourceDataType::Unrecognized) {
        throw Error(ErrorCode::NullResource,
                    "chunk " + std::to_string(info.id) + " ('" + info.type_tag_string() + "') contains no data");
    }

    if (crc != info.crc32) {
        TraceLog(LOG_WARNING, "[rres] CRC32 mismatch on chunk %u: stored 0x%08X, computed 0x%08X",
                 static_cast<unsigned>(info.id), static_cast<unsigned>(info.crc32), static_cast<unsigned>(crc));
        throw Error(ErrorCode::ChecksumMismatch,
                    "CRC32 does not match for chunk " + std::to_string(info.id));
    }

    if (info.needs_transform()) {
        // Properties live inside the transformed bytes; hand back the blob as is.
        ChunkData data;
        data.raw.assign(packed.begin(), packed.end());
        return data;
    }

    return decode_plain_payload(packed, info.baseSize);
}

} // namespace rres::reader
