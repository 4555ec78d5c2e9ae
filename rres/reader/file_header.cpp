#include "file_header.hpp"

#include "byte_source.hpp"
#include "rres/core/byte_buffer.hpp"
#include "rres/core/error.hpp"
#include "rres/format/resource_types.hpp"

#include <array>
#include <string>

#include <raylib.h>

namespace rres::reader {

FileHeader read_header(ByteSource& source) {
    std::array<std::uint8_t, format::RRES_HEADER_SIZE> raw{};
    source.read_into(raw);

    ByteReader in(raw);
    FileHeader header;
    header.magic = in.read_fourcc();
    header.version = in.read_u16();
    header.chunkCount = in.read_u16();
    header.cdOffset = in.read_u32();
    header.reserved = in.read_u32();
    return header;
}

bool verify(const FileHeader& header) {
    return header.magic == format::RRES_MAGIC && header.version == format::RRES_VERSION;
}

FileHeader read_verified_header(ByteSource& source) {
    FileHeader header = read_header(source);
    if (!verify(header)) {
        TraceLog(LOG_WARNING, "[rres] Rejected header: magic '%s', version %u",
                 format::fourcc_to_string(header.magic).c_str(), static_cast<unsigned>(header.version));
        throw Error(ErrorCode::HeaderVerificationFailed,
                    "not an rres file (magic '" + format::fourcc_to_string(header.magic) +
                        "', version " + std::to_string(header.version) + ")");
    }

    TraceLog(LOG_DEBUG, "[rres] Header ok: %u chunks, cd offset %u",
             static_cast<unsigned>(header.chunkCount), static_cast<unsigned>(header.cdOffset));
    return header;
}

} // namespace rres::reader
