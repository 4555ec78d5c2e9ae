#include "central_directory.hpp"

#include "byte_source.hpp"
#include "file_header.hpp"
#include "rres/core/byte_buffer.hpp"
#include "rres/core/error.hpp"

#include <algorithm>

#include <raylib.h>

namespace rres::reader {

namespace {

void require_untransformed_directory(const ChunkInfo& info) {
    if (!info.type_is(format::ResourceDataType::Directory)) {
        TraceLog(LOG_WARNING, "[rres] Expected CDIR chunk, found '%s'", info.type_tag_string().c_str());
        throw Error(ErrorCode::InvalidCentralDirectory,
                    "central directory offset points to a '" + info.type_tag_string() + "' chunk");
    }

    // A compressed/encrypted directory would decode to zero entries; refuse it.
    if (info.needs_transform()) {
        TraceLog(LOG_WARNING, "[rres] Central directory is compressed/encrypted (comp %u, cipher %u)",
                 static_cast<unsigned>(info.compType), static_cast<unsigned>(info.cipherType));
        throw Error(ErrorCode::InvalidCentralDirectory, "central directory chunk is compressed or encrypted");
    }
}

} // namespace

std::string_view DirectoryEntry::logical_name() const {
    std::string_view view(name);
    const auto nul = view.find('\0');
    if (nul != std::string_view::npos) {
        view = view.substr(0, nul);
    }
    return view;
}

CentralDirectory::CentralDirectory(std::vector<DirectoryEntry> entries)
    : entries_(std::move(entries)) {}

const DirectoryEntry* CentralDirectory::find(std::string_view name) const {
    for (const auto& entry : entries_) {
        if (entry.logical_name() == name) {
            return &entry;
        }
    }
    return nullptr;
}

std::optional<std::uint32_t> CentralDirectory::resolve(std::string_view name) const {
    const DirectoryEntry* entry = find(name);
    if (!entry) {
        return std::nullopt;
    }
    return entry->id;
}

CentralDirectory parse_central_directory(const Chunk& chunk, const ReaderLimits& limits) {
    require_untransformed_directory(chunk.info);

    if (chunk.data.props.empty()) {
        throw Error(ErrorCode::InvalidCentralDirectory, "central directory has no entry count");
    }

    const std::uint32_t entryCount = chunk.data.props[0];
    if (entryCount > limits.maxDirectoryEntries) {
        throw Error(ErrorCode::MalformedChunk,
                    "central directory declares " + std::to_string(entryCount) + " entries");
    }

    // Entries are variable length, so they can only be walked in order.
    ByteReader in(chunk.data.raw);
    std::vector<DirectoryEntry> entries;
    entries.reserve(std::min<std::size_t>(entryCount, in.remaining() / format::RRES_DIR_ENTRY_PREFIX_SIZE));

    for (std::uint32_t i = 0; i < entryCount; ++i) {
        if (in.remaining() < format::RRES_DIR_ENTRY_PREFIX_SIZE) {
            throw Error(ErrorCode::MalformedChunk,
                        "central directory entry " + std::to_string(i) + " overruns the chunk");
        }

        DirectoryEntry entry;
        entry.id = in.read_u32();
        entry.offset = in.read_u32();
        in.skip(4);  // reserved
        const std::uint32_t nameSize = in.read_u32();

        if (nameSize > limits.maxNameLength) {
            throw Error(ErrorCode::MalformedChunk,
                        "central directory entry " + std::to_string(i) + " name too long (" +
                            std::to_string(nameSize) + " bytes)");
        }
        if (nameSize > in.remaining()) {
            throw Error(ErrorCode::MalformedChunk,
                        "central directory entry " + std::to_string(i) + " name overruns the chunk");
        }

        const auto nameBytes = in.read_bytes(nameSize);
        entry.name.assign(reinterpret_cast<const char*>(nameBytes.data()), nameBytes.size());
        entries.push_back(std::move(entry));
    }

    return CentralDirectory(std::move(entries));
}

CentralDirectory load_central_directory(ByteSource& source, const ReaderLimits& limits) {
    const FileHeader header = read_verified_header(source);

    source.skip(header.cdOffset);

    Chunk chunk;
    chunk.info = read_chunk_info(source);
    require_untransformed_directory(chunk.info);

    const auto packed = source.read_exact(chunk.info.packedSize);
    chunk.data = decode_chunk_data(chunk.info, packed);

    CentralDirectory dir = parse_central_directory(chunk, limits);
    TraceLog(LOG_DEBUG, "[rres] Central directory loaded: %zu entries", dir.size());
    return dir;
}

} // namespace rres::reader
