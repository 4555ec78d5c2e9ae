#include "resource_file.hpp"

#include "byte_source.hpp"
#include "file_header.hpp"
#include "rres/core/error.hpp"

#include <optional>
#include <string>

#include <raylib.h>

namespace rres::reader {

namespace {

// Linear scan over the header's chunk records. On a match the source is left
// at the first byte of that chunk's payload; other payloads are skipped
// unread.
std::optional<ChunkInfo> find_chunk(ByteSource& source, const FileHeader& header, std::uint32_t id) {
    for (std::uint32_t i = 0; i < header.chunkCount; ++i) {
        ChunkInfo info = read_chunk_info(source);
        if (info.id == id) {
            return info;
        }
        source.skip(info.packedSize);
    }
    return std::nullopt;
}

ChunkInfo require_chunk(ByteSource& source, std::uint32_t id) {
    const FileHeader header = read_verified_header(source);

    auto info = find_chunk(source, header, id);
    if (!info) {
        TraceLog(LOG_DEBUG, "[rres] Chunk %u not found in %u chunks", static_cast<unsigned>(id),
                 static_cast<unsigned>(header.chunkCount));
        throw Error(ErrorCode::ChunkNotFound, "chunk " + std::to_string(id) + " not found");
    }
    return *info;
}

Chunk read_chunk_payload(ByteSource& source, const ChunkInfo& info) {
    Chunk chunk;
    chunk.info = info;
    const auto packed = source.read_exact(info.packedSize);
    chunk.data = decode_chunk_data(info, packed);
    return chunk;
}

} // namespace

ResourceFile::ResourceFile(std::filesystem::path path, ReaderLimits limits)
    : path_(std::move(path))
    , limits_(limits) {}

ResourceFile::ResourceFile(std::vector<std::uint8_t> bytes, ReaderLimits limits)
    : bytes_(std::make_shared<const std::vector<std::uint8_t>>(std::move(bytes)))
    , limits_(limits) {}

std::unique_ptr<ByteSource> ResourceFile::open_source() const {
    if (bytes_) {
        return std::make_unique<MemorySource>(*bytes_);
    }
    return std::make_unique<FileSource>(path_);
}

Chunk ResourceFile::fetch_by_id(std::uint32_t id) const {
    auto source = open_source();
    const ChunkInfo info = require_chunk(*source, id);
    Chunk chunk = read_chunk_payload(*source, info);

    TraceLog(LOG_DEBUG, "[rres] Loaded chunk %u ('%s', %u props, %zu raw bytes)", static_cast<unsigned>(id),
             info.type_tag_string().c_str(), static_cast<unsigned>(chunk.data.prop_count()), chunk.data.raw.size());
    return chunk;
}

ChunkInfo ResourceFile::fetch_info(std::uint32_t id) const {
    auto source = open_source();
    return require_chunk(*source, id);
}

ResourceMulti ResourceFile::fetch_multi(std::uint32_t id) const {
    auto source = open_source();
    const ChunkInfo first = require_chunk(*source, id);

    ResourceMulti multi;
    multi.chunks.push_back(read_chunk_payload(*source, first));

    while (multi.chunks.back().info.nextOffset != 0) {
        if (multi.chunks.size() >= limits_.maxChainLength) {
            throw Error(ErrorCode::MalformedChunk,
                        "chunk chain for resource " + std::to_string(id) + " exceeds " +
                            std::to_string(limits_.maxChainLength) + " chunks");
        }

        source->seek_to(multi.chunks.back().info.nextOffset);
        const ChunkInfo next = read_chunk_info(*source);
        multi.chunks.push_back(read_chunk_payload(*source, next));
    }

    TraceLog(LOG_DEBUG, "[rres] Loaded resource %u (%zu chunks)", static_cast<unsigned>(id), multi.chunks.size());
    return multi;
}

std::vector<ChunkInfo> ResourceFile::list_chunks() const {
    auto source = open_source();
    const FileHeader header = read_verified_header(*source);

    std::vector<ChunkInfo> infos;
    infos.reserve(header.chunkCount);
    for (std::uint32_t i = 0; i < header.chunkCount; ++i) {
        infos.push_back(read_chunk_info(*source));
        source->skip(infos.back().packedSize);
    }
    return infos;
}

CentralDirectory ResourceFile::load_directory() const {
    auto source = open_source();
    return load_central_directory(*source, limits_);
}

Chunk ResourceFile::fetch_by_name(std::string_view name) const {
    const auto id = load_directory().resolve(name);
    if (!id) {
        throw Error(ErrorCode::ChunkNotFound, "no directory entry named '" + std::string(name) + "'");
    }
    return fetch_by_id(*id);
}

} // namespace rres::reader
