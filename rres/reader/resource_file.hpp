#pragma once

#include "central_directory.hpp"
#include "chunk_data.hpp"
#include "reader_limits.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

namespace rres::reader {

class ByteSource;

// rres container handle.
//
// Holds only where the container lives (a path or a shared read-only buffer);
// every operation opens its own source, scans from the start and releases the
// source before returning. Nothing is cached between calls, so one instance
// can be used from several threads at once.
//
// All operations throw rres::Error on failure.
class ResourceFile {
public:
    explicit ResourceFile(std::filesystem::path path, ReaderLimits limits = {});
    explicit ResourceFile(std::vector<std::uint8_t> bytes, ReaderLimits limits = {});

    const std::filesystem::path& path() const { return path_; }
    bool in_memory() const { return bytes_ != nullptr; }
    const ReaderLimits& limits() const { return limits_; }

    // First chunk with the given id, verified and decoded.
    // Error(ChunkNotFound) after a full scan without a match.
    Chunk fetch_by_id(std::uint32_t id) const;

    // Descriptor of the first chunk with the given id; the payload is skipped.
    ChunkInfo fetch_info(std::uint32_t id) const;

    // First chunk with the given id plus every chunk reached through nextOffset.
    ResourceMulti fetch_multi(std::uint32_t id) const;

    // All chunk descriptors in file order.
    std::vector<ChunkInfo> list_chunks() const;

    // Central directory located through the header's directory offset.
    CentralDirectory load_directory() const;

    // load_directory() + resolve() + fetch_by_id().
    // Error(ChunkNotFound) when the name is not in the directory.
    Chunk fetch_by_name(std::string_view name) const;

private:
    std::unique_ptr<ByteSource> open_source() const;

    std::filesystem::path path_;
    std::shared_ptr<const std::vector<std::uint8_t>> bytes_;
    ReaderLimits limits_;
};

} // namespace rres::reader
