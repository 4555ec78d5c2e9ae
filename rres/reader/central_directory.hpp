#pragma once

#include "chunk_data.hpp"
#include "reader_limits.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rres::reader {

class ByteSource;

struct DirectoryEntry {
    std::uint32_t id{0};
    std::uint32_t offset{0};  // Global offset of the resource's first chunk (informational).
    std::string name;         // Raw name bytes as stored, padding included.

    // Name up to the first NUL byte.
    std::string_view logical_name() const;
};

// Name -> resource id table decoded from a "CDIR" chunk.
class CentralDirectory {
public:
    CentralDirectory() = default;
    explicit CentralDirectory(std::vector<DirectoryEntry> entries);

    const std::vector<DirectoryEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Id of the first entry whose logical name equals `name` exactly.
    std::optional<std::uint32_t> resolve(std::string_view name) const;

    // Same lookup, returning the whole entry or nullptr.
    const DirectoryEntry* find(std::string_view name) const;

private:
    std::vector<DirectoryEntry> entries_;
};

// Parses a decoded CDIR chunk. props[0] is the entry count; the raw data holds
// the entries back to back. Throws Error(InvalidCentralDirectory) when the
// chunk is not an untransformed directory, Error(MalformedChunk) when entries
// overrun the raw data or exceed `limits`.
CentralDirectory parse_central_directory(const Chunk& chunk, const ReaderLimits& limits = {});

// Reads and verifies the header at the start of `source`, follows the header's
// directory offset and decodes the CDIR chunk found there.
CentralDirectory load_central_directory(ByteSource& source, const ReaderLimits& limits = {});

} // namespace rres::reader
