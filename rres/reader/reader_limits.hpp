#pragma once

#include "rres/format/rres_format.hpp"

#include <cstdint>

namespace rres::reader {

// Upper bounds applied while parsing untrusted containers
struct ReaderLimits {
    std::uint32_t maxNameLength{format::RRES_DEFAULT_MAX_NAME_LENGTH};              // Directory entry name bytes
    std::uint32_t maxDirectoryEntries{format::RRES_DEFAULT_MAX_DIRECTORY_ENTRIES};  // Entries per CDIR chunk
    std::uint32_t maxChainLength{format::RRES_DEFAULT_MAX_CHAIN_LENGTH};            // Chunks per multi-chunk resource
};

} // namespace rres::reader
