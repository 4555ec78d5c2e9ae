#pragma once

// raylib resource container format (rres)
//
// Chunked archive for game assets with an optional central directory.
// All integers are little-endian.
//
// Layout:
// ┌─────────────────────────────────────┐
// │ Header (16 bytes)                   │
// │   magic[4]      = "rres"            │
// │   version       : u16 = 100         │
// │   chunk_count   : u16               │
// │   cd_offset     : u32 (from end of  │
// │                   header)           │
// │   reserved      : u32               │
// ├─────────────────────────────────────┤
// │ Chunks (repeated chunk_count times) │
// │   Info (32 bytes)                   │
// │     type[4]     : fourcc            │
// │     id          : u32               │
// │     compType    : u8                │
// │     cipherType  : u8                │
// │     flags       : u16               │
// │     packedSize  : u32               │
// │     baseSize    : u32               │
// │     nextOffset  : u32 (absolute)    │
// │     reserved    : u32               │
// │     crc32       : u32               │
// │   Data (packedSize bytes)           │
// │     propCount   : u32               │
// │     props       : u32[propCount]    │
// │     raw         : u8[baseSize -     │
// │                   4 - 4*propCount]  │
// ├─────────────────────────────────────┤
// │ Central directory chunk ("CDIR")    │
// │   props[0] = entry_count            │
// │   raw: for each entry:              │
// │     id          : u32               │
// │     offset      : u32               │
// │     reserved    : u32               │
// │     nameSize    : u32               │
// │     name        : u8[nameSize]      │
// └─────────────────────────────────────┘
//
// Compressed or encrypted chunks keep their Data opaque: properties are only
// readable after an external unpacker reverses the transform.

#include <array>
#include <cstddef>
#include <cstdint>

namespace rres::format {

// File magic "rres".
constexpr std::array<std::uint8_t, 4> RRES_MAGIC{{'r', 'r', 'e', 's'}};

// Current format version.
constexpr std::uint16_t RRES_VERSION = 100;

// Fixed record sizes in bytes.
constexpr std::size_t RRES_HEADER_SIZE = 16;
constexpr std::size_t RRES_CHUNK_INFO_SIZE = 32;

// Size of one property slot and of the property count field.
constexpr std::size_t RRES_PROP_SIZE = 4;

// Directory entry prefix: id, offset, reserved, nameSize.
constexpr std::size_t RRES_DIR_ENTRY_PREFIX_SIZE = 16;

// Default parse limits (to reject malicious files early).
constexpr std::uint32_t RRES_DEFAULT_MAX_NAME_LENGTH = 4096;
constexpr std::uint32_t RRES_DEFAULT_MAX_DIRECTORY_ENTRIES = 1u << 20;
constexpr std::uint32_t RRES_DEFAULT_MAX_CHAIN_LENGTH = 4096;

using FourCC = std::array<std::uint8_t, 4>;

constexpr FourCC make_fourcc(char a, char b, char c, char d) {
    return FourCC{{static_cast<std::uint8_t>(a), static_cast<std::uint8_t>(b),
                   static_cast<std::uint8_t>(c), static_cast<std::uint8_t>(d)}};
}

} // namespace rres::format
