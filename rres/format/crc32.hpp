#pragma once

#include <cstdint>
#include <span>

namespace rres::format {

// CRC-32 (ISO-HDLC, reflected polynomial 0xEDB88320), table driven.
// crc32({}) == 0, crc32("123456789") == 0xCBF43926.
std::uint32_t crc32(std::span<const std::uint8_t> data);

// Incremental form. Start from 0 and feed spans in order; the result after the
// last span equals crc32() over their concatenation.
std::uint32_t crc32_update(std::uint32_t crc, std::span<const std::uint8_t> data);

} // namespace rres::format
