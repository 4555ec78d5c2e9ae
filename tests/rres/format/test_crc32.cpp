/**
 * @file test_crc32.cpp
 * @brief Unit tests for the CRC-32 checksum engine.
 */

#include <catch2/catch.hpp>

#include "rres/format/crc32.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

using rres::format::crc32;
using rres::format::crc32_update;

namespace {

std::vector<std::uint8_t> bytes(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

} // namespace

TEST_CASE("CRC32 of known vectors", "[format][crc32]") {
    SECTION("empty input") {
        REQUIRE(crc32({}) == 0x00000000u);
    }

    SECTION("check value 123456789") {
        REQUIRE(crc32(bytes("123456789")) == 0xCBF43926u);
    }

    SECTION("single zero byte") {
        const std::vector<std::uint8_t> zero{0x00};
        REQUIRE(crc32(zero) == 0xD202EF8Du);
    }

    SECTION("reference text payload") {
        REQUIRE(crc32(bytes("Hello World! This is a test!")) == 0x54396B6Au);
    }
}

TEST_CASE("CRC32 is deterministic", "[format][crc32]") {
    const auto data = bytes("resources/text_data.txt");
    REQUIRE(crc32(data) == crc32(data));
}

TEST_CASE("CRC32 detects single byte changes", "[format][crc32]") {
    auto data = bytes("The quick brown fox jumps over the lazy dog");
    const std::uint32_t original = crc32(data);
    REQUIRE(original == 0x414FA339u);

    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] ^= 0x01;
        REQUIRE(crc32(data) != original);
        data[i] ^= 0x01;
    }
    REQUIRE(crc32(data) == original);
}

TEST_CASE("CRC32 incremental update matches one-shot", "[format][crc32]") {
    const auto data = bytes("123456789");
    const std::span<const std::uint8_t> all(data);

    std::uint32_t crc = 0;
    crc = crc32_update(crc, all.first(4));
    crc = crc32_update(crc, all.subspan(4));
    REQUIRE(crc == 0xCBF43926u);

    REQUIRE(crc32_update(0, {}) == 0u);
}
