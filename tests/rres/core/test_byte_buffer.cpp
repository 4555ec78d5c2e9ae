/**
 * @file test_byte_buffer.cpp
 * @brief Unit tests for ByteReader / ByteWriter.
 */

#include <catch2/catch.hpp>

#include "rres/core/byte_buffer.hpp"

#include "test_utils.hpp"

#include <vector>

using rres::ByteReader;
using rres::ByteWriter;
using rres::ErrorCode;

TEST_CASE("ByteWriter writes little-endian", "[core][bytes]") {
    ByteWriter w;
    w.write_u16(0x0102);
    w.write_u32(0xA1B2C3D4u);
    w.write_fourcc({{'r', 'r', 'e', 's'}});

    const std::vector<std::uint8_t> expected{0x02, 0x01, 0xD4, 0xC3, 0xB2, 0xA1, 'r', 'r', 'e', 's'};
    const auto data = w.take();
    REQUIRE(data == expected);
}

TEST_CASE("ByteReader reads what ByteWriter wrote", "[core][bytes]") {
    ByteWriter w;
    w.write_u8(7);
    w.write_u16(100);
    w.write_u32(3342539433u);
    w.write_bytes(std::string_view("abc"));
    const auto data = w.take();

    ByteReader r(data);
    REQUIRE(r.read_u8() == 7);
    REQUIRE(r.read_u16() == 100);
    REQUIRE(r.read_u32() == 3342539433u);
    const auto tail = r.read_bytes(3);
    REQUIRE(std::string(tail.begin(), tail.end()) == "abc");
    REQUIRE(r.at_end());
}

TEST_CASE("ByteReader refuses to read past the end", "[core][bytes]") {
    const std::vector<std::uint8_t> data{1, 2, 3};
    ByteReader r(data);

    REQUIRE(test_helpers::error_code_of([&] { r.read_u32(); }) == ErrorCode::InsufficientData);
    // Failed read does not move the cursor.
    REQUIRE(r.position() == 0);

    REQUIRE(r.read_u16() == 0x0201);
    REQUIRE(test_helpers::error_code_of([&] { r.read_bytes(2); }) == ErrorCode::InsufficientData);
    REQUIRE(test_helpers::error_code_of([&] { r.skip(static_cast<std::size_t>(-1)); }) == ErrorCode::InsufficientData);
    REQUIRE(r.remaining() == 1);
}
