/**
 * @file test_chunk_info.cpp
 * @brief Unit tests for chunk descriptor parsing.
 */

#include <catch2/catch.hpp>

#include "rres/core/byte_buffer.hpp"
#include "rres/reader/byte_source.hpp"
#include "rres/reader/chunk_info.hpp"

#include "test_utils.hpp"

#include <vector>

using namespace rres::reader;
using rres::ErrorCode;
using rres::format::ResourceDataType;
using rres::format::make_fourcc;

namespace {

std::vector<std::uint8_t> encode_info(const rres::format::FourCC& type, std::uint8_t comp, std::uint8_t cipher) {
    rres::ByteWriter w;
    w.write_fourcc(type);
    w.write_u32(42);          // id
    w.write_u8(comp);
    w.write_u8(cipher);
    w.write_u16(0x0102);      // flags
    w.write_u32(100);         // packed size
    w.write_u32(96);          // base size
    w.write_u32(1234);        // next offset
    w.write_u32(0);           // reserved
    w.write_u32(0xCAFEBABEu); // crc32
    return w.take();
}

} // namespace

TEST_CASE("read_chunk_info decodes every descriptor field", "[reader][chunk_info]") {
    const auto data = encode_info(make_fourcc('I', 'M', 'G', 'E'), 0, 0);
    REQUIRE(data.size() == rres::format::RRES_CHUNK_INFO_SIZE);

    MemorySource source(data);
    const ChunkInfo info = read_chunk_info(source);

    REQUIRE(info.type_tag_string() == "IMGE");
    REQUIRE(info.id == 42);
    REQUIRE(info.compType == 0);
    REQUIRE(info.cipherType == 0);
    REQUIRE(info.flags == 0x0102);
    REQUIRE(info.packedSize == 100);
    REQUIRE(info.baseSize == 96);
    REQUIRE(info.nextOffset == 1234);
    REQUIRE(info.crc32 == 0xCAFEBABEu);
    REQUIRE(info.type_is(ResourceDataType::Image));
    REQUIRE_FALSE(info.type_is(ResourceDataType::Null));
    REQUIRE_FALSE(info.needs_transform());
    REQUIRE(source.remaining() == 0);
}

TEST_CASE("needs_transform follows compression and cipher codes", "[reader][chunk_info]") {
    ChunkInfo info;
    REQUIRE_FALSE(info.needs_transform());

    info.compType = 10;
    REQUIRE(info.needs_transform());
    REQUIRE(info.compression() == rres::format::CompressionType::Deflate);

    info.compType = 0;
    info.cipherType = 30;
    REQUIRE(info.needs_transform());
    REQUIRE(info.cipher() == rres::format::CipherType::AES);
}

TEST_CASE("Unknown type tags are unrecognized, not Null", "[reader][chunk_info]") {
    const auto data = encode_info(make_fourcc('Z', 'Z', 'Z', 'Z'), 0, 0);
    MemorySource source(data);
    const ChunkInfo info = read_chunk_info(source);

    REQUIRE(info.data_type() == ResourceDataType::Unrecognized);
    REQUIRE_FALSE(info.type_is(ResourceDataType::Null));
}

TEST_CASE("read_chunk_info on a short source", "[reader][chunk_info]") {
    auto data = encode_info(make_fourcc('T', 'E', 'X', 'T'), 0, 0);
    data.resize(rres::format::RRES_CHUNK_INFO_SIZE - 1);
    MemorySource source(data);

    REQUIRE(test_helpers::error_code_of([&] { read_chunk_info(source); }) == ErrorCode::InsufficientData);
}

TEST_CASE("Descriptor records are 32 bytes", "[reader][chunk_info]") {
    STATIC_REQUIRE(rres::format::RRES_CHUNK_INFO_SIZE == 4 + 4 + 1 + 1 + 2 + 4 + 4 + 4 + 4 + 4);
    STATIC_REQUIRE(rres::format::RRES_CHUNK_INFO_SIZE == 32);

    // Two descriptors back to back: the second decodes from offset 32.
    auto data = encode_info(make_fourcc('T', 'E', 'X', 'T'), 0, 0);
    const auto second = encode_info(make_fourcc('R', 'A', 'W', 'D'), 10, 0);
    data.insert(data.end(), second.begin(), second.end());

    MemorySource source(data);
    const ChunkInfo a = read_chunk_info(source);
    REQUIRE(source.position() == 32);
    const ChunkInfo b = read_chunk_info(source);
    REQUIRE(source.position() == 64);

    REQUIRE(a.type_is(ResourceDataType::Text));
    REQUIRE(a.crc32 == 0xCAFEBABEu);
    REQUIRE(b.type_is(ResourceDataType::Raw));
    REQUIRE(b.compression() == rres::format::CompressionType::Deflate);
    REQUIRE(b.crc32 == 0xCAFEBABEu);
}
