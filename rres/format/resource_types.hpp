#pragma once

#include "rres_format.hpp"

#include <cstdint>
#include <string>

namespace rres::format {

// Chunk data type, decoded from the chunk's four-character code.
// Unrecognized is kept apart from Null so unknown tags stay visible.
enum class ResourceDataType : std::uint8_t {
    Null = 0,         // "NULL" - reserved, no data
    Raw = 1,          // "RAWD" - raw file data
    Text = 2,         // "TEXT" - text file data
    Image = 3,        // "IMGE" - pixel data
    Wave = 4,         // "WAVE" - audio samples
    Vertex = 5,       // "VRTX" - vertex attribute array
    FontGlyphs = 6,   // "FNTG" - font glyph info
    Link = 99,        // "LINK" - external file reference
    Directory = 100,  // "CDIR" - central directory
    Unrecognized = 255,
};

enum class CompressionType : std::uint8_t {
    None = 0,
    RLE = 1,
    Deflate = 10,
    LZ4 = 20,
    LZMA2 = 30,
    QOI = 40,
    Unrecognized = 255,
};

enum class CipherType : std::uint8_t {
    None = 0,
    XOR = 1,
    DES = 10,
    TDES = 11,
    IDEA = 20,
    AES = 30,
    AESGCM = 31,
    XTEA = 40,
    Blowfish = 50,
    RSA = 60,
    Salsa20 = 70,
    ChaCha20 = 71,
    XChaCha20 = 72,
    XChaCha20Poly1305 = 73,
    Unrecognized = 255,
};

ResourceDataType data_type_from_fourcc(const FourCC& code);

// Null and Unrecognized map to "NULL".
FourCC fourcc_from_data_type(ResourceDataType type);

CompressionType compression_from_code(std::uint8_t code);
CipherType cipher_from_code(std::uint8_t code);

const char* data_type_name(ResourceDataType type);
const char* compression_name(CompressionType type);
const char* cipher_name(CipherType type);

// Printable form of a tag; non-printable bytes become '?'.
std::string fourcc_to_string(const FourCC& code);

} // namespace rres::format
