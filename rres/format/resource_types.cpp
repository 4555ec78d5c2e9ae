#include "resource_types.hpp"

namespace rres::format {

namespace {

struct DataTypeTag {
    ResourceDataType type;
    FourCC code;
    const char* name;
};

constexpr DataTypeTag kDataTypeTags[] = {
    {ResourceDataType::Null, make_fourcc('N', 'U', 'L', 'L'), "Null"},
    {ResourceDataType::Raw, make_fourcc('R', 'A', 'W', 'D'), "Raw"},
    {ResourceDataType::Text, make_fourcc('T', 'E', 'X', 'T'), "Text"},
    {ResourceDataType::Image, make_fourcc('I', 'M', 'G', 'E'), "Image"},
    {ResourceDataType::Wave, make_fourcc('W', 'A', 'V', 'E'), "Wave"},
    {ResourceDataType::Vertex, make_fourcc('V', 'R', 'T', 'X'), "Vertex"},
    {ResourceDataType::FontGlyphs, make_fourcc('F', 'N', 'T', 'G'), "FontGlyphs"},
    {ResourceDataType::Link, make_fourcc('L', 'I', 'N', 'K'), "Link"},
    {ResourceDataType::Directory, make_fourcc('C', 'D', 'I', 'R'), "Directory"},
};

} // namespace

ResourceDataType data_type_from_fourcc(const FourCC& code) {
    for (const auto& tag : kDataTypeTags) {
        if (tag.code == code) {
            return tag.type;
        }
    }
    return ResourceDataType::Unrecognized;
}

FourCC fourcc_from_data_type(ResourceDataType type) {
    for (const auto& tag : kDataTypeTags) {
        if (tag.type == type) {
            return tag.code;
        }
    }
    return kDataTypeTags[0].code;
}

CompressionType compression_from_code(std::uint8_t code) {
    switch (code) {
        case 0: return CompressionType::None;
        case 1: return CompressionType::RLE;
        case 10: return CompressionType::Deflate;
        case 20: return CompressionType::LZ4;
        case 30: return CompressionType::LZMA2;
        case 40: return CompressionType::QOI;
        default: return CompressionType::Unrecognized;
    }
}

CipherType cipher_from_code(std::uint8_t code) {
    switch (code) {
        case 0: return CipherType::None;
        case 1: return CipherType::XOR;
        case 10: return CipherType::DES;
        case 11: return CipherType::TDES;
        case 20: return CipherType::IDEA;
        case 30: return CipherType::AES;
        case 31: return CipherType::AESGCM;
        case 40: return CipherType::XTEA;
        case 50: return CipherType::Blowfish;
        case 60: return CipherType::RSA;
        case 70: return CipherType::Salsa20;
        case 71: return CipherType::ChaCha20;
        case 72: return CipherType::XChaCha20;
        case 73: return CipherType::XChaCha20Poly1305;
        default: return CipherType::Unrecognized;
    }
}

const char* data_type_name(ResourceDataType type) {
    for (const auto& tag : kDataTypeTags) {
        if (tag.type == type) {
            return tag.name;
        }
    }
    return "Unrecognized";
}

const char* compression_name(CompressionType type) {
    switch (type) {
        case CompressionType::None: return "None";
        case CompressionType::RLE: return "RLE";
        case CompressionType::Deflate: return "Deflate";
        case CompressionType::LZ4: return "LZ4";
        case CompressionType::LZMA2: return "LZMA2";
        case CompressionType::QOI: return "QOI";
        case CompressionType::Unrecognized: break;
    }
    return "Unrecognized";
}

const char* cipher_name(CipherType type) {
    switch (type) {
        case CipherType::None: return "None";
        case CipherType::XOR: return "XOR";
        case CipherType::DES: return "DES";
        case CipherType::TDES: return "3DES";
        case CipherType::IDEA: return "IDEA";
        case CipherType::AES: return "AES";
        case CipherType::AESGCM: return "AES-GCM";
        case CipherType::XTEA: return "XTEA";
        case CipherType::Blowfish: return "Blowfish";
        case CipherType::RSA: return "RSA";
        case CipherType::Salsa20: return "Salsa20";
        case CipherType::ChaCha20: return "ChaCha20";
        case CipherType::XChaCha20: return "XChaCha20";
        case CipherType::XChaCha20Poly1305: return "XChaCha20-Poly1305";
        case CipherType::Unrecognized: break;
    }
    return "Unrecognized";
}

std::string fourcc_to_string(const FourCC& code) {
    std::string out;
    out.reserve(code.size());
    for (std::uint8_t c : code) {
        out += (c >= 0x20 && c < 0x7F) ? static_cast<char>(c) : '?';
    }
    return out;
}

} // namespace rres::format
