#include "properties.hpp"

#include <array>

namespace rres::format {

namespace {

using Labels = std::array<const char*, 4>;

Labels labels_for(ResourceDataType type) {
    switch (type) {
        case ResourceDataType::Raw: return {"size", "extension01", "extension02", nullptr};
        case ResourceDataType::Text: return {"size", "encoding", "code_lang", "culture_code"};
        case ResourceDataType::Image: return {"width", "height", "pixel_format", "mipmaps"};
        case ResourceDataType::Wave: return {"frame_count", "sample_rate", "sample_size", "channels"};
        case ResourceDataType::Vertex: return {"vertex_count", "attribute", "component_count", "format"};
        case ResourceDataType::FontGlyphs: return {"base_size", "glyph_count", "glyph_padding", "style"};
        case ResourceDataType::Link: return {"size", nullptr, nullptr, nullptr};
        case ResourceDataType::Directory: return {"entry_count", nullptr, nullptr, nullptr};
        default: break;
    }
    return {nullptr, nullptr, nullptr, nullptr};
}

// Enumerated slot -> name lookup, nullptr for plain numbers.
const char* enumerated_value_name(ResourceDataType type, std::size_t index, std::uint32_t value) {
    switch (type) {
        case ResourceDataType::Text:
            if (index == 1) return text_encoding_name(value);
            if (index == 2) return code_lang_name(value);
            break;
        case ResourceDataType::Image:
            if (index == 2) return pixel_format_name(value);
            break;
        case ResourceDataType::Vertex:
            if (index == 1) return vertex_attribute_name(value);
            if (index == 3) return vertex_format_name(value);
            break;
        case ResourceDataType::FontGlyphs:
            if (index == 3) return font_style_name(value);
            break;
        default:
            break;
    }
    return nullptr;
}

} // namespace

const char* property_label(ResourceDataType type, std::size_t index) {
    const Labels labels = labels_for(type);
    if (index >= labels.size()) {
        return nullptr;
    }
    return labels[index];
}

std::string describe_property(ResourceDataType type, std::size_t index, std::uint32_t value) {
    std::string out;
    if (const char* label = property_label(type, index)) {
        out = label;
    } else {
        out = "prop[" + std::to_string(index) + "]";
    }
    out += '=';

    const char* name = enumerated_value_name(type, index, value);
    if (name) {
        out += name;
    } else {
        out += std::to_string(value);
    }
    return out;
}

const char* text_encoding_name(std::uint32_t value) {
    switch (static_cast<TextEncoding>(value)) {
        case TextEncoding::Undefined: return "Undefined";
        case TextEncoding::UTF8: return "UTF8";
        case TextEncoding::UTF8BOM: return "UTF8-BOM";
        case TextEncoding::UTF16LE: return "UTF16-LE";
        case TextEncoding::UTF16BE: return "UTF16-BE";
    }
    return "Unknown";
}

const char* code_lang_name(std::uint32_t value) {
    switch (static_cast<CodeLang>(value)) {
        case CodeLang::Undefined: return "Undefined";
        case CodeLang::C: return "C";
        case CodeLang::CPP: return "C++";
        case CodeLang::CS: return "C#";
        case CodeLang::Lua: return "Lua";
        case CodeLang::JS: return "JavaScript";
        case CodeLang::Python: return "Python";
        case CodeLang::Rust: return "Rust";
        case CodeLang::Zig: return "Zig";
        case CodeLang::Odin: return "Odin";
        case CodeLang::Jai: return "Jai";
        case CodeLang::GDScript: return "GDScript";
        case CodeLang::GLSL: return "GLSL";
    }
    return "Unknown";
}

const char* pixel_format_name(std::uint32_t value) {
    switch (static_cast<PixelFormat>(value)) {
        case PixelFormat::Undefined: return "Undefined";
        case PixelFormat::UncompGrayscale: return "GRAYSCALE";
        case PixelFormat::UncompGrayAlpha: return "GRAY_ALPHA";
        case PixelFormat::UncompR5G6B5: return "R5G6B5";
        case PixelFormat::UncompR8G8B8: return "R8G8B8";
        case PixelFormat::UncompR5G5B5A1: return "R5G5B5A1";
        case PixelFormat::UncompR4G4B4A4: return "R4G4B4A4";
        case PixelFormat::UncompR8G8B8A8: return "R8G8B8A8";
        case PixelFormat::UncompR32: return "R32";
        case PixelFormat::UncompR32G32B32: return "R32G32B32";
        case PixelFormat::UncompR32G32B32A32: return "R32G32B32A32";
        case PixelFormat::CompDXT1RGB: return "DXT1_RGB";
        case PixelFormat::CompDXT1RGBA: return "DXT1_RGBA";
        case PixelFormat::CompDXT3RGBA: return "DXT3_RGBA";
        case PixelFormat::CompDXT5RGBA: return "DXT5_RGBA";
        case PixelFormat::CompETC1RGB: return "ETC1_RGB";
        case PixelFormat::CompETC2RGB: return "ETC2_RGB";
        case PixelFormat::CompETC2EACRGBA: return "ETC2_EAC_RGBA";
        case PixelFormat::CompPVRTRGB: return "PVRT_RGB";
        case PixelFormat::CompPVRTRGBA: return "PVRT_RGBA";
        case PixelFormat::CompASTC4x4RGBA: return "ASTC_4x4_RGBA";
        case PixelFormat::CompASTC8x8RGBA: return "ASTC_8x8_RGBA";
    }
    return "Unknown";
}

const char* vertex_attribute_name(std::uint32_t value) {
    switch (static_cast<VertexAttribute>(value)) {
        case VertexAttribute::Position: return "Position";
        case VertexAttribute::TexCoord1: return "TexCoord1";
        case VertexAttribute::TexCoord2: return "TexCoord2";
        case VertexAttribute::TexCoord3: return "TexCoord3";
        case VertexAttribute::TexCoord4: return "TexCoord4";
        case VertexAttribute::Normal: return "Normal";
        case VertexAttribute::Tangent: return "Tangent";
        case VertexAttribute::Color: return "Color";
        case VertexAttribute::Index: return "Index";
    }
    return "Unknown";
}

const char* vertex_format_name(std::uint32_t value) {
    switch (static_cast<VertexFormat>(value)) {
        case VertexFormat::UByte: return "UByte";
        case VertexFormat::Byte: return "Byte";
        case VertexFormat::UShort: return "UShort";
        case VertexFormat::Short: return "Short";
        case VertexFormat::UInt: return "UInt";
        case VertexFormat::Int: return "Int";
        case VertexFormat::HFloat: return "HFloat";
        case VertexFormat::Float: return "Float";
    }
    return "Unknown";
}

const char* font_style_name(std::uint32_t value) {
    switch (static_cast<FontStyle>(value)) {
        case FontStyle::Undefined: return "Undefined";
        case FontStyle::Regular: return "Regular";
        case FontStyle::Bold: return "Bold";
        case FontStyle::Italic: return "Italic";
    }
    return "Unknown";
}

} // namespace rres::format
