#pragma once

#include "resource_types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace rres::format {

// Property vocabularies used by the conventional property slots of each
// data type. The reader never interprets them; they exist for labelling.

enum class TextEncoding : std::uint32_t {
    Undefined = 0,
    UTF8 = 1,
    UTF8BOM = 2,
    UTF16LE = 10,
    UTF16BE = 11,
};

enum class CodeLang : std::uint32_t {
    Undefined = 0,
    C,
    CPP,
    CS,
    Lua,
    JS,
    Python,
    Rust,
    Zig,
    Odin,
    Jai,
    GDScript,
    GLSL,
};

enum class PixelFormat : std::uint32_t {
    Undefined = 0,
    UncompGrayscale = 1,
    UncompGrayAlpha,
    UncompR5G6B5,
    UncompR8G8B8,
    UncompR5G5B5A1,
    UncompR4G4B4A4,
    UncompR8G8B8A8,
    UncompR32,
    UncompR32G32B32,
    UncompR32G32B32A32,
    CompDXT1RGB,
    CompDXT1RGBA,
    CompDXT3RGBA,
    CompDXT5RGBA,
    CompETC1RGB,
    CompETC2RGB,
    CompETC2EACRGBA,
    CompPVRTRGB,
    CompPVRTRGBA,
    CompASTC4x4RGBA,
    CompASTC8x8RGBA,
};

enum class VertexAttribute : std::uint32_t {
    Position = 0,
    TexCoord1 = 10,
    TexCoord2 = 11,
    TexCoord3 = 12,
    TexCoord4 = 13,
    Normal = 20,
    Tangent = 30,
    Color = 40,
    Index = 100,
};

enum class VertexFormat : std::uint32_t {
    UByte = 0,
    Byte,
    UShort,
    Short,
    UInt,
    Int,
    HFloat,
    Float,
};

enum class FontStyle : std::uint32_t {
    Undefined = 0,
    Regular,
    Bold,
    Italic,
};

// Name of property slot `index` for a data type, or nullptr when the slot has
// no conventional meaning.
const char* property_label(ResourceDataType type, std::size_t index);

// "label=value" with enumerated values spelled out, e.g. "encoding=UTF8".
// Unlabelled slots render as "prop[i]=value".
std::string describe_property(ResourceDataType type, std::size_t index, std::uint32_t value);

const char* text_encoding_name(std::uint32_t value);
const char* code_lang_name(std::uint32_t value);
const char* pixel_format_name(std::uint32_t value);
const char* vertex_attribute_name(std::uint32_t value);
const char* vertex_format_name(std::uint32_t value);
const char* font_style_name(std::uint32_t value);

} // namespace rres::format
