#pragma once

#include "rres/reader/reader_limits.hpp"

#include <cstdint>
#include <string>

namespace rres::core {

struct LoggingConfig {
    bool enabled{true};
    int level{0};  // raylib TraceLogLevel
    std::string file{};
};

struct InspectConfig {
    std::uint32_t hexdump_bytes{64};
    bool show_properties{true};
};

struct ToolConfig {
    LoggingConfig logging{};
    reader::ReaderLimits reader{};
    InspectConfig inspect{};
};

// INI-style settings:
//
//   [logging]  enabled, level, file
//   [reader]   max_name_length, max_directory_entries, max_chain_length
//   [inspect]  hexdump_bytes, show_properties
//
// Unknown keys are ignored; unparsable values keep their current value.
class Config {
public:
    Config();

    static Config& instance();

    // @return false if the file cannot be opened.
    bool load_from_file(const std::string& path);

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const ToolConfig& get() const { return config_; }

    const LoggingConfig& logging() const { return config_.logging; }
    const reader::ReaderLimits& reader_limits() const { return config_.reader; }
    const InspectConfig& inspect() const { return config_.inspect; }

private:
    ToolConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);
    static std::string strip_quotes(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);
    static std::uint32_t parse_u32(const std::string& v, std::uint32_t default_value);

    static int log_level_from_string(const std::string& v, int default_value);

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace rres::core
