#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace rres::tools {

struct Options {
    std::string inputFile;
    std::string configFile;
    bool list{false};
    bool directory{false};
    std::optional<std::uint32_t> id;
    std::optional<std::string> name;
    bool dump{false};
    bool verbose{false};
};

void print_usage(const char* program);

// Decimal u32 only; anything else (sign, spaces, overflow) is rejected.
bool parse_id(const std::string& text, std::uint32_t& out);

// Fills `opts` from the command line. Returns false after printing a message
// to stderr for --help and for any usage error.
bool parse_args(int argc, char* argv[], Options& opts);

} // namespace rres::tools
