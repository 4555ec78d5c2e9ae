// rres_inspect - CLI tool for inspecting rres resource containers.
//
// Usage:
//   rres_inspect --input <file.rres> [options]
//
// Options:
//   --input, -i <file>    Container to inspect.
//   --config, -c <file>   INI settings ([logging], [reader], [inspect]).
//   --list, -l            List all chunk descriptors.
//   --directory, -d       Print the central directory.
//   --id <n>              Load the chunk with this id.
//   --name, -n <path>     Load the chunk registered under this directory name.
//   --dump                Hex dump the start of the loaded chunk's raw data.
//   --verbose, -v         Debug-level logging.
//   --help, -h            Show this help message.

#include "rres/core/config.hpp"
#include "rres/core/error.hpp"
#include "rres/core/logger.hpp"
#include "rres/format/properties.hpp"
#include "rres/reader/resource_file.hpp"
#include "tools/inspect_options.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include <raylib.h>

void print_info(const rres::reader::ChunkInfo& info) {
    char line[192];
    std::snprintf(line, sizeof(line), "%-4s  id=%-10u  comp=%-8s  cipher=%-8s  packed=%-8u  base=%-8u  next=%u  crc=0x%08X",
                  info.type_tag_string().c_str(), static_cast<unsigned>(info.id),
                  rres::format::compression_name(info.compression()), rres::format::cipher_name(info.cipher()),
                  static_cast<unsigned>(info.packedSize), static_cast<unsigned>(info.baseSize),
                  static_cast<unsigned>(info.nextOffset), static_cast<unsigned>(info.crc32));
    std::cout << line << "\n";
}

void hex_dump(const std::vector<std::uint8_t>& data, std::size_t limit) {
    const std::size_t count = std::min(limit, data.size());
    char line[96];

    for (std::size_t row = 0; row < count; row += 16) {
        int n = std::snprintf(line, sizeof(line), "  %08zx ", row);
        std::string ascii;
        for (std::size_t col = 0; col < 16; ++col) {
            const std::size_t idx = row + col;
            if (idx < count) {
                n += std::snprintf(line + n, sizeof(line) - static_cast<std::size_t>(n), " %02x", data[idx]);
                ascii += (data[idx] >= 0x20 && data[idx] < 0x7F) ? static_cast<char>(data[idx]) : '.';
            } else {
                n += std::snprintf(line + n, sizeof(line) - static_cast<std::size_t>(n), "   ");
            }
        }
        std::cout << line << "  |" << ascii << "|\n";
    }

    if (count < data.size()) {
        std::cout << "  ... " << (data.size() - count) << " more bytes\n";
    }
}

void print_chunk(const rres::reader::Chunk& chunk, const rres::core::InspectConfig& cfg, bool dump) {
    print_info(chunk.info);

    if (chunk.info.needs_transform()) {
        std::cout << "  (compressed/encrypted payload, " << chunk.data.raw.size() << " bytes, properties unavailable)\n";
    } else if (cfg.show_properties) {
        const auto type = chunk.info.data_type();
        for (std::size_t i = 0; i < chunk.data.props.size(); ++i) {
            std::cout << "  " << rres::format::describe_property(type, i, chunk.data.props[i]) << "\n";
        }
        std::cout << "  raw: " << chunk.data.raw.size() << " bytes\n";
    }

    if (dump) {
        hex_dump(chunk.data.raw, cfg.hexdump_bytes);
    }
}

int run(const rres::tools::Options& opts, const rres::core::Config& config) {
    const rres::reader::ResourceFile file(opts.inputFile, config.reader_limits());

    if (opts.list) {
        const auto infos = file.list_chunks();
        std::cout << opts.inputFile << ": " << infos.size() << " chunks\n";
        for (const auto& info : infos) {
            print_info(info);
        }
    }

    if (opts.directory) {
        const auto dir = file.load_directory();
        std::cout << "Central directory: " << dir.size() << " entries\n";
        for (const auto& entry : dir.entries()) {
            std::cout << "  " << entry.id << "  @" << entry.offset << "  " << entry.logical_name() << "\n";
        }
    }

    if (opts.id) {
        print_chunk(file.fetch_by_id(*opts.id), config.inspect(), opts.dump);
    } else if (opts.name) {
        print_chunk(file.fetch_by_name(*opts.name), config.inspect(), opts.dump);
    }

    return 0;
}

int main(int argc, char* argv[]) {
    rres::tools::Options opts;
    if (!rres::tools::parse_args(argc, argv, opts)) {
        return 1;
    }

    auto& config = rres::core::Config::instance();
    if (!opts.configFile.empty() && !config.load_from_file(opts.configFile)) {
        std::cerr << "Error: Cannot read config file: " << opts.configFile << "\n";
        return 1;
    }

    rres::core::LoggingConfig logging = config.logging();
    if (opts.verbose) {
        logging.enabled = true;
        logging.level = LOG_DEBUG;
    }
    rres::core::Logger::instance().init(logging);

    int rc = 1;
    try {
        rc = run(opts, config);
    } catch (const rres::Error& e) {
        std::cerr << "Error [" << rres::error_code_name(e.code()) << "]: " << e.what() << "\n";
        rc = 1;
    }

    rres::core::Logger::instance().shutdown();
    return rc;
}
