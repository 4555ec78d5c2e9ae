#include "inspect_options.hpp"

#include <iostream>

namespace rres::tools {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " --input <file.rres> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --input, -i <file>    Container to inspect.\n"
              << "  --config, -c <file>   INI settings ([logging], [reader], [inspect]).\n"
              << "  --list, -l            List all chunk descriptors.\n"
              << "  --directory, -d       Print the central directory.\n"
              << "  --id <n>              Load the chunk with this id.\n"
              << "  --name, -n <path>     Load the chunk registered under this directory name.\n"
              << "  --dump                Hex dump the start of the loaded chunk's raw data.\n"
              << "  --verbose, -v         Debug-level logging.\n"
              << "  --help, -h            Show this help message.\n";
}

bool parse_id(const std::string& text, std::uint32_t& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }

    // Stops at the first digit that leaves the u32 range.
    std::uint64_t value = 0;
    for (char c : text) {
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
        if (value > 0xFFFFFFFFull) {
            return false;
        }
    }
    out = static_cast<std::uint32_t>(value);
    return true;
}

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return false;
        } else if (arg == "--input" || arg == "-i") {
            if (++i >= argc) {
                std::cerr << "Error: --input requires a file path.\n";
                return false;
            }
            opts.inputFile = argv[i];
        } else if (arg == "--config" || arg == "-c") {
            if (++i >= argc) {
                std::cerr << "Error: --config requires a file path.\n";
                return false;
            }
            opts.configFile = argv[i];
        } else if (arg == "--list" || arg == "-l") {
            opts.list = true;
        } else if (arg == "--directory" || arg == "-d") {
            opts.directory = true;
        } else if (arg == "--id") {
            std::uint32_t id = 0;
            if (++i >= argc || !parse_id(argv[i], id)) {
                std::cerr << "Error: --id requires an unsigned 32-bit number.\n";
                return false;
            }
            opts.id = id;
        } else if (arg == "--name" || arg == "-n") {
            if (++i >= argc) {
                std::cerr << "Error: --name requires a resource path.\n";
                return false;
            }
            opts.name = argv[i];
        } else if (arg == "--dump") {
            opts.dump = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return false;
        }
    }

    if (opts.inputFile.empty()) {
        std::cerr << "Error: --input is required.\n";
        return false;
    }
    if (opts.id && opts.name) {
        std::cerr << "Error: --id and --name are mutually exclusive.\n";
        return false;
    }

    // Nothing selected: show everything cheap.
    if (!opts.list && !opts.directory && !opts.id && !opts.name) {
        opts.list = true;
        opts.directory = true;
    }

    return true;
}

} // namespace rres::tools
