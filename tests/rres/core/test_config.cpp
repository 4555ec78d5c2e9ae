/**
 * @file test_config.cpp
 * @brief Unit tests for INI configuration loading.
 */

#include <catch2/catch.hpp>

#include "rres/core/config.hpp"

#include "rres_builder.hpp"

#include <fstream>
#include <string>

#include <raylib.h>

using rres::core::Config;

namespace {

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream ofs(path);
    ofs << text;
}

} // namespace

TEST_CASE("Config defaults", "[core][config]") {
    const Config config;
    REQUIRE(config.logging().enabled);
    REQUIRE(config.logging().level == LOG_INFO);
    REQUIRE(config.logging().file.empty());
    REQUIRE(config.reader_limits().maxNameLength == rres::format::RRES_DEFAULT_MAX_NAME_LENGTH);
    REQUIRE(config.reader_limits().maxDirectoryEntries == rres::format::RRES_DEFAULT_MAX_DIRECTORY_ENTRIES);
    REQUIRE(config.reader_limits().maxChainLength == rres::format::RRES_DEFAULT_MAX_CHAIN_LENGTH);
    REQUIRE(config.inspect().hexdump_bytes == 64);
    REQUIRE(config.inspect().show_properties);
    REQUIRE(config.loaded_from_path().empty());
}

TEST_CASE("Config loads every section", "[core][config]") {
    test_helpers::TempFileGuard guard{test_helpers::temp_file_path("config_full.ini")};
    write_text(guard.path,
               "# rres_inspect settings\n"
               "[logging]\n"
               "enabled = false\n"
               "level = debug\n"
               "file = \"inspect.log\"\n"
               "\n"
               "[Reader]\n"
               "max_name_length = 256   ; bytes\n"
               "max_directory_entries = 1000\n"
               "max_chain_length = 32\n"
               "\n"
               "[inspect]\n"
               "hexdump_bytes = 0\n"
               "show_properties = no\n");

    Config config;
    REQUIRE(config.load_from_file(guard.path.string()));
    REQUIRE(config.loaded_from_path() == guard.path.string());

    REQUIRE_FALSE(config.logging().enabled);
    REQUIRE(config.logging().level == LOG_DEBUG);
    REQUIRE(config.logging().file == "inspect.log");
    REQUIRE(config.reader_limits().maxNameLength == 256);
    REQUIRE(config.reader_limits().maxDirectoryEntries == 1000);
    REQUIRE(config.reader_limits().maxChainLength == 32);
    REQUIRE(config.inspect().hexdump_bytes == 0);
    REQUIRE_FALSE(config.inspect().show_properties);
}

TEST_CASE("Config keeps defaults for bad values", "[core][config]") {
    test_helpers::TempFileGuard guard{test_helpers::temp_file_path("config_bad.ini")};
    write_text(guard.path,
               "[logging]\n"
               "enabled = maybe\n"
               "level = loud\n"
               "[reader]\n"
               "max_name_length = -5\n"
               "max_directory_entries = 12abc\n"
               "max_chain_length = 99999999999\n"
               "unknown_key = 1\n"
               "[inspect]\n"
               "hexdump_bytes =\n"
               "not a key value line\n");

    Config config;
    REQUIRE(config.load_from_file(guard.path.string()));

    REQUIRE(config.logging().enabled);
    REQUIRE(config.logging().level == LOG_INFO);
    REQUIRE(config.reader_limits().maxNameLength == rres::format::RRES_DEFAULT_MAX_NAME_LENGTH);
    REQUIRE(config.reader_limits().maxDirectoryEntries == rres::format::RRES_DEFAULT_MAX_DIRECTORY_ENTRIES);
    REQUIRE(config.reader_limits().maxChainLength == rres::format::RRES_DEFAULT_MAX_CHAIN_LENGTH);
    REQUIRE(config.inspect().hexdump_bytes == 64);
}

TEST_CASE("Config accepts numeric log levels", "[core][config]") {
    test_helpers::TempFileGuard guard{test_helpers::temp_file_path("config_level.ini")};
    write_text(guard.path, "[logging]\nlevel = 5\n");

    Config config;
    REQUIRE(config.load_from_file(guard.path.string()));
    REQUIRE(config.logging().level == 5);
}

TEST_CASE("Config reports missing files", "[core][config]") {
    Config config;
    REQUIRE_FALSE(config.load_from_file(test_helpers::temp_file_path("no_such_config.ini").string()));
    REQUIRE(config.loaded_from_path().empty());
    REQUIRE(config.inspect().hexdump_bytes == 64);
}
