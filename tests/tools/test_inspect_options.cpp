/**
 * @file test_inspect_options.cpp
 * @brief Unit tests for rres_inspect command line parsing.
 */

#include <catch2/catch.hpp>

#include "tools/inspect_options.hpp"

#include <string>
#include <utility>
#include <vector>

using rres::tools::Options;
using rres::tools::parse_args;
using rres::tools::parse_id;

namespace {

// argv-style wrapper that owns its strings.
struct Args {
    explicit Args(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& s : storage) {
            argv.push_back(s.data());
        }
    }

    int argc() const { return static_cast<int>(argv.size()); }

    std::vector<std::string> storage;
    std::vector<char*> argv;
};

bool parse(std::vector<std::string> args, Options& opts) {
    args.insert(args.begin(), "rres_inspect");
    Args a(std::move(args));
    return parse_args(a.argc(), a.argv.data(), opts);
}

} // namespace

TEST_CASE("parse_id accepts the full u32 range", "[tools][inspect]") {
    std::uint32_t id = 1;
    REQUIRE(parse_id("0", id));
    REQUIRE(id == 0);
    REQUIRE(parse_id("3342539433", id));
    REQUIRE(id == 3342539433u);
    REQUIRE(parse_id("4294967295", id));
    REQUIRE(id == 4294967295u);
    REQUIRE(parse_id("0000000000007", id));
    REQUIRE(id == 7);
}

TEST_CASE("parse_id rejects malformed and oversized ids", "[tools][inspect]") {
    std::uint32_t id = 42;

    REQUIRE_FALSE(parse_id("", id));
    REQUIRE_FALSE(parse_id("-1", id));
    REQUIRE_FALSE(parse_id("+1", id));
    REQUIRE_FALSE(parse_id(" 1", id));
    REQUIRE_FALSE(parse_id("0x10", id));
    REQUIRE_FALSE(parse_id("4294967296", id));

    SECTION("more digits than an unsigned 64-bit value holds") {
        REQUIRE_FALSE(parse_id("99999999999999999999999", id));
        REQUIRE_FALSE(parse_id(std::string(200, '9'), id));
    }

    // Rejected input leaves the output untouched.
    REQUIRE(id == 42);
}

TEST_CASE("parse_args defaults to listing and directory", "[tools][inspect]") {
    Options opts;
    REQUIRE(parse({"--input", "assets.rres"}, opts));
    REQUIRE(opts.inputFile == "assets.rres");
    REQUIRE(opts.list);
    REQUIRE(opts.directory);
    REQUIRE_FALSE(opts.id.has_value());
}

TEST_CASE("parse_args reads every option", "[tools][inspect]") {
    Options opts;
    REQUIRE(parse({"-i", "a.rres", "-c", "inspect.ini", "--id", "3342539433", "--dump", "-v"}, opts));
    REQUIRE(opts.configFile == "inspect.ini");
    REQUIRE(opts.id == 3342539433u);
    REQUIRE(opts.dump);
    REQUIRE(opts.verbose);
    REQUIRE_FALSE(opts.list);
    REQUIRE_FALSE(opts.directory);

    Options byName;
    REQUIRE(parse({"--input", "a.rres", "--name", "resources/text_data.txt", "-l"}, byName));
    REQUIRE(byName.name == std::string("resources/text_data.txt"));
    REQUIRE(byName.list);
}

TEST_CASE("parse_args usage errors", "[tools][inspect]") {
    Options opts;
    REQUIRE_FALSE(parse({}, opts));
    REQUIRE_FALSE(parse({"--input"}, opts));
    REQUIRE_FALSE(parse({"--input", "a.rres", "--id", "99999999999999999999999"}, opts));
    REQUIRE_FALSE(parse({"--input", "a.rres", "--id"}, opts));
    REQUIRE_FALSE(parse({"--input", "a.rres", "--id", "1", "--name", "x"}, opts));
    REQUIRE_FALSE(parse({"--input", "a.rres", "--bogus"}, opts));
    REQUIRE_FALSE(parse({"--help"}, opts));
}
