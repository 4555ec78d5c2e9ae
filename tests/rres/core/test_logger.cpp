/**
 * @file test_logger.cpp
 * @brief Unit tests for the TraceLog file sink.
 */

#include <catch2/catch.hpp>

#include "rres/core/logger.hpp"

#include "rres_builder.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <raylib.h>

using rres::core::Logger;
using rres::core::LoggingConfig;

namespace {

std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

LoggingConfig file_config(const std::filesystem::path& path, int level) {
    LoggingConfig cfg;
    cfg.enabled = true;
    cfg.level = level;
    cfg.file = path.string();
    return cfg;
}

} // namespace

TEST_CASE("Logger writes TraceLog lines to the file sink", "[core][logger]") {
    test_helpers::TempFileGuard guard{test_helpers::temp_file_path("logger_sink.log")};
    std::filesystem::remove(guard.path);

    auto& logger = Logger::instance();
    logger.init(file_config(guard.path, LOG_INFO));
    REQUIRE(logger.has_file_sink());
    REQUIRE(logger.level() == LOG_INFO);

    TraceLog(LOG_WARNING, "[rres] sink check %d", 42);
    TraceLog(LOG_DEBUG, "[rres] below the level");
    logger.shutdown();
    REQUIRE_FALSE(logger.has_file_sink());

    // Not routed to the file once the sink is closed.
    TraceLog(LOG_WARNING, "[rres] after shutdown");

    const std::string text = read_text(guard.path);
    REQUIRE(text.find("[WARN] [rres] sink check 42\n") != std::string::npos);
    REQUIRE(text.find("below the level") == std::string::npos);
    REQUIRE(text.find("after shutdown") == std::string::npos);
}

TEST_CASE("Logger appends across init calls", "[core][logger]") {
    test_helpers::TempFileGuard guard{test_helpers::temp_file_path("logger_append.log")};
    std::filesystem::remove(guard.path);

    auto& logger = Logger::instance();
    logger.init(file_config(guard.path, LOG_INFO));
    TraceLog(LOG_INFO, "[rres] first run");
    logger.init(file_config(guard.path, LOG_INFO));
    TraceLog(LOG_ERROR, "[rres] second run");
    logger.shutdown();

    const std::string text = read_text(guard.path);
    const auto first = text.find("[INFO] [rres] first run");
    const auto second = text.find("[ERROR] [rres] second run");
    REQUIRE(first != std::string::npos);
    REQUIRE(second != std::string::npos);
    REQUIRE(first < second);
}

TEST_CASE("Logger without a usable file", "[core][logger]") {
    auto& logger = Logger::instance();

    SECTION("no file configured") {
        LoggingConfig cfg;
        cfg.level = LOG_DEBUG;
        logger.init(cfg);
        REQUIRE_FALSE(logger.has_file_sink());
        REQUIRE(logger.level() == LOG_DEBUG);
    }

    SECTION("file cannot be opened") {
        const auto path = test_helpers::temp_file_path("no_such_dir") / "inspect.log";
        logger.init(file_config(path, LOG_INFO));
        REQUIRE_FALSE(logger.has_file_sink());
    }

    SECTION("disabled") {
        test_helpers::TempFileGuard guard{test_helpers::temp_file_path("logger_disabled.log")};
        auto cfg = file_config(guard.path, LOG_DEBUG);
        cfg.enabled = false;
        logger.init(cfg);
        REQUIRE_FALSE(logger.has_file_sink());
        REQUIRE(logger.level() == LOG_NONE);
    }

    logger.shutdown();
    logger.shutdown();
    REQUIRE_FALSE(logger.has_file_sink());
}
