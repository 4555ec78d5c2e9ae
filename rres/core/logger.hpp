#pragma once

#include "config.hpp"

#include <chrono>
#include <cstdarg>
#include <cstdio>

namespace rres::core {

// Installs the process-wide raylib TraceLog settings for the tools.
//
// init() sets the level and, when cfg.file is set, routes every TraceLog line
// to that file (append mode) as "[seconds][LEVEL] text", mirrored to stderr.
// Without a file raylib's own output is left in place.
class Logger {
public:
    static Logger& instance();

    void init(const LoggingConfig& cfg);

    // Removes the callback and closes the sink. Safe to call repeatedly.
    void shutdown();

    bool has_file_sink() const { return sink_ != nullptr; }
    int level() const { return level_; }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(std::FILE* out, const char* levelName, const char* text, va_list args) const;

    static void on_trace(int logLevel, const char* text, va_list args);

    std::FILE* sink_{nullptr};
    int level_{0};
    std::chrono::steady_clock::time_point start_{std::chrono::steady_clock::now()};
};

} // namespace rres::core
