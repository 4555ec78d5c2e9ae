#include "logger.hpp"

#include <raylib.h>

namespace rres::core {

namespace {

const char* level_name(int logLevel) {
    switch (logLevel) {
        case LOG_TRACE: return "TRACE";
        case LOG_DEBUG: return "DEBUG";
        case LOG_WARNING: return "WARN";
        case LOG_ERROR: return "ERROR";
        case LOG_FATAL: return "FATAL";
        default: return "INFO";
    }
}

} // namespace

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::~Logger() {
    if (sink_) {
        std::fclose(sink_);
    }
}

void Logger::init(const LoggingConfig& cfg) {
    shutdown();

    level_ = cfg.enabled ? cfg.level : LOG_NONE;
    SetTraceLogLevel(level_);
    if (!cfg.enabled || cfg.file.empty()) {
        return;
    }

    sink_ = std::fopen(cfg.file.c_str(), "a");
    if (!sink_) {
        TraceLog(LOG_WARNING, "[rres] Cannot open log file %s, keeping default output", cfg.file.c_str());
        return;
    }

    start_ = std::chrono::steady_clock::now();
    SetTraceLogCallback(&Logger::on_trace);
    TraceLog(LOG_DEBUG, "[rres] Logging to %s", cfg.file.c_str());
}

void Logger::shutdown() {
    if (!sink_) {
        return;
    }
    SetTraceLogCallback(nullptr);
    std::fclose(sink_);
    sink_ = nullptr;
}

void Logger::write(std::FILE* out, const char* levelName, const char* text, va_list args) const {
    const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    std::fprintf(out, "[%.3f][%s] ", seconds, levelName);
    std::vfprintf(out, text, args);
    std::fputc('\n', out);
}

// raylib only calls this for lines at or above the configured level.
void Logger::on_trace(int logLevel, const char* text, va_list args) {
    const Logger& self = instance();
    if (!self.sink_) {
        return;
    }

    va_list mirror;
    va_copy(mirror, args);

    const char* name = level_name(logLevel);
    self.write(self.sink_, name, text, args);
    std::fflush(self.sink_);
    self.write(stderr, name, text, mirror);

    va_end(mirror);
}

} // namespace rres::core
