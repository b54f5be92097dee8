/**
 * @file log.hpp
 * @brief Minimal level-filtered logger.
 *
 * Lines go to stderr prefixed with "[structured_view]". The threshold is
 * set by logx::init() or, when left at the default, by the
 * STRUCTURED_VIEW_LOG environment variable (quiet|error|warn|info|debug).
 */

#pragma once

#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace structured_view::logx {

enum class Level : int {
    Quiet = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

struct Config {
    Level level = Level::Info;  ///< Threshold (STRUCTURED_VIEW_LOG overrides the default)
};

inline Level level_from_env() {
    const char* v = std::getenv("STRUCTURED_VIEW_LOG");
    if (!v) {
        return Level::Info;
    }
    std::string s(v);
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (s == "quiet") return Level::Quiet;
    if (s == "error") return Level::Error;
    if (s == "warn" || s == "warning") return Level::Warn;
    if (s == "info") return Level::Info;
    if (s == "debug") return Level::Debug;
    return Level::Info;
}

inline std::atomic<Level>& level_ref() {
    static std::atomic<Level> level{level_from_env()};
    return level;
}

inline void init(const Config& cfg = {}) {
    level_ref().store(cfg.level == Level::Info ? level_from_env() : cfg.level);
}

inline void set_level(Level level) {
    level_ref().store(level);
}

inline bool enabled(Level level) {
    return static_cast<int>(level) <= static_cast<int>(level_ref().load());
}

inline void vlog(Level level, const char* tag, const char* fmt, std::va_list ap) {
    if (!enabled(level)) {
        return;
    }
    std::fprintf(stderr, "[structured_view] %s: ", tag);
    std::vfprintf(stderr, fmt, ap);
    std::fputc('\n', stderr);
}

inline void error(const char* fmt, ...) {
    std::va_list ap;
    va_start(ap, fmt);
    vlog(Level::Error, "error", fmt, ap);
    va_end(ap);
}

inline void warn(const char* fmt, ...) {
    std::va_list ap;
    va_start(ap, fmt);
    vlog(Level::Warn, "warn", fmt, ap);
    va_end(ap);
}

inline void info(const char* fmt, ...) {
    std::va_list ap;
    va_start(ap, fmt);
    vlog(Level::Info, "info", fmt, ap);
    va_end(ap);
}

inline void debug(const char* fmt, ...) {
    std::va_list ap;
    va_start(ap, fmt);
    vlog(Level::Debug, "debug", fmt, ap);
    va_end(ap);
}

}  // namespace structured_view::logx
