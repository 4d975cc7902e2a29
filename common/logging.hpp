#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace brepkit {
namespace logging {

// Map a level name to an spdlog level; unknown names keep the fallback
inline spdlog::level::level_enum parse_level(const std::string& level,
                                             spdlog::level::level_enum fallback) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return fallback;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("brepkit");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        // Set log level from environment variable
        const char* level_env = std::getenv("BREPKIT_LOG_LEVEL");
        if (level_env) {
            log->set_level(parse_level(level_env, spdlog::level::info));
        } else {
            log->set_level(spdlog::level::info);
        }

        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace brepkit
