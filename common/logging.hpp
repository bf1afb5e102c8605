#ifndef SYMPARTS_COMMON_LOGGING_HPP
#define SYMPARTS_COMMON_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace symparts {
namespace logging {

inline spdlog::level::level_enum parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::get("symparts");
        if (!log) {
            log = spdlog::stderr_color_mt("symparts");
        }
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        // Set log level from environment variable
        const char* level_env = std::getenv("SYMPARTS_LOG_LEVEL");
        if (level_env) {
            log->set_level(parse_level(level_env));
        } else {
            log->set_level(spdlog::level::info);
        }

        return log;
    }();
    return logger;
}

// Raise verbosity for the current process (used by the CLI -v flag)
inline void set_verbose(bool verbose) {
    if (verbose) {
        get_logger()->set_level(spdlog::level::debug);
    }
}

}  // namespace logging
}  // namespace symparts

#endif // SYMPARTS_COMMON_LOGGING_HPP
