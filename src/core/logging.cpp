#include <kiln/core/logging.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>

namespace kiln {

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view value) {
    std::string v;
    v.reserve(value.size());
    for (char c : value)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

spdlog::level::level_enum logLevelFromEnv(spdlog::level::level_enum fallback) {
    const char* env = std::getenv(kEnvLog);
    if (!env || !*env) {
        return fallback;
    }
    return parseLogLevel(env).value_or(spdlog::level::debug);
}

Result<void> configureHostLogging(bool verbose) {
    auto level = logLevelFromEnv(verbose ? spdlog::level::debug : spdlog::level::off);

    std::shared_ptr<spdlog::logger> logger;
    if (const char* path = std::getenv(kEnvLogPath); path && *path && level != spdlog::level::off) {
        try {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
            logger = std::make_shared<spdlog::logger>("kiln", sink);
        } catch (const spdlog::spdlog_ex& e) {
            return Error{ErrorCode::IOError,
                         std::string("Couldn't open '") + path + "' for logging: " + e.what()};
        }
    } else {
        // stdout belongs to the UI.
        logger = spdlog::stderr_color_mt("kiln");
    }
    logger->set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::info);
    return Result<void>();
}

} // namespace kiln
