#pragma once

#include <kiln/core/types.h>

#include <spdlog/common.h>

#include <optional>
#include <string>
#include <string_view>

namespace kiln {

// Log level environment variable shared by host and plugins.
inline constexpr const char* kEnvLog = "KILN_LOG";
// Redirects the host log to a file.
inline constexpr const char* kEnvLogPath = "KILN_LOG_PATH";

// Case-insensitive level name; nullopt for anything unrecognized.
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view value);

/**
 * Level selected by KILN_LOG: its parsed value, debug for any other non-empty
 * value, or `fallback` when unset.
 */
spdlog::level::level_enum logLevelFromEnv(spdlog::level::level_enum fallback);

/**
 * Host logger: stderr, or the file named by KILN_LOG_PATH. Logging is off
 * unless KILN_LOG is set or `verbose` asks for debug output. Fails when the
 * log file cannot be opened.
 */
Result<void> configureHostLogging(bool verbose);

} // namespace kiln
