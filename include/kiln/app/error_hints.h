#pragma once

#include <kiln/core/types.h>

#include <string>
#include <string_view>

namespace kiln::app {

/**
 * Actionable suggestion shown under an error message.
 */
struct ErrorHint {
    std::string hint;    // Short actionable suggestion
    std::string command; // Suggested command to run (if any)
};

inline ErrorHint getErrorHint(ErrorCode code, std::string_view message) {
    ErrorHint hint;

    switch (code) {
        case ErrorCode::PluginNotFound:
            hint.hint = "check that the plugin exists and is executable";
            return hint;
        case ErrorCode::PluginTimeout:
            hint.hint = "the plugin did not announce itself; run it with KILN_LOG=debug to see "
                        "its output, or raise plugins.start_timeout_ms";
            return hint;
        case ErrorCode::PluginProtocol:
            hint.hint = "the plugin may have been built for a different kiln version";
            hint.command = "kiln version";
            return hint;
        case ErrorCode::PluginConnect:
            hint.hint = "the plugin announced an address kiln could not reach";
            return hint;
        case ErrorCode::CommunicationFailed:
            if (message.find("exited") != std::string_view::npos) {
                hint.hint = "the plugin crashed; set KILN_LOG=debug to capture its stderr";
            }
            return hint;
        case ErrorCode::ComponentNotFound:
            hint.hint = "install the plugin on PATH, or bind it under [builders], [provisioners], "
                        "[post-processors], [hooks] or [commands] in the configuration";
            return hint;
        case ErrorCode::ConfigError:
            hint.hint = "fix every problem listed above and try again";
            return hint;
        default:
            return hint;
    }
}

inline std::string formatErrorWithHint(const Error& error) {
    auto hint = getErrorHint(error.code, error.message);
    std::string result = formatError(error);
    if (!hint.hint.empty()) {
        result += "\n  Hint: " + hint.hint;
        if (!hint.command.empty()) {
            result += "\n  Try: " + hint.command;
        }
    }
    return result;
}

} // namespace kiln::app
