#pragma once

#include <kiln/ui/ui.h>

#include <CLI/CLI.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace kiln::builtin::detail {

// Parses command arguments; returns an exit code when parsing ended the
// command (help requested or invalid usage).
inline std::optional<int> parseArgs(CLI::App& app, const std::vector<std::string>& args,
                                    ui::IUi& ui) {
    // CLI11 consumes the vector from the back.
    std::vector<std::string> reversed(args.rbegin(), args.rend());
    try {
        app.parse(reversed);
    } catch (const CLI::CallForHelp&) {
        ui.say(app.help());
        return 0;
    } catch (const CLI::ParseError& e) {
        ui.error(std::string("Error: ") + e.what());
        ui.say(app.help());
        return 1;
    }
    return std::nullopt;
}

} // namespace kiln::builtin::detail
