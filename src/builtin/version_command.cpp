#include <kiln/builtin/commands.h>
#include <kiln/components/environment.h>
#include <kiln/plugin/handshake.h>
#include <kiln/version.hpp>

#include <cstring>

namespace kiln::builtin {

std::string versionString() {
    std::string out = std::string("Kiln v") + version::string_v;
    if (std::strlen(version::prerelease_v) > 0) {
        out += std::string(".") + version::prerelease_v;
    }
    if (std::strcmp(version::commit_v, "unknown") != 0) {
        out += std::string(" (") + version::commit_v + ")";
    }
    return out;
}

std::string VersionCommand::help() const {
    return "Usage: kiln version\n\n"
           "  Prints the kiln version and the plugin protocol version.";
}

std::string VersionCommand::synopsis() const {
    return "Prints the kiln version";
}

Result<int> VersionCommand::run(components::IEnvironment& env, const std::vector<std::string>&) {
    auto ui = env.ui();
    ui->machine("version", {version::string_v});
    ui->machine("version-prerelease", {version::prerelease_v});
    ui->machine("version-commit", {version::commit_v});
    ui->machine("protocol-version", {std::to_string(plugin::kProtocolVersion)});
    ui->say(versionString());
    ui->message("Plugin protocol version: " + std::to_string(plugin::kProtocolVersion));
    return 0;
}

} // namespace kiln::builtin
