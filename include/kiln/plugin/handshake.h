#pragma once

#include <kiln/components/component_kind.h>
#include <kiln/core/types.h>

#include <string>
#include <string_view>

namespace kiln::plugin {

// Bumped whenever the wire contract between host and plugins changes.
inline constexpr int kProtocolVersion = 1;

// The host sets this variable to kMagicCookieValue when launching a plugin.
inline constexpr const char* kMagicCookieKey = "KILN_PLUGIN_MAGIC_COOKIE";
inline constexpr const char* kMagicCookieValue =
    "9e3c61b2f04d4a7c8d15b7e0a2f6c4d3e8b1a9f05c7d2e6b4a3f1c8d0e9b7a65";

// Listener parameters passed from host to plugin.
inline constexpr const char* kEnvNetwork = "KILN_PLUGIN_NETWORK";
inline constexpr const char* kEnvMinPort = "KILN_PLUGIN_MIN_PORT";
inline constexpr const char* kEnvMaxPort = "KILN_PLUGIN_MAX_PORT";

// Executable name prefix: kiln-<kind>-<name>.
inline constexpr const char* kExecutablePrefix = "kiln";

struct HandshakeLine {
    int version{kProtocolVersion};
    std::string network;
    std::string address;
};

// `<version>|<network>|<address>` without a line terminator.
std::string formatHandshake(const HandshakeLine& line);

/**
 * Parses the first line a plugin writes to stdout.
 *
 * Fails with PluginProtocol on a malformed line, an unknown network type or a
 * protocol version other than kProtocolVersion.
 */
Result<HandshakeLine> parseHandshake(std::string_view line);

std::string pluginExecutableName(ComponentKind kind, std::string_view name);

} // namespace kiln::plugin
