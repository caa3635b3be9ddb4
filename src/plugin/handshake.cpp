#include <kiln/plugin/handshake.h>
#include <kiln/rpc/transport.h>

#include <charconv>

namespace kiln::plugin {

std::string formatHandshake(const HandshakeLine& line) {
    return std::to_string(line.version) + "|" + line.network + "|" + line.address;
}

Result<HandshakeLine> parseHandshake(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }

    auto first = line.find('|');
    auto second = first == std::string_view::npos ? first : line.find('|', first + 1);
    if (first == std::string_view::npos || second == std::string_view::npos) {
        return Error{ErrorCode::PluginProtocol,
                     "unrecognized handshake line: '" + std::string(line) + "'"};
    }

    HandshakeLine out;
    auto versionText = line.substr(0, first);
    auto [ptr, ec] =
        std::from_chars(versionText.data(), versionText.data() + versionText.size(), out.version);
    if (ec != std::errc{} || ptr != versionText.data() + versionText.size()) {
        return Error{ErrorCode::PluginProtocol,
                     "invalid protocol version in handshake: '" + std::string(versionText) + "'"};
    }
    if (out.version != kProtocolVersion) {
        return Error{ErrorCode::PluginProtocol,
                     "incompatible plugin protocol version " + std::to_string(out.version) +
                         ", expected " + std::to_string(kProtocolVersion)};
    }

    out.network = std::string(line.substr(first + 1, second - first - 1));
    out.address = std::string(line.substr(second + 1));
    if (!rpc::isSupportedNetwork(out.network)) {
        return Error{ErrorCode::PluginProtocol,
                     "unsupported network type in handshake: '" + out.network + "'"};
    }
    if (out.address.empty()) {
        return Error{ErrorCode::PluginProtocol, "empty address in handshake"};
    }
    return out;
}

std::string pluginExecutableName(ComponentKind kind, std::string_view name) {
    return std::string(kExecutablePrefix) + "-" + componentKindName(kind) + "-" +
           std::string(name);
}

} // namespace kiln::plugin
