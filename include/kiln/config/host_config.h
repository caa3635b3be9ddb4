#pragma once

#include <kiln/components/component_kind.h>
#include <kiln/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace kiln::config {

// Path of the host configuration file; must exist when set.
inline constexpr const char* kEnvConfig = "KILN_CONFIG";

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Which source wins when a name is both built in and a discoverable plugin.
enum class Precedence { BuiltinFirst, PluginFirst };

constexpr const char* precedenceName(Precedence p) {
    return p == Precedence::BuiltinFirst ? "builtin-first" : "plugin-first";
}

struct PluginSettings {
    std::vector<std::filesystem::path> directories; ///< Searched before PATH
    std::string network{"unix"};
    uint16_t minPort{10000};
    uint16_t maxPort{25000};
    std::chrono::milliseconds startTimeout{60'000};
    std::chrono::milliseconds killGrace{2'000};
};

struct HostConfig {
    PluginSettings plugins;
    Precedence precedence{Precedence::BuiltinFirst};
    // Explicit name -> executable bindings per component kind.
    std::map<ComponentKind, std::map<std::string, std::filesystem::path>> bindings;
    std::filesystem::path source; ///< Empty when built from defaults
};

// $XDG_CONFIG_HOME/kiln/config.toml or ~/.config/kiln/config.toml
std::filesystem::path get_config_path();

// Accepts `["a", "b"]` or `a,b`; tilde expansion is applied.
std::vector<std::filesystem::path> parse_path_list(const std::string& raw);

/**
 * @brief Parse the host configuration
 *
 * Understands `[section]` headers, `key = value` lines, `#` comments and the
 * dotted `section.key = value` form. Every malformed line or invalid value is
 * collected into one ConfigError.
 */
Result<HostConfig> parseHostConfig(std::istream& in, const std::string& sourceName);

// Missing file yields defaults unless `required`.
Result<HostConfig> loadHostConfig(const std::filesystem::path& path, bool required);

// KILN_CONFIG when set (required), the default path otherwise (optional).
Result<HostConfig> loadHostConfig();

} // namespace kiln::config
