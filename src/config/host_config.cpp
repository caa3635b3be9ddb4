#include <kiln/config/host_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <optional>
#include <fstream>
#include <sstream>

namespace kiln::config {

namespace {

// Section names binding plugin executables, e.g. [builders].
std::optional<ComponentKind> bindingSection(const std::string& section) {
    if (section == "builders")
        return ComponentKind::Builder;
    if (section == "provisioners")
        return ComponentKind::Provisioner;
    if (section == "post-processors" || section == "post_processors")
        return ComponentKind::PostProcessor;
    if (section == "hooks")
        return ComponentKind::Hook;
    if (section == "commands")
        return ComponentKind::Command;
    return std::nullopt;
}

std::optional<int64_t> parseInteger(const std::string& value) {
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return out;
}

// Strips a trailing `# comment` that is not inside quotes.
std::string stripComment(const std::string& value) {
    char quote = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return value.substr(0, i);
        }
    }
    return value;
}

class HostConfigParser {
public:
    explicit HostConfigParser(std::string source) : source_(std::move(source)) {}

    void apply(size_t lineNo, const std::string& section, const std::string& key,
               const std::string& raw) {
        const std::string value = unquote(raw);
        if (section == "plugins") {
            applyPlugins(lineNo, key, raw, value);
        } else if (section == "registry") {
            if (key != "precedence") {
                unknownKey(lineNo, section, key);
            } else if (value == "builtin-first") {
                config_.precedence = Precedence::BuiltinFirst;
            } else if (value == "plugin-first") {
                config_.precedence = Precedence::PluginFirst;
            } else {
                fail(lineNo, "registry.precedence must be 'builtin-first' or 'plugin-first', got '" +
                                 value + "'");
            }
        } else if (auto kind = bindingSection(section)) {
            if (value.empty()) {
                fail(lineNo, section + "." + key + " must name an executable");
            } else {
                config_.bindings[*kind][key] = expand_tilde(value);
            }
        } else {
            fail(lineNo, "unknown section '" + section + "'");
        }
    }

    void fail(size_t lineNo, const std::string& message) {
        errors_.add(ErrorCode::ConfigError,
                    source_ + ":" + std::to_string(lineNo) + ": " + message);
    }

    Result<HostConfig> finish() {
        if (config_.plugins.minPort > config_.plugins.maxPort) {
            errors_.add(ErrorCode::ConfigError,
                        source_ + ": plugins.min_port must not exceed plugins.max_port");
        }
        if (auto r = errors_.toResult(ErrorCode::ConfigError); !r) {
            return r.error();
        }
        return config_;
    }

private:
    void unknownKey(size_t lineNo, const std::string& section, const std::string& key) {
        fail(lineNo, "unknown key '" + key + "' in [" + section + "]");
    }

    void applyPlugins(size_t lineNo, const std::string& key, const std::string& raw,
                      const std::string& value) {
        auto& plugins = config_.plugins;
        if (key == "directories") {
            plugins.directories = parse_path_list(raw);
        } else if (key == "network") {
            if (value != "unix" && value != "tcp") {
                fail(lineNo, "plugins.network must be 'unix' or 'tcp', got '" + value + "'");
            } else {
                plugins.network = value;
            }
        } else if (key == "min_port" || key == "max_port") {
            auto n = parseInteger(value);
            if (!n || *n < 1 || *n > 65535) {
                fail(lineNo, "plugins." + key + " must be a port number, got '" + value + "'");
            } else if (key == "min_port") {
                plugins.minPort = static_cast<uint16_t>(*n);
            } else {
                plugins.maxPort = static_cast<uint16_t>(*n);
            }
        } else if (key == "start_timeout_ms" || key == "kill_grace_ms") {
            auto n = parseInteger(value);
            if (!n || *n <= 0) {
                fail(lineNo,
                     "plugins." + key + " must be a positive integer, got '" + value + "'");
            } else if (key == "start_timeout_ms") {
                plugins.startTimeout = std::chrono::milliseconds(*n);
            } else {
                plugins.killGrace = std::chrono::milliseconds(*n);
            }
        } else {
            unknownKey(lineNo, "plugins", key);
        }
    }

    std::string source_;
    HostConfig config_;
    ErrorList errors_;
};

} // namespace

std::filesystem::path get_config_path() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "kiln" / "config.toml";
    }

    return configHome / "kiln" / "config.toml";
}

std::vector<std::filesystem::path> parse_path_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }
    std::vector<std::filesystem::path> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(expand_tilde(item));
        }
    }
    return out;
}

Result<HostConfig> parseHostConfig(std::istream& in, const std::string& sourceName) {
    HostConfigParser parser(sourceName);
    std::string line;
    std::string currentSection;
    size_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                parser.fail(lineNo, "unterminated section header");
                continue;
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            parser.fail(lineNo, "expected 'key = value'");
            continue;
        }
        std::string key = line.substr(0, eq);
        std::string value = stripComment(line.substr(eq + 1));
        trim(key);
        trim(value);
        key = unquote(key);

        std::string section = currentSection;
        // Support both "plugins.network" and "[plugins] network"
        if (section.empty()) {
            auto dot = key.find('.');
            if (dot == std::string::npos) {
                parser.fail(lineNo, "key '" + key + "' outside of a section");
                continue;
            }
            section = key.substr(0, dot);
            key = key.substr(dot + 1);
        }
        parser.apply(lineNo, section, key, value);
    }
    return parser.finish();
}

Result<HostConfig> loadHostConfig(const std::filesystem::path& path, bool required) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (required) {
            return Error{ErrorCode::ConfigError,
                         "configuration file " + path.string() + " does not exist"};
        }
        spdlog::debug("no configuration file at {}, using defaults", path.string());
        return HostConfig{};
    }
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::ConfigError, "cannot read configuration file " + path.string()};
    }
    auto parsed = parseHostConfig(file, path.string());
    if (!parsed) {
        return parsed.error();
    }
    auto config = std::move(parsed).value();
    config.source = path;
    return config;
}

Result<HostConfig> loadHostConfig() {
    if (const char* env = std::getenv(kEnvConfig); env && *env) {
        return loadHostConfig(expand_tilde(env), true);
    }
    return loadHostConfig(get_config_path(), false);
}

} // namespace kiln::config
