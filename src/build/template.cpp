#include <kiln/build/template.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

namespace kiln::build {

using nlohmann::json;

namespace {

class TemplateParser {
public:
    explicit TemplateParser(std::string path) { result_.path = std::move(path); }

    Result<BuildTemplate> parse(const json& root) {
        if (!root.is_object()) {
            problem("template must be a JSON object");
            return finish();
        }
        for (const auto& [key, value] : root.items()) {
            if (key == "builders") {
                parseBuilders(value);
            } else if (key == "provisioners") {
                parseProvisioners(value);
            } else if (key == "post-processors") {
                parsePostProcessors(value);
            } else if (key == "hooks") {
                parseHooks(value);
            } else if (key != "description") {
                problem("unknown root level key in template: '" + key + "'");
            }
        }
        if (root.find("builders") == root.end()) {
            problem("at least one builder must be defined");
        }
        checkFilters();
        return finish();
    }

private:
    void problem(std::string message) { errors_.add(ErrorCode::ValidationError, std::move(message)); }

    Result<BuildTemplate> finish() {
        if (auto r = errors_.toResult(ErrorCode::ValidationError); !r) {
            return r.error();
        }
        return std::move(result_);
    }

    std::vector<std::string> stringList(const json& value, const std::string& where) {
        std::vector<std::string> out;
        if (!value.is_array()) {
            problem(where + " must be a list of strings");
            return out;
        }
        for (const auto& item : value) {
            if (!item.is_string()) {
                problem(where + " must be a list of strings");
                return {};
            }
            out.push_back(item.get<std::string>());
        }
        return out;
    }

    // Copies `object` without the keys the template itself interprets.
    static ConfigBundle componentConfig(const json& object, std::initializer_list<const char*> drop) {
        ConfigBundle config = object;
        for (const char* key : drop) {
            config.erase(key);
        }
        return config;
    }

    std::optional<std::string> typeOf(const json& object, const std::string& where) {
        auto it = object.find("type");
        if (it == object.end()) {
            problem(where + ": missing 'type'");
            return std::nullopt;
        }
        if (!it->is_string() || it->get<std::string>().empty()) {
            problem(where + ": 'type' must be a non-empty string");
            return std::nullopt;
        }
        return it->get<std::string>();
    }

    void parseBuilders(const json& value) {
        if (!value.is_array()) {
            problem("'builders' must be a list");
            return;
        }
        if (value.empty()) {
            problem("at least one builder must be defined");
        }
        std::set<std::string> names;
        for (size_t i = 0; i < value.size(); ++i) {
            const auto& raw = value[i];
            const std::string where = "builder " + std::to_string(i + 1);
            if (!raw.is_object()) {
                problem(where + " must be an object");
                continue;
            }
            auto type = typeOf(raw, where);
            if (!type) {
                continue;
            }
            BuilderSpec spec{*type, *type, componentConfig(raw, {"name", "type"})};
            if (auto name = raw.find("name"); name != raw.end()) {
                if (!name->is_string() || name->get<std::string>().empty()) {
                    problem(where + ": 'name' must be a non-empty string");
                    continue;
                }
                spec.name = name->get<std::string>();
            }
            if (!names.insert(spec.name).second) {
                problem("builder name '" + spec.name + "' is used more than once; " +
                        "give each builder a unique 'name'");
                continue;
            }
            result_.builders.push_back(std::move(spec));
        }
    }

    void parseFilters(const json& raw, const std::string& where, std::vector<std::string>& only,
                      std::vector<std::string>& except) {
        if (auto it = raw.find("only"); it != raw.end()) {
            only = stringList(*it, where + ": 'only'");
        }
        if (auto it = raw.find("except"); it != raw.end()) {
            except = stringList(*it, where + ": 'except'");
        }
        if (!only.empty() && !except.empty()) {
            problem(where + ": only one of 'only' or 'except' may be specified");
        }
        filters_.push_back({where, only});
        filters_.push_back({where, except});
    }

    void parseProvisioners(const json& value) {
        if (!value.is_array()) {
            problem("'provisioners' must be a list");
            return;
        }
        for (size_t i = 0; i < value.size(); ++i) {
            const auto& raw = value[i];
            const std::string where = "provisioner " + std::to_string(i + 1);
            if (!raw.is_object()) {
                problem(where + " must be an object");
                continue;
            }
            auto type = typeOf(raw, where);
            if (!type) {
                continue;
            }
            ProvisionerSpec spec;
            spec.type = *type;
            spec.config = componentConfig(raw, {"type", "only", "except", "override"});
            parseFilters(raw, where, spec.only, spec.except);
            if (auto it = raw.find("override"); it != raw.end()) {
                if (!it->is_object()) {
                    problem(where + ": 'override' must be an object keyed by build name");
                } else {
                    for (const auto& [build, config] : it->items()) {
                        if (!config.is_object()) {
                            problem(where + ": override for '" + build + "' must be an object");
                            continue;
                        }
                        spec.overrides[build] = config;
                        filters_.push_back({where + " override", {build}});
                    }
                }
            }
            result_.provisioners.push_back(std::move(spec));
        }
    }

    std::optional<PostProcessorSpec> parsePostProcessor(const json& raw, const std::string& where) {
        PostProcessorSpec spec;
        if (raw.is_string()) {
            spec.type = raw.get<std::string>();
            if (spec.type.empty()) {
                problem(where + ": 'type' must be a non-empty string");
                return std::nullopt;
            }
            spec.config = json::object();
            return spec;
        }
        if (!raw.is_object()) {
            problem(where + " must be a string or an object");
            return std::nullopt;
        }
        auto type = typeOf(raw, where);
        if (!type) {
            return std::nullopt;
        }
        spec.type = *type;
        spec.config = componentConfig(raw, {"type", "only", "except", "keep_input_artifact"});
        if (auto it = raw.find("keep_input_artifact"); it != raw.end()) {
            if (!it->is_boolean()) {
                problem(where + ": 'keep_input_artifact' must be a boolean");
            } else {
                spec.keepInputArtifact = it->get<bool>();
            }
        }
        parseFilters(raw, where, spec.only, spec.except);
        return spec;
    }

    void parsePostProcessors(const json& value) {
        if (!value.is_array()) {
            problem("'post-processors' must be a list");
            return;
        }
        for (size_t i = 0; i < value.size(); ++i) {
            const auto& raw = value[i];
            const std::string where = "post-processor " + std::to_string(i + 1);
            std::vector<PostProcessorSpec> chain;
            if (raw.is_array()) {
                for (size_t j = 0; j < raw.size(); ++j) {
                    if (auto spec =
                            parsePostProcessor(raw[j], where + "." + std::to_string(j + 1))) {
                        chain.push_back(std::move(*spec));
                    }
                }
            } else if (auto spec = parsePostProcessor(raw, where)) {
                chain.push_back(std::move(*spec));
            }
            if (!chain.empty()) {
                result_.postProcessors.push_back(std::move(chain));
            }
        }
    }

    void parseHooks(const json& value) {
        if (!value.is_object()) {
            problem("'hooks' must be an object mapping hook names to lists of hooks");
            return;
        }
        for (const auto& [name, hooks] : value.items()) {
            result_.hooks[name] = stringList(hooks, "hook '" + name + "'");
        }
    }

    // only/except entries and overrides must name a defined build.
    void checkFilters() {
        std::set<std::string> names;
        for (const auto& b : result_.builders) {
            names.insert(b.name);
        }
        for (const auto& [where, list] : filters_) {
            for (const auto& name : list) {
                if (names.count(name) == 0) {
                    problem(where + ": '" + name + "' is not a defined build");
                }
            }
        }
    }

    BuildTemplate result_;
    ErrorList errors_;
    std::vector<std::pair<std::string, std::vector<std::string>>> filters_;
};

} // namespace

std::vector<std::string> BuildTemplate::builderNames() const {
    std::vector<std::string> out;
    out.reserve(builders.size());
    for (const auto& b : builders) {
        out.push_back(b.name);
    }
    return out;
}

bool appliesTo(const std::vector<std::string>& only, const std::vector<std::string>& except,
               const std::string& name) {
    if (!only.empty()) {
        return std::find(only.begin(), only.end(), name) != only.end();
    }
    return std::find(except.begin(), except.end(), name) == except.end();
}

Result<BuildTemplate> parseTemplate(std::string_view text, const std::string& path) {
    json root;
    try {
        root = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::ValidationError,
                     "failed to parse template" + (path.empty() ? "" : " " + path) + ": " + e.what()};
    }
    return TemplateParser(path).parse(root);
}

Result<BuildTemplate> loadTemplate(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::IOError, "failed to read template " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    spdlog::debug("loaded template {} ({} bytes)", path.string(), buffer.str().size());
    return parseTemplate(buffer.str(), path.string());
}

} // namespace kiln::build
