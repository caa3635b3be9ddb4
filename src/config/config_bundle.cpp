#include <kiln/config/config_bundle.h>

#include <algorithm>

namespace kiln::config {

namespace {

Result<void> validateValue(const ConfigBundle& value, const std::string& path) {
    switch (value.type()) {
        case ConfigBundle::value_t::binary:
        case ConfigBundle::value_t::discarded:
            return Error{ErrorCode::ConfigError,
                         "unsupported value type at '" + path + "': " + value.type_name()};
        case ConfigBundle::value_t::array:
            for (size_t i = 0; i < value.size(); ++i) {
                if (auto r = validateValue(value[i], path + "[" + std::to_string(i) + "]"); !r) {
                    return r;
                }
            }
            return Result<void>();
        case ConfigBundle::value_t::object:
            for (const auto& [k, v] : value.items()) {
                if (auto r = validateValue(v, path.empty() ? k : path + "." + k); !r) {
                    return r;
                }
            }
            return Result<void>();
        default:
            return Result<void>();
    }
}

} // namespace

Result<void> validateBundle(const ConfigBundle& bundle) {
    if (!bundle.is_object() && !bundle.is_null()) {
        return Error{ErrorCode::ConfigError,
                     std::string("configuration must be an object, got ") + bundle.type_name()};
    }
    return validateValue(bundle, "");
}

ConfigBundle mergeBundles(const std::vector<ConfigBundle>& bundles) {
    ConfigBundle merged = ConfigBundle::object();
    for (const auto& b : bundles) {
        if (!b.is_object()) {
            continue;
        }
        for (const auto& [k, v] : b.items()) {
            merged[k] = v;
        }
    }
    return merged;
}

ConfigDecoder::ConfigDecoder(const ConfigBundle& bundle, std::string context)
    : bundle_(bundle), context_(std::move(context)) {
    if (!bundle_.is_object() && !bundle_.is_null()) {
        fail(std::string("configuration must be an object, got ") + bundle_.type_name());
    }
}

const ConfigBundle* ConfigDecoder::lookup(const std::string& key) const {
    if (!bundle_.is_object()) {
        return nullptr;
    }
    auto it = bundle_.find(key);
    if (it == bundle_.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

bool ConfigDecoder::has(const std::string& key) const {
    return lookup(key) != nullptr;
}

void ConfigDecoder::fail(const std::string& message) {
    errors_.add(ErrorCode::ConfigError, context_.empty() ? message : context_ + ": " + message);
}

void ConfigDecoder::wrongType(const std::string& key, const char* expected,
                              const ConfigBundle& actual) {
    fail("'" + key + "' must be " + expected + ", got " + actual.type_name());
}

std::string ConfigDecoder::requireString(const std::string& key) {
    const auto* v = lookup(key);
    if (!v) {
        fail("'" + key + "' must be specified");
        return {};
    }
    if (!v->is_string()) {
        wrongType(key, "a string", *v);
        return {};
    }
    auto s = v->get<std::string>();
    if (s.empty()) {
        fail("'" + key + "' must not be empty");
    }
    return s;
}

std::string ConfigDecoder::optionalString(const std::string& key, std::string fallback) {
    const auto* v = lookup(key);
    if (!v) {
        return fallback;
    }
    if (!v->is_string()) {
        wrongType(key, "a string", *v);
        return fallback;
    }
    return v->get<std::string>();
}

int64_t ConfigDecoder::optionalInt(const std::string& key, int64_t fallback) {
    const auto* v = lookup(key);
    if (!v) {
        return fallback;
    }
    if (!v->is_number_integer()) {
        wrongType(key, "an integer", *v);
        return fallback;
    }
    return v->get<int64_t>();
}

bool ConfigDecoder::optionalBool(const std::string& key, bool fallback) {
    const auto* v = lookup(key);
    if (!v) {
        return fallback;
    }
    if (!v->is_boolean()) {
        wrongType(key, "a boolean", *v);
        return fallback;
    }
    return v->get<bool>();
}

std::vector<std::string> ConfigDecoder::optionalStringList(const std::string& key) {
    std::vector<std::string> out;
    const auto* v = lookup(key);
    if (!v) {
        return out;
    }
    if (!v->is_array()) {
        wrongType(key, "a list of strings", *v);
        return out;
    }
    for (size_t i = 0; i < v->size(); ++i) {
        const auto& item = (*v)[i];
        if (!item.is_string()) {
            wrongType(key + "[" + std::to_string(i) + "]", "a string", item);
            continue;
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

void ConfigDecoder::rejectUnknownKeys(const std::vector<std::string>& known) {
    if (known.empty() || !bundle_.is_object()) {
        return;
    }
    for (const auto& [k, _] : bundle_.items()) {
        if (k.rfind(kHostKeyPrefix, 0) == 0) {
            continue;
        }
        if (std::find(known.begin(), known.end(), k) == known.end()) {
            fail("unknown configuration key: '" + k + "'");
        }
    }
}

Result<void> ConfigDecoder::finish() const {
    return errors_.toResult(ErrorCode::ConfigError);
}

} // namespace kiln::config
