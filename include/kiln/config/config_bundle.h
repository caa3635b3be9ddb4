#pragma once

#include <kiln/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

/**
 * Loosely-typed configuration exchanged with components.
 *
 * String keys; values limited to primitives, arrays and nested objects, so a
 * plugin built against a different host version can still decode it.
 */
using ConfigBundle = nlohmann::json;

namespace config {

// Keys with this prefix are set by the host (build name, builder type).
inline constexpr const char* kHostKeyPrefix = "kiln_";

// Rejects binary values and non-object roots.
Result<void> validateBundle(const ConfigBundle& bundle);

// Later bundles override keys of earlier ones (shallow merge). Null entries
// are skipped.
ConfigBundle mergeBundles(const std::vector<ConfigBundle>& bundles);

/**
 * Typed view over a bundle that records every problem instead of stopping at
 * the first one.
 *
 * @code
 * ConfigDecoder d{merged};
 * auto target = d.requireString("target");
 * auto mode = d.optionalInt("mode", 0644);
 * if (auto r = d.finish(); !r) return r.error();
 * @endcode
 */
class ConfigDecoder {
public:
    explicit ConfigDecoder(const ConfigBundle& bundle, std::string context = {});

    std::string requireString(const std::string& key);
    std::string optionalString(const std::string& key, std::string fallback = {});
    int64_t optionalInt(const std::string& key, int64_t fallback);
    bool optionalBool(const std::string& key, bool fallback);
    std::vector<std::string> optionalStringList(const std::string& key);

    bool has(const std::string& key) const;

    // Adds a problem found by the caller's own checks.
    void fail(const std::string& message);

    // Unknown keys are reported unless listed in `known` (pass empty to skip).
    // Host keys are always accepted.
    void rejectUnknownKeys(const std::vector<std::string>& known);

    const ErrorList& problems() const noexcept { return errors_; }

    // ConfigError listing every recorded problem, or success.
    Result<void> finish() const;

private:
    const ConfigBundle* lookup(const std::string& key) const;
    void wrongType(const std::string& key, const char* expected, const ConfigBundle& actual);

    const ConfigBundle& bundle_;
    std::string context_;
    ErrorList errors_;
};

} // namespace config
} // namespace kiln
