#pragma once

#include <kiln/config/config_bundle.h>
#include <kiln/core/types.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::build {

struct BuilderSpec {
    std::string name; ///< Defaults to the type
    std::string type;
    ConfigBundle config;
};

struct ProvisionerSpec {
    std::string type;
    ConfigBundle config;
    std::vector<std::string> only;   ///< Builds this provisioner is limited to
    std::vector<std::string> except; ///< Builds this provisioner skips
    // Per-build configuration layered over `config`.
    std::map<std::string, ConfigBundle> overrides;
};

struct PostProcessorSpec {
    std::string type;
    ConfigBundle config;
    std::optional<bool> keepInputArtifact;
    std::vector<std::string> only;
    std::vector<std::string> except;
};

/**
 * A build template: the builders to run, the provisioners applied to each of
 * them, and post-processor chains applied to every resulting artifact.
 */
struct BuildTemplate {
    std::string path;
    std::vector<BuilderSpec> builders;
    std::vector<ProvisionerSpec> provisioners;
    std::vector<std::vector<PostProcessorSpec>> postProcessors;
    // Hook name -> hook component names.
    std::map<std::string, std::vector<std::string>> hooks;

    std::vector<std::string> builderNames() const;
};

// Whether `filters` (only/except) admit the build named `name`.
bool appliesTo(const std::vector<std::string>& only, const std::vector<std::string>& except,
               const std::string& name);

/**
 * Parse a JSON template.
 *
 * Structural problems are collected and returned together as one
 * ValidationError.
 */
Result<BuildTemplate> parseTemplate(std::string_view text, const std::string& path = {});

Result<BuildTemplate> loadTemplate(const std::filesystem::path& path);

} // namespace kiln::build
