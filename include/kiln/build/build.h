#pragma once

#include <kiln/build/hooks.h>
#include <kiln/build/template.h>
#include <kiln/components/builder.h>
#include <kiln/components/environment.h>
#include <kiln/components/post_processor.h>
#include <kiln/components/provisioner.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kiln::build {

// Keys of the bundle every component receives after its own configuration.
inline constexpr const char* kBuildNameKey = "kiln_build_name";
inline constexpr const char* kBuilderTypeKey = "kiln_builder_type";

/**
 * One builder of a template together with the provisioners and
 * post-processor chains that apply to it.
 *
 * prepare() must succeed before run(). cancel() may be called from any thread
 * while run() is in progress.
 */
class Build {
public:
    struct Provisioner {
        std::string type;
        std::shared_ptr<components::IProvisioner> component;
        std::vector<ConfigBundle> configs;
    };

    struct PostProcessor {
        std::string type;
        std::shared_ptr<components::IPostProcessor> component;
        ConfigBundle config;
        std::optional<bool> keepInputArtifact;
    };

    Build(std::string name, std::string builderType, std::shared_ptr<components::IBuilder> builder,
          ConfigBundle builderConfig, std::vector<Provisioner> provisioners,
          std::vector<std::vector<PostProcessor>> postProcessors, DispatchHook::HookMap hooks);

    const std::string& name() const noexcept { return name_; }
    const std::string& builderType() const noexcept { return builderType_; }

    // Prepares every component; configuration problems from all of them are
    // reported together. Returns the builder's warnings.
    Result<std::vector<std::string>> prepare();

    Result<std::vector<std::shared_ptr<components::IArtifact>>> run(std::shared_ptr<ui::IUi> ui,
                                                                    components::ICache& cache);

    void cancel();

private:
    ConfigBundle buildVariables() const;
    Result<std::vector<std::shared_ptr<components::IArtifact>>>
    postProcess(ui::IUi& ui, std::shared_ptr<components::IArtifact> builderArtifact);

    std::string name_;
    std::string builderType_;
    std::shared_ptr<components::IBuilder> builder_;
    ConfigBundle builderConfig_;
    std::vector<Provisioner> provisioners_;
    std::vector<std::vector<PostProcessor>> postProcessors_;
    DispatchHook::HookMap hooks_;
    bool prepared_{false};

    std::mutex mutex_;
    std::shared_ptr<DispatchHook> dispatch_;
    bool cancelled_{false};
};

struct BuildFilter {
    std::vector<std::string> only;
    std::vector<std::string> except;
};

/**
 * Load the components of every selected build through `env`.
 *
 * Plugin-backed components are started here. Unknown component names and
 * unknown filter entries are all reported in one error.
 */
Result<std::vector<std::shared_ptr<Build>>>
createBuilds(const BuildTemplate& tpl, components::IEnvironment& env, const BuildFilter& filter);

} // namespace kiln::build
