#include <kiln/build/build.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace kiln::build {

namespace {

bool isConfigProblem(const Error& error) {
    return error.code == ErrorCode::ConfigError || error.code == ErrorCode::ValidationError;
}

void destroyArtifact(ui::IUi& ui, const std::shared_ptr<components::IArtifact>& artifact) {
    ui.say("Deleting intermediate artifact: " + artifact->id());
    if (auto r = artifact->destroy(); !r) {
        ui.error("Error destroying intermediate artifact: " + r.error().message);
    }
}

} // namespace

Build::Build(std::string name, std::string builderType,
             std::shared_ptr<components::IBuilder> builder, ConfigBundle builderConfig,
             std::vector<Provisioner> provisioners,
             std::vector<std::vector<PostProcessor>> postProcessors, DispatchHook::HookMap hooks)
    : name_(std::move(name)), builderType_(std::move(builderType)), builder_(std::move(builder)),
      builderConfig_(std::move(builderConfig)), provisioners_(std::move(provisioners)),
      postProcessors_(std::move(postProcessors)), hooks_(std::move(hooks)) {}

ConfigBundle Build::buildVariables() const {
    return ConfigBundle{{kBuildNameKey, name_}, {kBuilderTypeKey, builderType_}};
}

Result<std::vector<std::string>> Build::prepare() {
    ErrorList problems;
    std::vector<std::string> warnings;
    const auto vars = buildVariables();

    auto collect = [&](const Error& error, const std::string& who) -> std::optional<Error> {
        if (!isConfigProblem(error)) {
            return Error{error.code, who + ": " + error.message, error.causes};
        }
        if (error.causes.empty()) {
            problems.add(error.code, who + ": " + error.message);
        } else {
            for (const auto& cause : error.causes) {
                problems.add(cause.code, who + ": " + cause.message);
            }
        }
        return std::nullopt;
    };

    if (auto r = builder_->prepare({builderConfig_, vars}); !r) {
        if (auto fatal = collect(r.error(), "builder " + builderType_)) {
            return *fatal;
        }
    } else {
        warnings = r.value();
    }

    for (auto& p : provisioners_) {
        auto configs = p.configs;
        configs.push_back(vars);
        if (auto r = p.component->prepare(configs); !r) {
            if (auto fatal = collect(r.error(), "provisioner " + p.type)) {
                return *fatal;
            }
        }
    }

    for (auto& chain : postProcessors_) {
        for (auto& pp : chain) {
            if (auto r = pp.component->configure({pp.config, vars}); !r) {
                if (auto fatal = collect(r.error(), "post-processor " + pp.type)) {
                    return *fatal;
                }
            }
        }
    }

    if (auto r = problems.toResult(ErrorCode::ConfigError); !r) {
        return Error{r.error().code, "build '" + name_ + "': " + r.error().message,
                     r.error().causes};
    }
    prepared_ = true;
    return warnings;
}

Result<std::vector<std::shared_ptr<components::IArtifact>>>
Build::run(std::shared_ptr<ui::IUi> ui, components::ICache& cache) {
    if (!prepared_) {
        return Error{ErrorCode::InvalidState, "build '" + name_ + "' must be prepared first"};
    }

    auto hooks = hooks_;
    if (!provisioners_.empty()) {
        std::vector<ProvisionHook::Entry> entries;
        for (const auto& p : provisioners_) {
            entries.push_back({p.type, p.component});
        }
        hooks[components::kHookProvision].push_back(
            std::make_shared<ProvisionHook>(std::move(entries)));
    }

    auto dispatch = std::make_shared<DispatchHook>(std::move(hooks));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return Error{ErrorCode::OperationCancelled, "build '" + name_ + "' cancelled"};
        }
        dispatch_ = dispatch;
    }

    spdlog::debug("running builder {} for build '{}'", builderType_, name_);
    auto built = builder_->run(*ui, *dispatch, cache);
    if (!built) {
        return Error{built.error().code, "build '" + name_ + "' errored: " + built.error().message,
                     built.error().causes};
    }
    auto artifact = built.value();
    if (!artifact) {
        spdlog::debug("build '{}' produced no artifact", name_);
        return std::vector<std::shared_ptr<components::IArtifact>>{};
    }
    return postProcess(*ui, std::move(artifact));
}

Result<std::vector<std::shared_ptr<components::IArtifact>>>
Build::postProcess(ui::IUi& ui, std::shared_ptr<components::IArtifact> builderArtifact) {
    std::vector<std::shared_ptr<components::IArtifact>> artifacts;
    bool keepOriginal = postProcessors_.empty();

    for (const auto& chain : postProcessors_) {
        auto prior = builderArtifact;
        for (size_t i = 0; i < chain.size(); ++i) {
            const auto& pp = chain[i];
            ui.say("Running post-processor: " + pp.type);
            auto result = pp.component->postProcess(ui, prior);
            if (!result) {
                if (!keepOriginal) {
                    // The builder artifact is all that is left to report.
                    artifacts.insert(artifacts.begin(), builderArtifact);
                }
                return Error{result.error().code,
                             "post-processor " + pp.type + " failed: " + result.error().message,
                             result.error().causes};
            }
            const bool keep = pp.keepInputArtifact.value_or(result.value().keep);
            if (i == 0) {
                keepOriginal = keepOriginal || keep;
            } else if (!keep) {
                destroyArtifact(ui, prior);
            }
            if (!result.value().artifact) {
                prior.reset();
                break;
            }
            prior = result.value().artifact;
        }
        if (prior && prior != builderArtifact) {
            artifacts.push_back(prior);
        }
    }

    if (keepOriginal) {
        artifacts.insert(artifacts.begin(), builderArtifact);
    } else {
        destroyArtifact(ui, builderArtifact);
    }
    return artifacts;
}

void Build::cancel() {
    std::shared_ptr<DispatchHook> dispatch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        dispatch = dispatch_;
    }
    builder_->cancel();
    if (dispatch) {
        dispatch->cancel();
    }
}

Result<std::vector<std::shared_ptr<Build>>>
createBuilds(const BuildTemplate& tpl, components::IEnvironment& env, const BuildFilter& filter) {
    ErrorList problems;
    const auto known = tpl.builderNames();
    for (const auto* list : {&filter.only, &filter.except}) {
        for (const auto& name : *list) {
            if (std::find(known.begin(), known.end(), name) == known.end()) {
                problems.add(ErrorCode::InvalidArgument, "'" + name + "' is not a defined build");
            }
        }
    }

    // Hook components are shared by every build of the run.
    DispatchHook::HookMap hooks;
    for (const auto& [hookName, componentNames] : tpl.hooks) {
        for (const auto& componentName : componentNames) {
            auto hook = env.hook(componentName);
            if (!hook) {
                problems.merge(hook.error());
                continue;
            }
            hooks[hookName].push_back(hook.value());
        }
    }

    std::vector<std::shared_ptr<Build>> builds;
    for (const auto& spec : tpl.builders) {
        if (!appliesTo(filter.only, filter.except, spec.name)) {
            continue;
        }
        auto builder = env.builder(spec.type);
        if (!builder) {
            problems.merge(builder.error());
            continue;
        }

        std::vector<Build::Provisioner> provisioners;
        for (const auto& p : tpl.provisioners) {
            if (!appliesTo(p.only, p.except, spec.name)) {
                continue;
            }
            auto provisioner = env.provisioner(p.type);
            if (!provisioner) {
                problems.merge(provisioner.error());
                continue;
            }
            std::vector<ConfigBundle> configs{p.config};
            if (auto it = p.overrides.find(spec.name); it != p.overrides.end()) {
                configs.push_back(it->second);
            }
            provisioners.push_back({p.type, provisioner.value(), std::move(configs)});
        }

        std::vector<std::vector<Build::PostProcessor>> chains;
        for (const auto& chainSpec : tpl.postProcessors) {
            std::vector<Build::PostProcessor> chain;
            for (const auto& pp : chainSpec) {
                if (!appliesTo(pp.only, pp.except, spec.name)) {
                    continue;
                }
                auto postProcessor = env.postProcessor(pp.type);
                if (!postProcessor) {
                    problems.merge(postProcessor.error());
                    continue;
                }
                chain.push_back({pp.type, postProcessor.value(), pp.config, pp.keepInputArtifact});
            }
            if (!chain.empty()) {
                chains.push_back(std::move(chain));
            }
        }

        builds.push_back(std::make_shared<Build>(spec.name, spec.type, builder.value(), spec.config,
                                                 std::move(provisioners), std::move(chains),
                                                 hooks));
    }

    if (problems.size() == 1) {
        return problems.errors().front();
    }
    if (auto r = problems.toResult(ErrorCode::ValidationError); !r) {
        return r.error();
    }
    return builds;
}

} // namespace kiln::build
