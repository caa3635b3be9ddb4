#pragma once

#include <kiln/components/builder.h>
#include <kiln/components/post_processor.h>
#include <kiln/components/provisioner.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kiln::builtin {

inline constexpr const char* kNullBuilderId = "kiln.null";
inline constexpr const char* kFileBuilderId = "kiln.file";

/**
 * Produces an artifact without creating anything. Useful for exercising
 * provisioners and post-processors.
 *
 * Config: `artifact_id` (default "null"), `files` (list, default empty).
 */
class NullBuilder : public components::IBuilder {
public:
    Result<std::vector<std::string>> prepare(const std::vector<ConfigBundle>& configs) override;
    Result<std::shared_ptr<components::IArtifact>>
    run(ui::IUi& ui, components::IHook& hook, components::ICache& cache) override;
    void cancel() override;

private:
    std::string artifactId_{"null"};
    std::vector<std::string> files_;
    std::atomic<bool> cancelled_{false};
};

/**
 * Writes one file, either from inline `content` or by copying `source`
 * through the artifact cache.
 *
 * Config: `target` (required), exactly one of `content` or `source`.
 */
class FileBuilder : public components::IBuilder {
public:
    Result<std::vector<std::string>> prepare(const std::vector<ConfigBundle>& configs) override;
    Result<std::shared_ptr<components::IArtifact>>
    run(ui::IUi& ui, components::IHook& hook, components::ICache& cache) override;
    void cancel() override;

private:
    Result<void> copyThroughCache(ui::IUi& ui, components::ICache& cache);

    std::filesystem::path target_;
    std::string content_;
    std::filesystem::path source_;
    std::atomic<bool> cancelled_{false};
};

/**
 * Runs a shell command on the host and streams its output to the UI.
 *
 * Config: exactly one of `command` (string) or `inline` (list of lines),
 * optional `environment_vars` (list of KEY=VALUE).
 */
class ShellLocalProvisioner : public components::IProvisioner {
public:
    Result<void> prepare(const std::vector<ConfigBundle>& configs) override;
    Result<void> provision(ui::IUi& ui) override;
    void cancel() override;

private:
    std::string script_;
    std::vector<std::string> env_;
    std::atomic<bool> cancelled_{false};
};

/**
 * Appends one record per artifact to a JSON manifest file and passes the
 * artifact through unchanged.
 *
 * Config: `output` (default "kiln-manifest.json").
 */
class ManifestPostProcessor : public components::IPostProcessor {
public:
    Result<void> configure(const std::vector<ConfigBundle>& configs) override;
    Result<components::PostProcessResult> postProcess(ui::IUi& ui,
                                                      std::shared_ptr<components::IArtifact> artifact) override;

private:
    std::filesystem::path output_{"kiln-manifest.json"};
    std::string buildName_;
    std::string builderType_;
};

} // namespace kiln::builtin
