#include "command_support.h"

#include <kiln/build/build.h>
#include <kiln/builtin/commands.h>
#include <kiln/components/environment.h>

#include <spdlog/spdlog.h>

#include <map>
#include <mutex>
#include <thread>

namespace kiln::builtin {

namespace {

using ArtifactList = std::vector<std::shared_ptr<components::IArtifact>>;

void reportArtifacts(ui::IUi& ui, const std::shared_ptr<ui::IUi>& targetUi,
                     const std::string& name, const ArtifactList& artifacts) {
    targetUi->machine("artifact-count", {std::to_string(artifacts.size())});
    if (artifacts.empty()) {
        ui.message("--> " + name + ": Build finished but no artifacts were created.");
        return;
    }
    for (size_t i = 0; i < artifacts.size(); ++i) {
        const auto& artifact = artifacts[i];
        const auto index = std::to_string(i);
        targetUi->machine("artifact", {index, "builder-id", artifact->builderId()});
        targetUi->machine("artifact", {index, "id", artifact->id()});
        targetUi->machine("artifact", {index, "string", artifact->string()});
        auto files = artifact->files();
        targetUi->machine("artifact", {index, "files-count", std::to_string(files.size())});
        for (size_t f = 0; f < files.size(); ++f) {
            targetUi->machine("artifact", {index, "file", std::to_string(f), files[f]});
        }
        targetUi->machine("artifact", {index, "end"});
        ui.message("--> " + name + ": " + artifact->string());
    }
}

} // namespace

std::string BuildCommand::help() const {
    return "Usage: kiln build [options] TEMPLATE\n\n"
           "  Runs every build in the template and reports the resulting artifacts.\n\n"
           "Options:\n"
           "  --only=a,b        Only run the named builds\n"
           "  --except=a,b      Run every build except the named ones\n"
           "  --parallel=false  Run builds one after another";
}

std::string BuildCommand::synopsis() const {
    return "Build image(s) from template";
}

Result<int> BuildCommand::run(components::IEnvironment& env, const std::vector<std::string>& args) {
    auto ui = env.ui();

    build::BuildFilter filter;
    bool parallel = true;
    std::string templatePath;

    CLI::App app{synopsis(), "kiln build"};
    app.add_option("--only", filter.only, "Only run the named builds")->delimiter(',');
    app.add_option("--except", filter.except, "Run every build except the named ones")
        ->delimiter(',');
    app.add_option("--parallel", parallel, "Run builds concurrently")->default_val(true);
    app.add_option("template", templatePath, "Path to the build template")->required();
    if (auto code = detail::parseArgs(app, args, *ui)) {
        return *code;
    }
    if (!filter.only.empty() && !filter.except.empty()) {
        ui->error("Error: only one of --only or --except may be specified");
        return 1;
    }

    auto tpl = build::loadTemplate(templatePath);
    if (!tpl) {
        ui->error("Failed to parse template: " + formatError(tpl.error()));
        return 1;
    }

    auto created = build::createBuilds(tpl.value(), env, filter);
    if (!created) {
        return created.error();
    }
    auto builds = created.value();

    bool prepareFailed = false;
    for (const auto& b : builds) {
        auto warnings = b->prepare();
        if (!warnings) {
            ui->error(formatError(warnings.error()));
            prepareFailed = true;
            continue;
        }
        for (const auto& w : warnings.value()) {
            ui->error("Warning: " + b->name() + ": " + w);
        }
    }
    if (prepareFailed) {
        return 1;
    }

    CancellationSubscription onCancel(env.cancellation(), [&builds] {
        spdlog::info("cancelling {} build(s)", builds.size());
        for (const auto& b : builds) {
            b->cancel();
        }
    });

    std::mutex resultsMutex;
    std::map<std::string, Result<ArtifactList>> results;
    auto runOne = [&](const std::shared_ptr<build::Build>& b) {
        auto targetUi = ui::forTarget(ui, b->name());
        targetUi->say("Starting " + b->builderType() + " builder");
        auto result = b->run(targetUi, env.cache());
        if (!result) {
            targetUi->error("Build '" + b->name() + "' errored: " + result.error().message);
            targetUi->machine("error", {result.error().message});
        } else {
            targetUi->say("Build '" + b->name() + "' finished.");
        }
        std::lock_guard<std::mutex> lock(resultsMutex);
        results.emplace(b->name(), std::move(result));
    };

    if (parallel) {
        std::vector<std::thread> workers;
        workers.reserve(builds.size());
        for (const auto& b : builds) {
            workers.emplace_back(runOne, b);
        }
        for (auto& t : workers) {
            t.join();
        }
    } else {
        for (const auto& b : builds) {
            if (env.cancellation().isCancelled()) {
                break;
            }
            runOne(b);
        }
    }

    if (env.cancellation().isCancelled()) {
        ui->error("Build cancelled: all builds were interrupted.");
        return 1;
    }

    int failed = 0;
    for (const auto& b : builds) {
        auto it = results.find(b->name());
        if (it == results.end() || !it->second) {
            ++failed;
        }
    }
    if (failed > 0) {
        ui->error("\n==> Some builds didn't complete successfully and had errors:");
        for (const auto& b : builds) {
            auto it = results.find(b->name());
            if (it != results.end() && !it->second) {
                ui->error("--> " + b->name() + ": " + formatError(it->second.error()));
            }
        }
    }

    ui->say("\n==> Builds finished. The artifacts of successful builds are:");
    for (const auto& b : builds) {
        auto it = results.find(b->name());
        if (it != results.end() && it->second) {
            reportArtifacts(*ui, ui::forTarget(ui, b->name()), b->name(), it->second.value());
        }
    }
    return failed > 0 ? 1 : 0;
}

} // namespace kiln::builtin
