#include <kiln/build/build.h>
#include <kiln/builtin/components.h>
#include <kiln/config/config_bundle.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <sstream>

namespace kiln::builtin {

namespace {

// Builds running concurrently may share one manifest file.
std::mutex& manifestMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

Result<void> ManifestPostProcessor::configure(const std::vector<ConfigBundle>& configs) {
    const auto merged = config::mergeBundles(configs);
    config::ConfigDecoder decoder(merged);
    output_ = decoder.optionalString("output", "kiln-manifest.json");
    buildName_ = decoder.optionalString(build::kBuildNameKey);
    builderType_ = decoder.optionalString(build::kBuilderTypeKey);
    decoder.rejectUnknownKeys({"output"});
    if (output_.empty()) {
        decoder.fail("'output' must not be empty");
    }
    return decoder.finish();
}

Result<components::PostProcessResult>
ManifestPostProcessor::postProcess(ui::IUi& ui, std::shared_ptr<components::IArtifact> artifact) {
    if (!artifact) {
        return Error{ErrorCode::InvalidArgument, "manifest requires an artifact"};
    }

    nlohmann::json record{
        {"name", buildName_},
        {"builder_type", builderType_},
        {"build_time", std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count()},
        {"artifact_id", artifact->id()},
        {"builder_id", artifact->builderId()},
        {"files", artifact->files()},
    };

    std::lock_guard<std::mutex> lock(manifestMutex());
    nlohmann::json manifest{{"builds", nlohmann::json::array()}};
    {
        std::ifstream in(output_);
        if (in) {
            std::stringstream buffer;
            buffer << in.rdbuf();
            try {
                manifest = nlohmann::json::parse(buffer.str());
            } catch (const nlohmann::json::parse_error& e) {
                return Error{ErrorCode::BuildFailed,
                             "existing manifest " + output_.string() + " is not valid JSON: " +
                                 e.what()};
            }
            if (!manifest.is_object() || !manifest["builds"].is_array()) {
                return Error{ErrorCode::BuildFailed,
                             "existing manifest " + output_.string() + " has no 'builds' list"};
            }
        }
    }
    manifest["builds"].push_back(std::move(record));

    std::ofstream out(output_, std::ios::trunc);
    out << manifest.dump(2) << '\n';
    out.close();
    if (!out) {
        return Error{ErrorCode::IOError, "failed to write manifest " + output_.string()};
    }
    ui.say("Manifest updated: " + output_.string());
    spdlog::debug("manifest {} now holds {} build(s)", output_.string(), manifest["builds"].size());
    return components::PostProcessResult{artifact, true};
}

} // namespace kiln::builtin
