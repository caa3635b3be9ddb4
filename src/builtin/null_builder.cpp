#include <kiln/builtin/components.h>
#include <kiln/config/config_bundle.h>

#include <spdlog/spdlog.h>

namespace kiln::builtin {

Result<std::vector<std::string>> NullBuilder::prepare(const std::vector<ConfigBundle>& configs) {
    const auto merged = config::mergeBundles(configs);
    config::ConfigDecoder decoder(merged);
    artifactId_ = decoder.optionalString("artifact_id", "null");
    files_ = decoder.optionalStringList("files");
    decoder.rejectUnknownKeys({"artifact_id", "files"});
    if (auto r = decoder.finish(); !r) {
        return r.error();
    }
    return std::vector<std::string>{};
}

Result<std::shared_ptr<components::IArtifact>>
NullBuilder::run(ui::IUi& ui, components::IHook& hook, components::ICache&) {
    if (cancelled_) {
        return Error{ErrorCode::OperationCancelled, "build cancelled"};
    }
    ui.say("Running null builder");
    if (auto r = hook.run(components::kHookProvision, ui, nlohmann::json::object()); !r) {
        return r.error();
    }
    if (cancelled_) {
        return Error{ErrorCode::OperationCancelled, "build cancelled"};
    }
    return std::shared_ptr<components::IArtifact>(std::make_shared<components::BasicArtifact>(
        kNullBuilderId, artifactId_, files_, "Null artifact: " + artifactId_));
}

void NullBuilder::cancel() {
    spdlog::debug("null builder cancelled");
    cancelled_ = true;
}

} // namespace kiln::builtin
