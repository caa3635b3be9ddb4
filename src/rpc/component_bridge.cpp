// SPDX-License-Identifier: Apache-2.0
// Copyright (c) 2025 Trevon Sides

#include <kiln/rpc/proxies.h>
#include <kiln/rpc/servers.h>

#include <spdlog/spdlog.h>

namespace kiln::rpc {

namespace {

nlohmann::json encodeConfigs(const std::vector<ConfigBundle>& configs) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& c : configs) {
        out.push_back(c);
    }
    return out;
}

std::vector<ConfigBundle> decodeConfigs(const nlohmann::json& args) {
    std::vector<ConfigBundle> configs;
    for (const auto& c : args.at("configs")) {
        configs.push_back(c);
    }
    return configs;
}

Result<void> voidResult(const Result<nlohmann::json>& r) {
    if (!r) {
        return r.error();
    }
    return Result<void>();
}

Result<nlohmann::json> voidReply(const Result<void>& r) {
    if (!r) {
        return r.error();
    }
    return nlohmann::json(nullptr);
}

void fireAndLog(const Result<nlohmann::json>& r, const char* method) {
    if (!r) {
        spdlog::debug("{} failed: {}", method, r.error().message);
    }
}

} // namespace

// ============================================================================
// Hook
// ============================================================================

Result<void> HookProxy::run(const std::string& name, ui::IUi& ui, const nlohmann::json& data) {
    CallScope scope(*connection_);
    auto uiId = scope.add(std::make_shared<UiServer>(borrow(ui)));
    return voidResult(invoke("Hook.Run", {{"name", name}, {"ui", uiId}, {"data", data}}));
}

void HookProxy::cancel() {
    fireAndLog(invoke("Hook.Cancel"), "Hook.Cancel");
}

Result<nlohmann::json> HookServer::invoke(const std::string& method, const nlohmann::json& args,
                                          Connection& connection) {
    if (method == "Run") {
        UiProxy ui(connection.shared_from_this(), args.at("ui").get<uint64_t>());
        return voidReply(hook_->run(args.at("name").get<std::string>(), ui,
                                    args.value("data", nlohmann::json())));
    }
    if (method == "Cancel") {
        hook_->cancel();
        return nlohmann::json(nullptr);
    }
    return Error{ErrorCode::NotSupported, "unknown method Hook." + method};
}

// ============================================================================
// Builder
// ============================================================================

Result<std::vector<std::string>> BuilderProxy::prepare(const std::vector<ConfigBundle>& configs) {
    auto r = invoke("Builder.Prepare", {{"configs", encodeConfigs(configs)}});
    if (!r) {
        return r.error();
    }
    std::vector<std::string> warnings;
    if (r.value().is_object()) {
        for (const auto& w : r.value().value("warnings", nlohmann::json::array())) {
            if (w.is_string()) {
                warnings.push_back(w.get<std::string>());
            }
        }
    }
    return warnings;
}

Result<std::shared_ptr<components::IArtifact>>
BuilderProxy::run(ui::IUi& ui, components::IHook& hook, components::ICache& cache) {
    CallScope scope(*connection_);
    nlohmann::json args{{"ui", scope.add(std::make_shared<UiServer>(borrow(ui)))},
                        {"hook", scope.add(std::make_shared<HookServer>(borrow(hook)))},
                        {"cache", scope.add(std::make_shared<CacheServer>(borrow(cache)))}};
    auto r = invoke("Builder.Run", std::move(args));
    if (!r) {
        return r.error();
    }
    return decodeArtifact(connection_, r.value());
}

void BuilderProxy::cancel() {
    fireAndLog(invoke("Builder.Cancel"), "Builder.Cancel");
}

Result<nlohmann::json> BuilderServer::invoke(const std::string& method, const nlohmann::json& args,
                                             Connection& connection) {
    if (method == "Prepare") {
        auto warnings = builder_->prepare(decodeConfigs(args));
        if (!warnings) {
            return warnings.error();
        }
        return nlohmann::json{{"warnings", warnings.value()}};
    }
    if (method == "Run") {
        auto self = connection.shared_from_this();
        UiProxy ui(self, args.at("ui").get<uint64_t>());
        HookProxy hook(self, args.at("hook").get<uint64_t>());
        CacheProxy cache(self, args.at("cache").get<uint64_t>());
        auto artifact = builder_->run(ui, hook, cache);
        if (!artifact) {
            return artifact.error();
        }
        if (!artifact.value()) {
            return nlohmann::json(nullptr);
        }
        auto id = serveRetiring(connection, std::make_shared<ArtifactServer>(artifact.value()));
        return encodeArtifact(artifact.value(), id);
    }
    if (method == "Cancel") {
        builder_->cancel();
        return nlohmann::json(nullptr);
    }
    return Error{ErrorCode::NotSupported, "unknown method Builder." + method};
}

// ============================================================================
// Provisioner
// ============================================================================

Result<void> ProvisionerProxy::prepare(const std::vector<ConfigBundle>& configs) {
    return voidResult(invoke("Provisioner.Prepare", {{"configs", encodeConfigs(configs)}}));
}

Result<void> ProvisionerProxy::provision(ui::IUi& ui) {
    CallScope scope(*connection_);
    auto uiId = scope.add(std::make_shared<UiServer>(borrow(ui)));
    return voidResult(invoke("Provisioner.Provision", {{"ui", uiId}}));
}

void ProvisionerProxy::cancel() {
    fireAndLog(invoke("Provisioner.Cancel"), "Provisioner.Cancel");
}

Result<nlohmann::json> ProvisionerServer::invoke(const std::string& method,
                                                 const nlohmann::json& args,
                                                 Connection& connection) {
    if (method == "Prepare") {
        return voidReply(provisioner_->prepare(decodeConfigs(args)));
    }
    if (method == "Provision") {
        UiProxy ui(connection.shared_from_this(), args.at("ui").get<uint64_t>());
        return voidReply(provisioner_->provision(ui));
    }
    if (method == "Cancel") {
        provisioner_->cancel();
        return nlohmann::json(nullptr);
    }
    return Error{ErrorCode::NotSupported, "unknown method Provisioner." + method};
}

// ============================================================================
// PostProcessor
// ============================================================================

Result<void> PostProcessorProxy::configure(const std::vector<ConfigBundle>& configs) {
    return voidResult(invoke("PostProcessor.Configure", {{"configs", encodeConfigs(configs)}}));
}

Result<components::PostProcessResult>
PostProcessorProxy::postProcess(ui::IUi& ui, std::shared_ptr<components::IArtifact> artifact) {
    CallScope scope(*connection_);
    auto uiId = scope.add(std::make_shared<UiServer>(borrow(ui)));
    nlohmann::json artifactRef = nullptr;
    if (artifact) {
        artifactRef =
            encodeArtifact(artifact, serveRetiring(scope, std::make_shared<ArtifactServer>(artifact)));
    }
    auto r = invoke("PostProcessor.PostProcess", {{"ui", uiId}, {"artifact", artifactRef}});
    if (!r) {
        return r.error();
    }
    if (!r.value().is_object()) {
        return Error{ErrorCode::CommunicationProtocol,
                     "PostProcessor.PostProcess: malformed response"};
    }
    auto out = decodeArtifact(connection_, r.value().value("artifact", nlohmann::json()));
    if (!out) {
        return out.error();
    }
    components::PostProcessResult result;
    result.artifact = out.value();
    result.keep = r.value().value("keep", false);
    return result;
}

Result<nlohmann::json> PostProcessorServer::invoke(const std::string& method,
                                                   const nlohmann::json& args,
                                                   Connection& connection) {
    if (method == "Configure") {
        return voidReply(postProcessor_->configure(decodeConfigs(args)));
    }
    if (method == "PostProcess") {
        auto self = connection.shared_from_this();
        UiProxy ui(self, args.at("ui").get<uint64_t>());
        auto input = decodeArtifact(self, args.value("artifact", nlohmann::json()));
        if (!input) {
            return input.error();
        }
        auto result = postProcessor_->postProcess(ui, input.value());
        if (!result) {
            return result.error();
        }
        nlohmann::json artifactRef = nullptr;
        if (auto out = result.value().artifact) {
            artifactRef =
                encodeArtifact(out, serveRetiring(connection, std::make_shared<ArtifactServer>(out)));
        }
        return nlohmann::json{{"artifact", artifactRef}, {"keep", result.value().keep}};
    }
    return Error{ErrorCode::NotSupported, "unknown method PostProcessor." + method};
}

} // namespace kiln::rpc
