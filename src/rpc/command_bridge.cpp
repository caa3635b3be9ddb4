#include <kiln/rpc/proxies.h>
#include <kiln/rpc/servers.h>

#include <spdlog/spdlog.h>

namespace kiln::rpc {

// ============================================================================
// Command
// ============================================================================

std::string CommandProxy::help() const {
    auto r = invoke("Command.Help");
    if (!r || !r.value().is_string()) {
        spdlog::debug("Command.Help failed on {}", connection_->name());
        return {};
    }
    return r.value().get<std::string>();
}

std::string CommandProxy::synopsis() const {
    auto r = invoke("Command.Synopsis");
    if (!r || !r.value().is_string()) {
        spdlog::debug("Command.Synopsis failed on {}", connection_->name());
        return {};
    }
    return r.value().get<std::string>();
}

Result<int> CommandProxy::run(components::IEnvironment& env,
                              const std::vector<std::string>& args) {
    CallScope scope(*connection_);
    auto uiId = scope.add(std::make_shared<UiServer>(env.ui()));
    auto cacheId = scope.add(std::make_shared<CacheServer>(borrow(env.cache())));
    auto envId = scope.add(std::make_shared<EnvironmentServer>(env, scope.handle()));

    auto r = invoke("Command.Run",
                    {{"environment", envId}, {"ui", uiId}, {"cache", cacheId}, {"args", args}});
    if (!r) {
        return r.error();
    }
    if (!r.value().is_object() || !r.value().contains("exitCode") ||
        !r.value()["exitCode"].is_number_integer()) {
        return Error{ErrorCode::CommunicationProtocol, "Command.Run: malformed response"};
    }
    return r.value()["exitCode"].get<int>();
}

Result<nlohmann::json> CommandServer::invoke(const std::string& method, const nlohmann::json& args,
                                             Connection& connection) {
    if (method == "Help") {
        return nlohmann::json(command_->help());
    }
    if (method == "Synopsis") {
        return nlohmann::json(command_->synopsis());
    }
    if (method == "Run") {
        EnvironmentProxy env(connection.shared_from_this(), args.at("environment").get<uint64_t>(),
                             args.at("ui").get<uint64_t>(), args.at("cache").get<uint64_t>());
        auto code = command_->run(env, args.value("args", std::vector<std::string>{}));
        if (!code) {
            return code.error();
        }
        return nlohmann::json{{"exitCode", code.value()}};
    }
    return Error{ErrorCode::NotSupported, "unknown method Command." + method};
}

// ============================================================================
// Environment
// ============================================================================

EnvironmentProxy::EnvironmentProxy(std::shared_ptr<Connection> connection, uint64_t objectId,
                                   uint64_t uiId, uint64_t cacheId)
    : RemoteObject(std::move(connection), objectId),
      ui_(std::make_shared<UiProxy>(connection_, uiId)),
      cache_(std::make_shared<CacheProxy>(connection_, cacheId)) {}

Result<uint64_t> EnvironmentProxy::load(const std::string& method, const std::string& name) const {
    auto r = invoke(method, {{"name", name}});
    if (!r) {
        return r.error();
    }
    if (!r.value().is_object() || !r.value().contains("object") ||
        !r.value()["object"].is_number_unsigned()) {
        return Error{ErrorCode::CommunicationProtocol, method + ": malformed response"};
    }
    return r.value()["object"].get<uint64_t>();
}

Result<std::shared_ptr<components::IBuilder>>
EnvironmentProxy::builder(const std::string& name) {
    auto id = load("Environment.Builder", name);
    if (!id) {
        return id.error();
    }
    return std::shared_ptr<components::IBuilder>(
        std::make_shared<BuilderProxy>(connection_, id.value()));
}

Result<std::shared_ptr<components::IProvisioner>>
EnvironmentProxy::provisioner(const std::string& name) {
    auto id = load("Environment.Provisioner", name);
    if (!id) {
        return id.error();
    }
    return std::shared_ptr<components::IProvisioner>(
        std::make_shared<ProvisionerProxy>(connection_, id.value()));
}

Result<std::shared_ptr<components::IPostProcessor>>
EnvironmentProxy::postProcessor(const std::string& name) {
    auto id = load("Environment.PostProcessor", name);
    if (!id) {
        return id.error();
    }
    return std::shared_ptr<components::IPostProcessor>(
        std::make_shared<PostProcessorProxy>(connection_, id.value()));
}

Result<std::shared_ptr<components::IHook>> EnvironmentProxy::hook(const std::string& name) {
    auto id = load("Environment.Hook", name);
    if (!id) {
        return id.error();
    }
    return std::shared_ptr<components::IHook>(
        std::make_shared<HookProxy>(connection_, id.value()));
}

Result<nlohmann::json> EnvironmentServer::invoke(const std::string& method,
                                                 const nlohmann::json& args, Connection&) {
    const auto name = args.at("name").get<std::string>();
    std::shared_ptr<IServedObject> served;

    if (method == "Builder") {
        auto c = env_.builder(name);
        if (!c) return c.error();
        served = std::make_shared<BuilderServer>(c.value());
    } else if (method == "Provisioner") {
        auto c = env_.provisioner(name);
        if (!c) return c.error();
        served = std::make_shared<ProvisionerServer>(c.value());
    } else if (method == "PostProcessor") {
        auto c = env_.postProcessor(name);
        if (!c) return c.error();
        served = std::make_shared<PostProcessorServer>(c.value());
    } else if (method == "Hook") {
        auto c = env_.hook(name);
        if (!c) return c.error();
        served = std::make_shared<HookServer>(c.value());
    } else {
        return Error{ErrorCode::NotSupported, "unknown method Environment." + method};
    }
    auto id = scope_.add(std::move(served));
    if (!id) {
        return id.error();
    }
    return nlohmann::json{{"object", id.value()}};
}

} // namespace kiln::rpc
