#pragma once

#include <kiln/components/artifact.h>
#include <kiln/components/builder.h>
#include <kiln/components/cache.h>
#include <kiln/components/command.h>
#include <kiln/components/environment.h>
#include <kiln/components/hook.h>
#include <kiln/components/post_processor.h>
#include <kiln/components/provisioner.h>
#include <kiln/rpc/connection.h>
#include <kiln/ui/ui.h>

#include <atomic>
#include <memory>

namespace kiln::rpc {

/**
 * Non-owning shared_ptr for callback arguments.
 *
 * A callback object lives in a CallScope for exactly one outbound call, while
 * the caller keeps the referenced object alive.
 */
template <typename T> std::shared_ptr<T> borrow(T& object) {
    return std::shared_ptr<T>(std::shared_ptr<T>{}, &object);
}

class UiServer : public IServedObject {
public:
    explicit UiServer(std::shared_ptr<ui::IUi> ui) : ui_(std::move(ui)) {}

    const char* capability() const override { return "Ui"; }
    Result<nlohmann::json> invoke(const std::string& method, const nlohmann::json& args,
                                  Connection& connection) override;

private:
    std::shared_ptr<ui::IUi> ui_;
};

class HookServer : public IServedObject {
public:
    explicit HookServer(std::shared_ptr<components::IHook> hook) : hook_(std::move(hook)) {}

    const char* capability() const override { return "Hook"; }
    Result<nlohmann::json> invoke(const std::string& method, const nlohmann::json& args,
                                  Connection& connection) override;

private:
    std::shared_ptr<components::IHook> hook_;
};

class CacheServer : public IServedObject {
public:
    explicit CacheServer(std::shared_ptr<components::ICache> cache) : cache_(std::move(cache)) {}

    const char* capability() const override { return "Cache"; }
    Result<nlohmann::json> invoke(const std::string& method, const nlohmann::json& args,
                                  Connection& connection) override;

private:
    std::shared_ptr<components::ICache> cache_;
};

/**
 * Served object the peer can retire.
 *
 * Once the final method (CacheLease.Release, Artifact.Destroy) succeeds the
 * object removes itself from the connection's table under the id it was
 * registered with.
 */
class RetiringObject : public IServedObject {
public:
    void bind(uint64_t objectId) noexcept { objectId_.store(objectId); }

protected:
    void retire(Connection& connection) const;

private:
    std::atomic<uint64_t> objectId_{0};
};

// Registers a retiring object on `connection` and binds it to its id.
uint64_t serveRetiring(Connection& connection, std::shared_ptr<RetiringObject> object);
uint64_t serveRetiring(CallScope& scope, std::shared_ptr<RetiringObject> object);

// Holds a lease for the peer; unregistering the object releases it.
class CacheLeaseServer : public RetiringObject {
public:
    explicit CacheLeaseServer(std::unique_ptr<components::CacheLease> lease)
        : lease_(std::move(lease)) {}

    const char* capability() const override { return "CacheLease"; }
    Result<nlohmann::json> invoke(const std::string& method, const nlohmann::json& args,
                                  Connection& connection) override;

private:
    std::unique_ptr<components::CacheLease> lease_;
};

class ArtifactServer : public RetiringObject {
public:
    explicit ArtifactServer(std::shared_ptr<components::IArtifact> artifact)
        : artifact_(std::move(artifact)) {}

    const char* capability() const override { return "Artifact"; }
    Result<nlohmann::json> invoke(const std::string& method, const nlohmann::json& args,
                                  Connection& connection) override;

private:
    std::shared_ptr<components::IArtifact> artifact_;
};

class BuilderServer : public IServedObject {
public:
    explicit BuilderServer(std::shared_ptr<components::IBuilder> builder)
        : builder_(std::move(builder)) {}

    const char* capability() const override { return "Builder"; }
    Result<nlohmann::json> invoke(const std::string& method, const nlohmann::json& args,
                                  Connection& connection) override;

private:
    std::shared_ptr<components::IBuilder> builder_;
};

class ProvisionerServer : public IServedObject {
public:
    explicit ProvisionerServer(std::shared_ptr<components::IProvisioner> provisioner)
        : provisioner_(std::move(provisioner)) {}

    const char* capability() const override { return "Provisioner"; }
    Result<nlohmann::json> invoke(const std::string& method, const nlohmann::json& args,
                                  Connection& connection) override;

private:
    std::shared_ptr<components::IProvisioner> provisioner_;
};

class PostProcessorServer : public IServedObject {
public:
    explicit PostProcessorServer(std::shared_ptr<components::IPostProcessor> postProcessor)
        : postProcessor_(std::move(postProcessor)) {}

    const char* capability() const override { return "PostProcessor"; }
    Result<nlohmann::json> invoke(const std::string& method, const nlohmann::json& args,
                                  Connection& connection) override;

private:
    std::shared_ptr<components::IPostProcessor> postProcessor_;
};

class CommandServer : public IServedObject {
public:
    explicit CommandServer(std::shared_ptr<components::ICommand> command)
        : command_(std::move(command)) {}

    const char* capability() const override { return "Command"; }
    Result<nlohmann::json> invoke(const std::string& method, const nlohmann::json& args,
                                  Connection& connection) override;

private:
    std::shared_ptr<components::ICommand> command_;
};

// Components loaded on behalf of the peer stay registered until the
// Command.Run call that created this server returns.
class EnvironmentServer : public IServedObject {
public:
    EnvironmentServer(components::IEnvironment& env, CallScope::Handle scope)
        : env_(env), scope_(std::move(scope)) {}

    const char* capability() const override { return "Environment"; }
    Result<nlohmann::json> invoke(const std::string& method, const nlohmann::json& args,
                                  Connection& connection) override;

private:
    components::IEnvironment& env_;
    CallScope::Handle scope_;
};

} // namespace kiln::rpc
