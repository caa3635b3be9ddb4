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

#include <memory>
#include <string>
#include <vector>

namespace kiln::rpc {

/**
 * Base of every client-side proxy: a remote object id on a connection.
 *
 * A proxy never owns the process behind the connection; once the peer is gone
 * every method fails with CommunicationFailed.
 */
class RemoteObject {
public:
    RemoteObject(std::shared_ptr<Connection> connection, uint64_t objectId)
        : connection_(std::move(connection)), objectId_(objectId) {}

    uint64_t objectId() const noexcept { return objectId_; }
    const std::shared_ptr<Connection>& connection() const noexcept { return connection_; }

protected:
    Result<nlohmann::json> invoke(const std::string& method,
                                  nlohmann::json args = nlohmann::json::object()) const {
        return connection_->call(objectId_, method, std::move(args));
    }

    std::shared_ptr<Connection> connection_;
    uint64_t objectId_;
};

class UiProxy : public ui::IUi, public RemoteObject {
public:
    using RemoteObject::RemoteObject;

    Result<std::string> ask(const std::string& query) override;
    void say(const std::string& message) override;
    void message(const std::string& message) override;
    void error(const std::string& message) override;
    void machine(const std::string& type, const std::vector<std::string>& data) override;

private:
    void notify(const std::string& method, nlohmann::json args) const;
};

// Artifact whose descriptive fields travel by value; destroy() is remote.
class ArtifactProxy : public components::IArtifact, public RemoteObject {
public:
    ArtifactProxy(std::shared_ptr<Connection> connection, uint64_t objectId, std::string builderId,
                  std::string id, std::vector<std::string> files, std::string description);

    std::string builderId() const override { return builderId_; }
    std::vector<std::string> files() const override { return files_; }
    std::string id() const override { return id_; }
    std::string string() const override { return description_; }
    Result<void> destroy() override;

private:
    std::string builderId_;
    std::string id_;
    std::vector<std::string> files_;
    std::string description_;
};

class CacheLeaseProxy : public components::CacheLease, public RemoteObject {
public:
    CacheLeaseProxy(std::shared_ptr<Connection> connection, uint64_t objectId, std::string key,
                    std::filesystem::path path);
    ~CacheLeaseProxy() override;

    const std::string& key() const override { return key_; }
    std::filesystem::path path() const override { return path_; }
    void release() override;
    bool held() const override { return held_.load(); }

private:
    std::string key_;
    std::filesystem::path path_;
    std::atomic<bool> held_{true};
};

class CacheProxy : public components::ICache, public RemoteObject {
public:
    using RemoteObject::RemoteObject;

    Result<std::unique_ptr<components::CacheLease>> acquire(const std::string& key) override;
};

class HookProxy : public components::IHook, public RemoteObject {
public:
    using RemoteObject::RemoteObject;

    Result<void> run(const std::string& name, ui::IUi& ui, const nlohmann::json& data) override;
    void cancel() override;
};

class BuilderProxy : public components::IBuilder, public RemoteObject {
public:
    using RemoteObject::RemoteObject;

    Result<std::vector<std::string>> prepare(const std::vector<ConfigBundle>& configs) override;
    Result<std::shared_ptr<components::IArtifact>> run(ui::IUi& ui, components::IHook& hook,
                                                       components::ICache& cache) override;
    void cancel() override;
};

class ProvisionerProxy : public components::IProvisioner, public RemoteObject {
public:
    using RemoteObject::RemoteObject;

    Result<void> prepare(const std::vector<ConfigBundle>& configs) override;
    Result<void> provision(ui::IUi& ui) override;
    void cancel() override;
};

class PostProcessorProxy : public components::IPostProcessor, public RemoteObject {
public:
    using RemoteObject::RemoteObject;

    Result<void> configure(const std::vector<ConfigBundle>& configs) override;
    Result<components::PostProcessResult>
    postProcess(ui::IUi& ui, std::shared_ptr<components::IArtifact> artifact) override;
};

class CommandProxy : public components::ICommand, public RemoteObject {
public:
    using RemoteObject::RemoteObject;

    std::string help() const override;
    std::string synopsis() const override;
    Result<int> run(components::IEnvironment& env, const std::vector<std::string>& args) override;
};

/**
 * Host environment as seen by a command running in a plugin.
 *
 * Components it loads are served by the host and reached through proxies.
 */
class EnvironmentProxy : public components::IEnvironment, public RemoteObject {
public:
    EnvironmentProxy(std::shared_ptr<Connection> connection, uint64_t objectId, uint64_t uiId,
                     uint64_t cacheId);

    std::shared_ptr<ui::IUi> ui() override { return ui_; }
    components::ICache& cache() override { return *cache_; }

    Result<std::shared_ptr<components::IBuilder>> builder(const std::string& name) override;
    Result<std::shared_ptr<components::IProvisioner>> provisioner(const std::string& name) override;
    Result<std::shared_ptr<components::IPostProcessor>>
    postProcessor(const std::string& name) override;
    Result<std::shared_ptr<components::IHook>> hook(const std::string& name) override;

private:
    Result<uint64_t> load(const std::string& method, const std::string& name) const;

    std::shared_ptr<UiProxy> ui_;
    std::shared_ptr<CacheProxy> cache_;
};

// Artifact reference: descriptive fields plus the id of a served object.
// Artifacts that are themselves proxies are wrapped again, never unwrapped.
nlohmann::json encodeArtifact(const std::shared_ptr<components::IArtifact>& artifact,
                              uint64_t objectId);
Result<std::shared_ptr<components::IArtifact>>
decodeArtifact(const std::shared_ptr<Connection>& connection, const nlohmann::json& value);

} // namespace kiln::rpc
