#include <kiln/rpc/proxies.h>
#include <kiln/rpc/servers.h>

#include <spdlog/spdlog.h>

namespace kiln::rpc {

nlohmann::json encodeArtifact(const std::shared_ptr<components::IArtifact>& artifact,
                              uint64_t objectId) {
    if (!artifact) {
        return nullptr;
    }
    return {{"object", objectId},
            {"builderId", artifact->builderId()},
            {"id", artifact->id()},
            {"files", artifact->files()},
            {"string", artifact->string()}};
}

Result<std::shared_ptr<components::IArtifact>>
decodeArtifact(const std::shared_ptr<Connection>& connection, const nlohmann::json& value) {
    if (value.is_null()) {
        return std::shared_ptr<components::IArtifact>{};
    }
    try {
        return std::shared_ptr<components::IArtifact>(std::make_shared<ArtifactProxy>(
            connection, value.at("object").get<uint64_t>(),
            value.value("builderId", std::string{}), value.value("id", std::string{}),
            value.value("files", std::vector<std::string>{}),
            value.value("string", std::string{})));
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::CommunicationProtocol,
                     std::string("malformed artifact reference: ") + e.what()};
    }
}

void RetiringObject::retire(Connection& connection) const {
    if (auto id = objectId_.load(); id != 0) {
        connection.unregisterObject(id);
    }
}

uint64_t serveRetiring(Connection& connection, std::shared_ptr<RetiringObject> object) {
    auto id = connection.registerObject(object);
    object->bind(id);
    return id;
}

uint64_t serveRetiring(CallScope& scope, std::shared_ptr<RetiringObject> object) {
    auto id = scope.add(object);
    object->bind(id);
    return id;
}

// ============================================================================
// Artifact
// ============================================================================

ArtifactProxy::ArtifactProxy(std::shared_ptr<Connection> connection, uint64_t objectId,
                             std::string builderId, std::string id,
                             std::vector<std::string> files, std::string description)
    : RemoteObject(std::move(connection), objectId), builderId_(std::move(builderId)),
      id_(std::move(id)), files_(std::move(files)), description_(std::move(description)) {}

Result<void> ArtifactProxy::destroy() {
    auto r = invoke("Artifact.Destroy");
    if (!r) {
        return r.error();
    }
    return Result<void>();
}

Result<nlohmann::json> ArtifactServer::invoke(const std::string& method, const nlohmann::json&,
                                              Connection& connection) {
    if (method == "Destroy") {
        if (auto r = artifact_->destroy(); !r) {
            return r.error();
        }
        retire(connection);
        return nlohmann::json(nullptr);
    }
    if (method == "String") {
        return nlohmann::json(artifact_->string());
    }
    return Error{ErrorCode::NotSupported, "unknown method Artifact." + method};
}

// ============================================================================
// Cache
// ============================================================================

CacheLeaseProxy::CacheLeaseProxy(std::shared_ptr<Connection> connection, uint64_t objectId,
                                 std::string key, std::filesystem::path path)
    : RemoteObject(std::move(connection), objectId), key_(std::move(key)),
      path_(std::move(path)) {}

CacheLeaseProxy::~CacheLeaseProxy() {
    release();
}

void CacheLeaseProxy::release() {
    if (!held_.exchange(false)) {
        return;
    }
    // A dead peer has already dropped the lease with its object table.
    if (auto r = invoke("CacheLease.Release"); !r) {
        spdlog::debug("releasing cache lease '{}': {}", key_, r.error().message);
    }
}

Result<std::unique_ptr<components::CacheLease>> CacheProxy::acquire(const std::string& key) {
    auto r = invoke("Cache.Acquire", {{"key", key}});
    if (!r) {
        return r.error();
    }
    const auto& v = r.value();
    if (!v.is_object() || !v.contains("lease") || !v["lease"].is_number_unsigned() ||
        !v.contains("path") || !v["path"].is_string()) {
        return Error{ErrorCode::CommunicationProtocol, "Cache.Acquire: malformed lease"};
    }
    return std::unique_ptr<components::CacheLease>(std::make_unique<CacheLeaseProxy>(
        connection_, v["lease"].get<uint64_t>(), key, v["path"].get<std::string>()));
}

Result<nlohmann::json> CacheServer::invoke(const std::string& method, const nlohmann::json& args,
                                           Connection& connection) {
    if (method != "Acquire") {
        return Error{ErrorCode::NotSupported, "unknown method Cache." + method};
    }
    auto lease = cache_->acquire(args.at("key").get<std::string>());
    if (!lease) {
        return lease.error();
    }
    auto path = lease.value()->path().string();
    // The lease outlives this call: it is held until released or the peer goes away.
    auto id = serveRetiring(connection,
                            std::make_shared<CacheLeaseServer>(std::move(lease).value()));
    return nlohmann::json{{"lease", id}, {"path", path}};
}

Result<nlohmann::json> CacheLeaseServer::invoke(const std::string& method,
                                                const nlohmann::json&,
                                                Connection& connection) {
    if (method == "Release") {
        lease_->release();
        retire(connection);
        return nlohmann::json(nullptr);
    }
    if (method == "Path") {
        return nlohmann::json(lease_->path().string());
    }
    return Error{ErrorCode::NotSupported, "unknown method CacheLease." + method};
}

} // namespace kiln::rpc
