// SPDX-License-Identifier: Apache-2.0
// Copyright (c) 2025 Trevon Sides

#pragma once

#include <kiln/components/builder.h>
#include <kiln/components/command.h>
#include <kiln/components/hook.h>
#include <kiln/components/post_processor.h>
#include <kiln/components/provisioner.h>
#include <kiln/core/types.h>
#include <kiln/rpc/connection.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kiln::plugin {

class PluginProcess;
struct HandshakeWait;

enum class ClientState { Created, Starting, Connected, InUse, Closing, Exited };

constexpr const char* clientStateName(ClientState state) {
    switch (state) {
        case ClientState::Created: return "created";
        case ClientState::Starting: return "starting";
        case ClientState::Connected: return "connected";
        case ClientState::InUse: return "in-use";
        case ClientState::Closing: return "closing";
        case ClientState::Exited: return "exited";
    }
    return "unknown";
}

struct PluginClientConfig {
    std::string name; ///< Used in logs and error messages
    std::filesystem::path executable;
    std::vector<std::string> args;
    std::string network{"unix"};
    uint16_t minPort{10000};
    uint16_t maxPort{25000};
    std::chrono::milliseconds startTimeout{60'000};
    std::chrono::milliseconds killGrace{2'000};
};

/**
 * @brief Owner of one plugin subprocess and its RPC connection
 *
 * Created -> Starting -> Connected -> Closing -> Exited. InUse is reported
 * while calls are in flight on a Connected client. kill() is valid from any
 * state and may run on a different thread than start(), including while
 * start() is waiting for the handshake.
 */
class PluginClient {
public:
    explicit PluginClient(PluginClientConfig config);
    ~PluginClient();

    PluginClient(const PluginClient&) = delete;
    PluginClient& operator=(const PluginClient&) = delete;

    /**
     * @brief Spawn the plugin, read its handshake and connect
     *
     * Idempotent once Connected. On any failure the subprocess is killed and
     * the client ends Exited with a launch error (PluginNotFound,
     * PluginTimeout, PluginProtocol or PluginConnect).
     */
    Result<void> start();

    // Capability proxies for the served component; CommunicationFailed once
    // the client is no longer connected.
    Result<std::shared_ptr<components::IBuilder>> builder();
    Result<std::shared_ptr<components::IProvisioner>> provisioner();
    Result<std::shared_ptr<components::IPostProcessor>> postProcessor();
    Result<std::shared_ptr<components::IHook>> hook();
    Result<std::shared_ptr<components::ICommand>> command();

    /**
     * @brief Disconnect and let the plugin exit on its own within the grace period
     *
     * Falls back to kill(). Idempotent.
     */
    void close();

    /**
     * @brief SIGTERM, bounded wait, SIGKILL. Idempotent and thread-safe.
     */
    void kill();

    ClientState state() const;
    bool exited() const noexcept { return state_.load() == ClientState::Exited; }
    std::optional<int> exitCode() const;
    int64_t pid() const;
    const std::string& name() const noexcept { return config_.name; }
    std::string address() const;

private:
    Result<std::shared_ptr<rpc::Connection>> connected(const char* capability) const;
    Error failStart(Error error);
    void stopProcess(const std::shared_ptr<PluginProcess>& process);

    PluginClientConfig config_;
    std::atomic<ClientState> state_{ClientState::Created};

    std::mutex startMutex_;
    std::mutex killMutex_;
    mutable std::mutex mutex_;
    std::shared_ptr<PluginProcess> process_;
    std::shared_ptr<rpc::Connection> connection_;
    std::shared_ptr<HandshakeWait> handshake_;
    std::string address_;
    std::optional<int> exitCode_;
    int64_t pid_{-1};
};

} // namespace kiln::plugin
