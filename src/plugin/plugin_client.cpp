// SPDX-License-Identifier: Apache-2.0
// Copyright (c) 2025 Trevon Sides

#include <kiln/plugin/handshake.h>
#include <kiln/plugin/plugin_client.h>
#include <kiln/plugin/plugin_process.hpp>
#include <kiln/rpc/proxies.h>
#include <kiln/rpc/transport.h>

#include <spdlog/spdlog.h>

#include <condition_variable>

namespace kiln::plugin {

using namespace std::chrono_literals;

// First stdout line of the plugin, or EOF, or an abort from kill().
struct HandshakeWait {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<std::string> line;
    bool eof{false};
    bool aborted{false};
};

namespace {

std::string exitStatusText(const std::shared_ptr<PluginProcess>& process,
                           std::chrono::milliseconds wait) {
    if (!process || !process->wait_for_exit(wait)) {
        return {};
    }
    auto code = process->exit_code();
    if (!code || *code < 0) {
        return "plugin exited";
    }
    return "plugin exited with status " + std::to_string(*code);
}

} // namespace

PluginClient::PluginClient(PluginClientConfig config) : config_(std::move(config)) {
    if (config_.name.empty()) {
        config_.name = config_.executable.filename().string();
    }
}

PluginClient::~PluginClient() {
    kill();
}

Result<void> PluginClient::start() {
    std::lock_guard<std::mutex> startLock(startMutex_);

    auto current = state_.load();
    if (current == ClientState::Connected) {
        return Result<void>();
    }
    auto expected = ClientState::Created;
    if (!state_.compare_exchange_strong(expected, ClientState::Starting)) {
        return Error{ErrorCode::InvalidState, "plugin " + config_.name + " cannot start from state " +
                                                  clientStateName(expected)};
    }

    spdlog::debug("starting plugin {} ({})", config_.name, config_.executable.string());
    auto wait = std::make_shared<HandshakeWait>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handshake_ = wait;
    }

    PluginProcessConfig pc{.executable = config_.executable, .args = config_.args};
    pc.with_env(kMagicCookieKey, kMagicCookieValue)
        .with_env(kEnvNetwork, config_.network)
        .with_env(kEnvMinPort, std::to_string(config_.minPort))
        .with_env(kEnvMaxPort, std::to_string(config_.maxPort));

    const std::string name = config_.name;
    pc.on_stdout([wait, name](std::string_view line) {
          {
              std::lock_guard<std::mutex> lock(wait->mutex);
              if (!wait->line) {
                  wait->line = std::string(line);
                  wait->cv.notify_all();
                  return;
              }
          }
          spdlog::info("{}: {}", name, line);
      })
        .on_stderr([name](std::string_view line) { spdlog::debug("{}: {}", name, line); });
    pc.stdout_closed = [wait] {
        std::lock_guard<std::mutex> lock(wait->mutex);
        wait->eof = true;
        wait->cv.notify_all();
    };

    auto spawned = PluginProcess::spawn(std::move(pc));
    if (!spawned) {
        return failStart(spawned.error());
    }
    std::shared_ptr<PluginProcess> process = std::move(spawned).value();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        process_ = process;
        pid_ = process->pid();
    }
    if (state_.load() != ClientState::Starting) {
        // kill() ran before the process was published.
        stopProcess(process);
        return Error{ErrorCode::OperationCancelled, "plugin " + config_.name + " was killed"};
    }

    std::string line;
    {
        std::unique_lock<std::mutex> lock(wait->mutex);
        bool signalled = wait->cv.wait_for(lock, config_.startTimeout, [&] {
            return wait->line.has_value() || wait->eof || wait->aborted;
        });
        if (wait->aborted) {
            lock.unlock();
            return failStart(
                Error{ErrorCode::OperationCancelled, "plugin " + config_.name + " was killed"});
        }
        if (!signalled) {
            lock.unlock();
            return failStart(Error{ErrorCode::PluginTimeout,
                                   "timeout after " + std::to_string(config_.startTimeout.count()) +
                                       " ms waiting for handshake from plugin " + config_.name});
        }
        if (!wait->line) {
            lock.unlock();
            auto status = exitStatusText(process, 1s);
            return failStart(Error{ErrorCode::PluginProtocol,
                                   "plugin " + config_.name + " closed stdout before handshake" +
                                       (status.empty() ? "" : " (" + status + ")")});
        }
        line = *wait->line;
    }

    auto handshake = parseHandshake(line);
    if (!handshake) {
        return failStart(Error{ErrorCode::PluginProtocol,
                               "plugin " + config_.name + ": " + handshake.error().message});
    }

    auto transport = rpc::dial(handshake.value().network, handshake.value().address, 5s);
    if (!transport) {
        return failStart(Error{ErrorCode::PluginConnect,
                               "plugin " + config_.name + ": " + transport.error().message});
    }

    auto connection = rpc::Connection::create(std::move(transport).value(), config_.name);
    std::weak_ptr<PluginProcess> weakProcess = process;
    connection->setDisconnectDescriber([weakProcess] {
        return exitStatusText(weakProcess.lock(), 1s);
    });
    connection->start();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = connection;
        address_ = handshake.value().network + ":" + handshake.value().address;
    }

    expected = ClientState::Starting;
    if (!state_.compare_exchange_strong(expected, ClientState::Connected)) {
        connection->close();
        return Error{ErrorCode::OperationCancelled, "plugin " + config_.name + " was killed"};
    }
    spdlog::info("plugin {} connected ({}, pid {})", config_.name, address(), pid());
    return Result<void>();
}

Error PluginClient::failStart(Error error) {
    spdlog::debug("plugin {} failed to start: {}", config_.name, error.message);
    kill();
    return error;
}

void PluginClient::stopProcess(const std::shared_ptr<PluginProcess>& process) {
    process->terminate(config_.killGrace);
    std::lock_guard<std::mutex> lock(mutex_);
    exitCode_ = process->exit_code();
}

void PluginClient::kill() {
    std::lock_guard<std::mutex> killLock(killMutex_);
    if (state_.load() == ClientState::Exited) {
        return;
    }
    state_.store(ClientState::Closing);

    std::shared_ptr<HandshakeWait> wait;
    std::shared_ptr<PluginProcess> process;
    std::shared_ptr<rpc::Connection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wait = handshake_;
        process = process_;
        connection = connection_;
    }
    if (wait) {
        std::lock_guard<std::mutex> lock(wait->mutex);
        wait->aborted = true;
        wait->cv.notify_all();
    }
    // Process first: the connection then sees EOF with a known exit status.
    if (process) {
        stopProcess(process);
    }
    if (connection) {
        connection->close();
    }
    state_.store(ClientState::Exited);
    spdlog::debug("plugin {} exited (status {})", config_.name,
                  exitCode() ? std::to_string(*exitCode()) : std::string("unknown"));
}

void PluginClient::close() {
    if (state_.load() == ClientState::Exited) {
        return;
    }
    std::shared_ptr<PluginProcess> process;
    std::shared_ptr<rpc::Connection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        process = process_;
        connection = connection_;
    }
    // A served plugin exits once the host hangs up.
    if (connection) {
        connection->close();
    }
    if (process && process->wait_for_exit(config_.killGrace)) {
        std::lock_guard<std::mutex> lock(mutex_);
        exitCode_ = process->exit_code();
    }
    kill();
}

ClientState PluginClient::state() const {
    auto current = state_.load();
    if (current == ClientState::Connected) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_ && connection_->pendingCalls() > 0) {
            return ClientState::InUse;
        }
    }
    return current;
}

std::optional<int> PluginClient::exitCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exitCode_ && process_) {
        return process_->exit_code();
    }
    return exitCode_;
}

int64_t PluginClient::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

std::string PluginClient::address() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return address_;
}

Result<std::shared_ptr<rpc::Connection>> PluginClient::connected(const char* capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = state_.load();
    if (current == ClientState::Connected && connection_ && connection_->isOpen()) {
        return connection_;
    }
    std::string detail = std::string("state ") + clientStateName(current);
    auto code = exitCode_ ? exitCode_ : (process_ ? process_->exit_code() : std::nullopt);
    if (code) {
        detail += ", exit status " + std::to_string(*code);
    }
    return Error{ErrorCode::CommunicationFailed, std::string(capability) + ": plugin " +
                                                     config_.name + " is not connected (" +
                                                     detail + ")"};
}

Result<std::shared_ptr<components::IBuilder>> PluginClient::builder() {
    auto c = connected("Builder");
    if (!c) {
        return c.error();
    }
    return std::shared_ptr<components::IBuilder>(
        std::make_shared<rpc::BuilderProxy>(c.value(), rpc::kRootObjectId));
}

Result<std::shared_ptr<components::IProvisioner>> PluginClient::provisioner() {
    auto c = connected("Provisioner");
    if (!c) {
        return c.error();
    }
    return std::shared_ptr<components::IProvisioner>(
        std::make_shared<rpc::ProvisionerProxy>(c.value(), rpc::kRootObjectId));
}

Result<std::shared_ptr<components::IPostProcessor>> PluginClient::postProcessor() {
    auto c = connected("PostProcessor");
    if (!c) {
        return c.error();
    }
    return std::shared_ptr<components::IPostProcessor>(
        std::make_shared<rpc::PostProcessorProxy>(c.value(), rpc::kRootObjectId));
}

Result<std::shared_ptr<components::IHook>> PluginClient::hook() {
    auto c = connected("Hook");
    if (!c) {
        return c.error();
    }
    return std::shared_ptr<components::IHook>(
        std::make_shared<rpc::HookProxy>(c.value(), rpc::kRootObjectId));
}

Result<std::shared_ptr<components::ICommand>> PluginClient::command() {
    auto c = connected("Command");
    if (!c) {
        return c.error();
    }
    return std::shared_ptr<components::ICommand>(
        std::make_shared<rpc::CommandProxy>(c.value(), rpc::kRootObjectId));
}

} // namespace kiln::plugin
