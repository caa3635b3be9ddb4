#include <kiln/core/logging.h>
#include <kiln/plugin/handshake.h>
#include <kiln/plugin/server.h>
#include <kiln/rpc/servers.h>

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace kiln::plugin {

namespace {

uint16_t portFromEnv(const char* key, uint16_t fallback) {
    const char* value = std::getenv(key);
    if (!value || !*value) {
        return fallback;
    }
    uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(value, value + std::strlen(value), port);
    if (ec != std::errc{} || *ptr != '\0') {
        spdlog::warn("ignoring invalid {}='{}'", key, value);
        return fallback;
    }
    return port;
}

} // namespace

void configurePluginLogging(const std::string& name) {
    // stdout carries the handshake; every log line goes to stderr.
    auto logger = spdlog::stderr_logger_mt(name);
    logger->set_pattern("[%l] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(logLevelFromEnv(spdlog::level::info));
}

Server::Server(std::string name, std::unique_ptr<rpc::Listener> listener)
    : name_(std::move(name)), listener_(std::move(listener)) {}

Result<std::unique_ptr<Server>> Server::create(const std::string& name) {
    const char* cookie = std::getenv(kMagicCookieKey);
    if (!cookie || std::strcmp(cookie, kMagicCookieValue) != 0) {
        return Error{ErrorCode::InvalidState,
                     "this is a kiln plugin and is not meant to be executed directly; "
                     "it is launched by kiln"};
    }

    configurePluginLogging(name);

    rpc::ListenOptions options;
    if (const char* network = std::getenv(kEnvNetwork); network && *network) {
        options.network = network;
    }
    options.minPort = portFromEnv(kEnvMinPort, options.minPort);
    options.maxPort = portFromEnv(kEnvMaxPort, options.maxPort);

    auto listener = rpc::Listener::open(options);
    if (!listener) {
        return listener.error();
    }
    spdlog::debug("plugin {} listening on {} {}", name, listener.value()->network(),
                  listener.value()->address());
    return std::unique_ptr<Server>(new Server(name, std::move(listener).value()));
}

std::string Server::handshakeLine() const {
    return formatHandshake({kProtocolVersion, listener_->network(), listener_->address()});
}

void Server::announce(std::ostream& out) {
    out << handshakeLine() << '\n';
    out.flush();
}

Result<std::shared_ptr<rpc::Connection>> Server::accept() {
    auto transport = listener_->accept();
    if (!transport) {
        return transport.error();
    }
    // Only one host connection is ever served.
    listener_->close();
    return rpc::Connection::create(std::move(transport).value(), "host");
}

Result<void> Server::serve(std::shared_ptr<rpc::IServedObject> root) {
    announce(std::cout);
    auto connection = accept();
    if (!connection) {
        return connection.error();
    }
    auto conn = connection.value();
    conn->registerRoot(std::move(root));
    conn->start();
    conn->waitClosed();
    spdlog::debug("host disconnected, plugin {} exiting", name_);
    conn->close();
    return Result<void>();
}

int serveObject(const std::string& name, std::shared_ptr<rpc::IServedObject> root) {
    auto server = Server::create(name);
    if (!server) {
        std::cerr << server.error().message << std::endl;
        return 1;
    }
    if (auto r = server.value()->serve(std::move(root)); !r) {
        spdlog::error("plugin {} failed: {}", name, r.error().message);
        return 1;
    }
    return 0;
}

int serveBuilder(const std::string& name, std::shared_ptr<components::IBuilder> builder) {
    return serveObject(name, std::make_shared<rpc::BuilderServer>(std::move(builder)));
}

int serveProvisioner(const std::string& name,
                     std::shared_ptr<components::IProvisioner> provisioner) {
    return serveObject(name, std::make_shared<rpc::ProvisionerServer>(std::move(provisioner)));
}

int servePostProcessor(const std::string& name,
                       std::shared_ptr<components::IPostProcessor> postProcessor) {
    return serveObject(name, std::make_shared<rpc::PostProcessorServer>(std::move(postProcessor)));
}

int serveHook(const std::string& name, std::shared_ptr<components::IHook> hook) {
    return serveObject(name, std::make_shared<rpc::HookServer>(std::move(hook)));
}

int serveCommand(const std::string& name, std::shared_ptr<components::ICommand> command) {
    return serveObject(name, std::make_shared<rpc::CommandServer>(std::move(command)));
}

} // namespace kiln::plugin
