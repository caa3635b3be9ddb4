#pragma once

#include <kiln/components/builder.h>
#include <kiln/components/command.h>
#include <kiln/components/hook.h>
#include <kiln/components/post_processor.h>
#include <kiln/components/provisioner.h>
#include <kiln/core/types.h>
#include <kiln/rpc/connection.h>
#include <kiln/rpc/transport.h>

#include <iosfwd>
#include <memory>
#include <string>

namespace kiln::plugin {

/**
 * @brief Plugin side of the handshake
 *
 * Used by plugin executables:
 * @code
 * int main() {
 *     return kiln::plugin::serveBuilder("kiln-builder-example", std::make_shared<MyBuilder>());
 * }
 * @endcode
 *
 * create() refuses to run without the magic cookie, routes logging to stderr
 * and opens the listener. serve() prints the handshake line, accepts the one
 * host connection and returns when the host disconnects.
 */
class Server {
public:
    static Result<std::unique_ptr<Server>> create(const std::string& name);

    const std::string& name() const noexcept { return name_; }
    std::string handshakeLine() const;

    // Writes the handshake line and flushes. Nothing else may precede it on
    // the stream.
    void announce(std::ostream& out);

    Result<std::shared_ptr<rpc::Connection>> accept();

    Result<void> serve(std::shared_ptr<rpc::IServedObject> root);

private:
    Server(std::string name, std::unique_ptr<rpc::Listener> listener);

    std::string name_;
    std::unique_ptr<rpc::Listener> listener_;
};

// Replaces the default logger with a stderr sink; level from KILN_LOG.
void configurePluginLogging(const std::string& name);

// Runs a complete plugin and returns the process exit code.
int serveObject(const std::string& name, std::shared_ptr<rpc::IServedObject> root);

int serveBuilder(const std::string& name, std::shared_ptr<components::IBuilder> builder);
int serveProvisioner(const std::string& name,
                     std::shared_ptr<components::IProvisioner> provisioner);
int servePostProcessor(const std::string& name,
                       std::shared_ptr<components::IPostProcessor> postProcessor);
int serveHook(const std::string& name, std::shared_ptr<components::IHook> hook);
int serveCommand(const std::string& name, std::shared_ptr<components::ICommand> command);

} // namespace kiln::plugin
