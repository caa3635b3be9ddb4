#pragma once

#include <kiln/components/builder.h>
#include <kiln/components/command.h>
#include <kiln/components/component_kind.h>
#include <kiln/components/hook.h>
#include <kiln/components/post_processor.h>
#include <kiln/components/provisioner.h>
#include <kiln/config/host_config.h>
#include <kiln/core/types.h>
#include <kiln/plugin/client_set.h>

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>

namespace kiln::registry {

// A loaded component of any capability kind.
using AnyComponent =
    std::variant<std::shared_ptr<components::IBuilder>, std::shared_ptr<components::IProvisioner>,
                 std::shared_ptr<components::IPostProcessor>, std::shared_ptr<components::IHook>,
                 std::shared_ptr<components::ICommand>>;

// In-process implementation; the factory returns a fresh instance per load.
struct BuiltinComponent {
    std::function<AnyComponent()> create;
};

// Out-of-process implementation served by a plugin executable.
struct PluginDescriptor {
    std::filesystem::path executable;
    std::vector<std::string> args;
};

using ComponentSource = std::variant<BuiltinComponent, PluginDescriptor>;

/**
 * @brief Resolves (kind, name) to an in-process component or a plugin proxy
 *
 * Resolution order: an explicit binding from the host configuration, then
 * built-ins and discovered plugins in the configured precedence. Discovery
 * looks for `kiln-<kind>-<name>` in the configured plugin directories, then
 * PATH, and the first executable found wins.
 *
 * Registration happens while the host is being composed; lookups afterwards
 * only read and are safe from concurrent builds.
 */
class Registry {
public:
    explicit Registry(config::HostConfig config = {});

    // InvalidArgument if a built-in of that kind and name already exists.
    Result<void> registerBuiltin(ComponentKind kind, const std::string& name,
                                 std::function<AnyComponent()> factory);

    template <typename T, typename Factory>
    Result<void> registerBuiltin(ComponentKind kind, const std::string& name, Factory factory) {
        return registerBuiltin(kind, name, [factory]() -> AnyComponent {
            return std::shared_ptr<T>(factory());
        });
    }

    void bindPlugin(ComponentKind kind, const std::string& name, PluginDescriptor descriptor);

    [[nodiscard]] Result<ComponentSource> resolve(ComponentKind kind,
                                                  const std::string& name) const;

    [[nodiscard]] std::optional<PluginDescriptor> discover(ComponentKind kind,
                                                           const std::string& name) const;

    // Built-in and explicitly bound names, sorted. Discoverable plugins are
    // not enumerated.
    [[nodiscard]] std::vector<std::string> names(ComponentKind kind) const;

    [[nodiscard]] bool isBuiltin(ComponentKind kind, const std::string& name) const;

    /**
     * @brief Instantiate a component
     *
     * A plugin-backed component is added to `clients` before its subprocess
     * is started, so cleanup sees it even if the handshake never finishes.
     * Unknown names fail with ComponentNotFound without spawning anything.
     */
    Result<AnyComponent> load(ComponentKind kind, const std::string& name,
                              plugin::ClientSet& clients) const;

    Result<std::shared_ptr<components::IBuilder>> loadBuilder(const std::string& name,
                                                              plugin::ClientSet& clients) const;
    Result<std::shared_ptr<components::IProvisioner>>
    loadProvisioner(const std::string& name, plugin::ClientSet& clients) const;
    Result<std::shared_ptr<components::IPostProcessor>>
    loadPostProcessor(const std::string& name, plugin::ClientSet& clients) const;
    Result<std::shared_ptr<components::IHook>> loadHook(const std::string& name,
                                                        plugin::ClientSet& clients) const;
    Result<std::shared_ptr<components::ICommand>> loadCommand(const std::string& name,
                                                              plugin::ClientSet& clients) const;

    const config::HostConfig& config() const noexcept { return config_; }

private:
    Result<AnyComponent> launch(ComponentKind kind, const std::string& name,
                                const PluginDescriptor& descriptor,
                                plugin::ClientSet& clients) const;

    config::HostConfig config_;
    mutable std::shared_mutex mutex_;
    std::map<ComponentKind, std::map<std::string, BuiltinComponent>> builtins_;
    std::map<ComponentKind, std::map<std::string, PluginDescriptor>> bindings_;
};

} // namespace kiln::registry
