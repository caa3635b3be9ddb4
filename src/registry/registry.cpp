#include <kiln/plugin/handshake.h>
#include <kiln/registry/registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <sstream>

#include <unistd.h>

namespace kiln::registry {

namespace fs = std::filesystem;

namespace {

bool isExecutableFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::vector<fs::path> pathEntries() {
    std::vector<fs::path> out;
    const char* path = std::getenv("PATH");
    if (!path) {
        return out;
    }
    std::stringstream ss(path);
    std::string entry;
    while (std::getline(ss, entry, ':')) {
        // An empty entry means the current directory.
        out.emplace_back(entry.empty() ? "." : entry);
    }
    return out;
}

template <typename T>
Result<std::shared_ptr<T>> as(Result<AnyComponent> loaded, ComponentKind kind,
                              const std::string& name) {
    if (!loaded) {
        return loaded.error();
    }
    auto* component = std::get_if<std::shared_ptr<T>>(&loaded.value());
    if (!component || !*component) {
        return Error{ErrorCode::InternalError, std::string(componentKindName(kind)) + " '" + name +
                                                   "' did not produce a " +
                                                   componentKindName(kind)};
    }
    return *component;
}

} // namespace

Registry::Registry(config::HostConfig config) : config_(std::move(config)) {
    for (const auto& [kind, entries] : config_.bindings) {
        for (const auto& [name, executable] : entries) {
            bindings_[kind][name] = PluginDescriptor{executable, {}};
        }
    }
}

Result<void> Registry::registerBuiltin(ComponentKind kind, const std::string& name,
                                       std::function<AnyComponent()> factory) {
    std::unique_lock lock(mutex_);
    auto& table = builtins_[kind];
    if (table.count(name) != 0) {
        return Error{ErrorCode::InvalidArgument, std::string("built-in ") +
                                                     componentKindName(kind) + " '" + name +
                                                     "' is already registered"};
    }
    table.emplace(name, BuiltinComponent{std::move(factory)});
    return Result<void>();
}

void Registry::bindPlugin(ComponentKind kind, const std::string& name,
                          PluginDescriptor descriptor) {
    std::unique_lock lock(mutex_);
    bindings_[kind][name] = std::move(descriptor);
}

std::optional<PluginDescriptor> Registry::discover(ComponentKind kind,
                                                   const std::string& name) const {
    const auto executable = plugin::pluginExecutableName(kind, name);
    for (const auto& dir : config_.plugins.directories) {
        auto candidate = dir / executable;
        if (isExecutableFile(candidate)) {
            return PluginDescriptor{fs::absolute(candidate), {}};
        }
    }
    for (const auto& dir : pathEntries()) {
        auto candidate = dir / executable;
        if (isExecutableFile(candidate)) {
            return PluginDescriptor{fs::absolute(candidate), {}};
        }
    }
    return std::nullopt;
}

Result<ComponentSource> Registry::resolve(ComponentKind kind, const std::string& name) const {
    std::optional<BuiltinComponent> builtin;
    {
        std::shared_lock lock(mutex_);
        if (auto it = bindings_.find(kind); it != bindings_.end()) {
            if (auto entry = it->second.find(name); entry != it->second.end()) {
                return ComponentSource{entry->second};
            }
        }
        if (auto it = builtins_.find(kind); it != builtins_.end()) {
            if (auto entry = it->second.find(name); entry != it->second.end()) {
                builtin = entry->second;
            }
        }
    }

    if (builtin && config_.precedence == config::Precedence::BuiltinFirst) {
        return ComponentSource{*builtin};
    }
    if (auto found = discover(kind, name)) {
        if (builtin) {
            spdlog::debug("{} '{}' resolved to plugin {} over the built-in", componentKindName(kind),
                          name, found->executable.string());
        }
        return ComponentSource{*found};
    }
    if (builtin) {
        return ComponentSource{*builtin};
    }
    return Error{ErrorCode::ComponentNotFound,
                 std::string("unknown ") + componentKindName(kind) + " '" + name +
                     "': no built-in and no " + plugin::pluginExecutableName(kind, name) +
                     " on the plugin search path"};
}

std::vector<std::string> Registry::names(ComponentKind kind) const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    if (auto it = builtins_.find(kind); it != builtins_.end()) {
        for (const auto& [name, _] : it->second) {
            out.push_back(name);
        }
    }
    if (auto it = bindings_.find(kind); it != bindings_.end()) {
        for (const auto& [name, _] : it->second) {
            if (std::find(out.begin(), out.end(), name) == out.end()) {
                out.push_back(name);
            }
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool Registry::isBuiltin(ComponentKind kind, const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = builtins_.find(kind);
    return it != builtins_.end() && it->second.count(name) != 0;
}

Result<AnyComponent> Registry::load(ComponentKind kind, const std::string& name,
                                    plugin::ClientSet& clients) const {
    auto source = resolve(kind, name);
    if (!source) {
        return source.error();
    }
    if (auto* builtin = std::get_if<BuiltinComponent>(&source.value())) {
        spdlog::debug("loading built-in {} '{}'", componentKindName(kind), name);
        return builtin->create();
    }
    return launch(kind, name, std::get<PluginDescriptor>(source.value()), clients);
}

Result<AnyComponent> Registry::launch(ComponentKind kind, const std::string& name,
                                      const PluginDescriptor& descriptor,
                                      plugin::ClientSet& clients) const {
    plugin::PluginClientConfig pc;
    pc.name = plugin::pluginExecutableName(kind, name);
    pc.executable = descriptor.executable;
    pc.args = descriptor.args;
    pc.network = config_.plugins.network;
    pc.minPort = config_.plugins.minPort;
    pc.maxPort = config_.plugins.maxPort;
    pc.startTimeout = config_.plugins.startTimeout;
    pc.killGrace = config_.plugins.killGrace;

    auto client = std::make_shared<plugin::PluginClient>(std::move(pc));
    if (auto added = clients.add(client); !added) {
        return added.error();
    }
    if (auto started = client->start(); !started) {
        return started.error();
    }

    switch (kind) {
        case ComponentKind::Builder: {
            auto proxy = client->builder();
            if (!proxy)
                return proxy.error();
            return AnyComponent{proxy.value()};
        }
        case ComponentKind::Provisioner: {
            auto proxy = client->provisioner();
            if (!proxy)
                return proxy.error();
            return AnyComponent{proxy.value()};
        }
        case ComponentKind::PostProcessor: {
            auto proxy = client->postProcessor();
            if (!proxy)
                return proxy.error();
            return AnyComponent{proxy.value()};
        }
        case ComponentKind::Hook: {
            auto proxy = client->hook();
            if (!proxy)
                return proxy.error();
            return AnyComponent{proxy.value()};
        }
        case ComponentKind::Command: {
            auto proxy = client->command();
            if (!proxy)
                return proxy.error();
            return AnyComponent{proxy.value()};
        }
    }
    return Error{ErrorCode::InternalError, "unhandled component kind"};
}

Result<std::shared_ptr<components::IBuilder>>
Registry::loadBuilder(const std::string& name, plugin::ClientSet& clients) const {
    return as<components::IBuilder>(load(ComponentKind::Builder, name, clients),
                                    ComponentKind::Builder, name);
}

Result<std::shared_ptr<components::IProvisioner>>
Registry::loadProvisioner(const std::string& name, plugin::ClientSet& clients) const {
    return as<components::IProvisioner>(load(ComponentKind::Provisioner, name, clients),
                                        ComponentKind::Provisioner, name);
}

Result<std::shared_ptr<components::IPostProcessor>>
Registry::loadPostProcessor(const std::string& name, plugin::ClientSet& clients) const {
    return as<components::IPostProcessor>(load(ComponentKind::PostProcessor, name, clients),
                                          ComponentKind::PostProcessor, name);
}

Result<std::shared_ptr<components::IHook>> Registry::loadHook(const std::string& name,
                                                              plugin::ClientSet& clients) const {
    return as<components::IHook>(load(ComponentKind::Hook, name, clients), ComponentKind::Hook,
                                 name);
}

Result<std::shared_ptr<components::ICommand>>
Registry::loadCommand(const std::string& name, plugin::ClientSet& clients) const {
    return as<components::ICommand>(load(ComponentKind::Command, name, clients),
                                     ComponentKind::Command, name);
}

} // namespace kiln::registry
