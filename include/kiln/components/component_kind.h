#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace kiln {

// Capability kinds a component may implement.
enum class ComponentKind { Builder, Provisioner, PostProcessor, Hook, Command };

inline constexpr std::array<ComponentKind, 5> kAllComponentKinds = {
    ComponentKind::Builder, ComponentKind::Provisioner, ComponentKind::PostProcessor,
    ComponentKind::Hook, ComponentKind::Command};

// Name used in plugin executable names and configuration sections.
constexpr const char* componentKindName(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Builder: return "builder";
        case ComponentKind::Provisioner: return "provisioner";
        case ComponentKind::PostProcessor: return "post-processor";
        case ComponentKind::Hook: return "hook";
        case ComponentKind::Command: return "command";
    }
    return "unknown";
}

// Capability prefix of RPC method names ("Builder.Run").
constexpr const char* componentKindCapability(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Builder: return "Builder";
        case ComponentKind::Provisioner: return "Provisioner";
        case ComponentKind::PostProcessor: return "PostProcessor";
        case ComponentKind::Hook: return "Hook";
        case ComponentKind::Command: return "Command";
    }
    return "Unknown";
}

inline std::optional<ComponentKind> componentKindFromName(std::string_view name) {
    for (auto kind : kAllComponentKinds) {
        if (name == componentKindName(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

} // namespace kiln
