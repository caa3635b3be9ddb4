#pragma once

#include <kiln/core/types.h>
#include <kiln/ui/ui.h>

#include <nlohmann/json.hpp>

#include <string>

namespace kiln::components {

// Name of the hook a builder runs once its machine is ready for provisioning.
inline constexpr const char* kHookProvision = "kiln_provision";

/**
 * Callback a builder invokes at well-known points of its run.
 */
class IHook {
public:
    virtual ~IHook() = default;

    virtual Result<void> run(const std::string& name, ui::IUi& ui, const nlohmann::json& data) = 0;

    // Stops a running hook. Safe to call when nothing runs.
    virtual void cancel() {}
};

} // namespace kiln::components
