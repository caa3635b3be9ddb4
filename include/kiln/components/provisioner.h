#pragma once

#include <kiln/config/config_bundle.h>
#include <kiln/core/types.h>
#include <kiln/ui/ui.h>

#include <vector>

namespace kiln::components {

class IProvisioner {
public:
    virtual ~IProvisioner() = default;

    virtual Result<void> prepare(const std::vector<ConfigBundle>& configs) = 0;
    virtual Result<void> provision(ui::IUi& ui) = 0;
    virtual void cancel() = 0;
};

} // namespace kiln::components
