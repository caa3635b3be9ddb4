#pragma once

#include <kiln/components/builder.h>
#include <kiln/components/cache.h>
#include <kiln/components/hook.h>
#include <kiln/components/post_processor.h>
#include <kiln/components/provisioner.h>
#include <kiln/core/cancellation.h>
#include <kiln/ui/ui.h>

#include <memory>
#include <string>

namespace kiln::components {

/**
 * What a running command sees of the host: its UI, the artifact cache, and
 * loaders for the other component kinds.
 */
class IEnvironment {
public:
    virtual ~IEnvironment() = default;

    virtual std::shared_ptr<ui::IUi> ui() = 0;
    virtual ICache& cache() = 0;

    virtual Result<std::shared_ptr<IBuilder>> builder(const std::string& name) = 0;
    virtual Result<std::shared_ptr<IProvisioner>> provisioner(const std::string& name) = 0;
    virtual Result<std::shared_ptr<IPostProcessor>> postProcessor(const std::string& name) = 0;
    virtual Result<std::shared_ptr<IHook>> hook(const std::string& name) = 0;

    // Signalled when the operator aborts the run. Never cancelled by default.
    virtual CancellationToken cancellation() const { return {}; }
};

} // namespace kiln::components
