#pragma once

#include <kiln/components/artifact.h>
#include <kiln/components/cache.h>
#include <kiln/components/hook.h>
#include <kiln/config/config_bundle.h>
#include <kiln/core/types.h>
#include <kiln/ui/ui.h>

#include <memory>
#include <string>
#include <vector>

namespace kiln::components {

/**
 * Creates a machine and produces an artifact from it.
 *
 * prepare() receives the raw configuration bundles in override order and
 * returns warnings; run() may return a null artifact when nothing was built.
 */
class IBuilder {
public:
    virtual ~IBuilder() = default;

    virtual Result<std::vector<std::string>> prepare(const std::vector<ConfigBundle>& configs) = 0;
    virtual Result<std::shared_ptr<IArtifact>> run(ui::IUi& ui, IHook& hook, ICache& cache) = 0;
    virtual void cancel() = 0;
};

} // namespace kiln::components
