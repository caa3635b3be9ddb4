#pragma once

#include <kiln/components/artifact.h>
#include <kiln/config/config_bundle.h>
#include <kiln/core/types.h>
#include <kiln/ui/ui.h>

#include <memory>
#include <vector>

namespace kiln::components {

struct PostProcessResult {
    std::shared_ptr<IArtifact> artifact;
    // Whether the input artifact should survive the post-processor.
    bool keep{false};
};

class IPostProcessor {
public:
    virtual ~IPostProcessor() = default;

    virtual Result<void> configure(const std::vector<ConfigBundle>& configs) = 0;
    virtual Result<PostProcessResult> postProcess(ui::IUi& ui,
                                                  std::shared_ptr<IArtifact> artifact) = 0;
};

} // namespace kiln::components
