#pragma once

#include <kiln/core/types.h>
#include <kiln/registry/registry.h>

namespace kiln::builtin {

// Registers every in-process builder, provisioner, post-processor and command.
Result<void> registerBuiltins(registry::Registry& registry);

} // namespace kiln::builtin
