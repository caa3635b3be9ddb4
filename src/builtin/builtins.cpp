#include <kiln/builtin/builtins.h>
#include <kiln/builtin/commands.h>
#include <kiln/builtin/components.h>

namespace kiln::builtin {

Result<void> registerBuiltins(registry::Registry& registry) {
    ErrorList errors;
    auto check = [&errors](Result<void> r) {
        if (!r) {
            errors.add(r.error());
        }
    };

    check(registry.registerBuiltin<components::IBuilder>(
        ComponentKind::Builder, "null", [] { return std::make_shared<NullBuilder>(); }));
    check(registry.registerBuiltin<components::IBuilder>(
        ComponentKind::Builder, "file", [] { return std::make_shared<FileBuilder>(); }));
    check(registry.registerBuiltin<components::IProvisioner>(
        ComponentKind::Provisioner, "shell-local",
        [] { return std::make_shared<ShellLocalProvisioner>(); }));
    check(registry.registerBuiltin<components::IPostProcessor>(
        ComponentKind::PostProcessor, "manifest",
        [] { return std::make_shared<ManifestPostProcessor>(); }));

    check(registry.registerBuiltin<components::ICommand>(
        ComponentKind::Command, "build", [] { return std::make_shared<BuildCommand>(); }));
    check(registry.registerBuiltin<components::ICommand>(
        ComponentKind::Command, "validate", [] { return std::make_shared<ValidateCommand>(); }));
    check(registry.registerBuiltin<components::ICommand>(
        ComponentKind::Command, "version", [] { return std::make_shared<VersionCommand>(); }));

    return errors.toResult(ErrorCode::InternalError);
}

} // namespace kiln::builtin
