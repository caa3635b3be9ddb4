#pragma once

#include <kiln/components/command.h>

#include <string>
#include <vector>

namespace kiln::builtin {

/**
 * `kiln build [--only a,b] [--except a,b] [--parallel=false] TEMPLATE`
 */
class BuildCommand : public components::ICommand {
public:
    std::string help() const override;
    std::string synopsis() const override;
    Result<int> run(components::IEnvironment& env, const std::vector<std::string>& args) override;
};

/**
 * `kiln validate [--syntax-only] [--only a,b] [--except a,b] TEMPLATE`
 */
class ValidateCommand : public components::ICommand {
public:
    std::string help() const override;
    std::string synopsis() const override;
    Result<int> run(components::IEnvironment& env, const std::vector<std::string>& args) override;
};

class VersionCommand : public components::ICommand {
public:
    std::string help() const override;
    std::string synopsis() const override;
    Result<int> run(components::IEnvironment& env, const std::vector<std::string>& args) override;
};

// "Kiln v0.1.0.dev (abc1234)"
std::string versionString();

} // namespace kiln::builtin
