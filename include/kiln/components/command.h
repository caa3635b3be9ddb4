#pragma once

#include <kiln/core/types.h>

#include <string>
#include <vector>

namespace kiln::components {

class IEnvironment;

/**
 * Top-level CLI command.
 *
 * run() returns the process exit code; an error means the command could not
 * run at all.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    virtual std::string help() const = 0;
    virtual std::string synopsis() const = 0;
    virtual Result<int> run(IEnvironment& env, const std::vector<std::string>& args) = 0;
};

} // namespace kiln::components
