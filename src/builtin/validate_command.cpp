#include "command_support.h"

#include <kiln/build/build.h>
#include <kiln/builtin/commands.h>
#include <kiln/components/environment.h>

namespace kiln::builtin {

std::string ValidateCommand::help() const {
    return "Usage: kiln validate [options] TEMPLATE\n\n"
           "  Checks that a template is valid by parsing it and preparing every\n"
           "  component it names. Exits 0 when valid and 1 otherwise.\n\n"
           "Options:\n"
           "  --syntax-only     Only check the template structure\n"
           "  --only=a,b        Only validate the named builds\n"
           "  --except=a,b      Validate every build except the named ones";
}

std::string ValidateCommand::synopsis() const {
    return "Check that a template is valid";
}

Result<int> ValidateCommand::run(components::IEnvironment& env,
                                 const std::vector<std::string>& args) {
    auto ui = env.ui();

    build::BuildFilter filter;
    bool syntaxOnly = false;
    std::string templatePath;

    CLI::App app{synopsis(), "kiln validate"};
    app.add_flag("--syntax-only", syntaxOnly, "Only check the template structure");
    app.add_option("--only", filter.only, "Only validate the named builds")->delimiter(',');
    app.add_option("--except", filter.except, "Validate every build except the named ones")
        ->delimiter(',');
    app.add_option("template", templatePath, "Path to the build template")->required();
    if (auto code = detail::parseArgs(app, args, *ui)) {
        return *code;
    }

    auto tpl = build::loadTemplate(templatePath);
    if (!tpl) {
        ui->error("Failed to parse template: " + formatError(tpl.error()));
        return 1;
    }
    if (syntaxOnly) {
        ui->say("Syntax-only check passed. Everything looks okay.");
        return 0;
    }

    ErrorList problems;
    std::vector<std::string> warnings;
    auto created = build::createBuilds(tpl.value(), env, filter);
    if (!created) {
        problems.merge(created.error());
    } else {
        for (const auto& b : created.value()) {
            auto prepared = b->prepare();
            if (!prepared) {
                problems.merge(prepared.error());
                continue;
            }
            for (const auto& w : prepared.value()) {
                warnings.push_back(b->name() + ": " + w);
            }
        }
    }

    if (!problems.empty()) {
        ui->error("Template validation failed. Errors are shown below.\n");
        for (const auto& e : problems.errors()) {
            ui->error("* " + e.message);
        }
        return 1;
    }
    if (!warnings.empty()) {
        ui->say("Template validation succeeded, but there were some warnings.\n");
        for (const auto& w : warnings) {
            ui->message("* " + w);
        }
        return 0;
    }
    ui->say("Template validated successfully.");
    return 0;
}

} // namespace kiln::builtin
