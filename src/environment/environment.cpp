#include <kiln/app/error_hints.h>
#include <kiln/environment/environment.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace kiln {

namespace {

bool isHelpFlag(const std::string& arg) {
    return arg == "-h" || arg == "--help" || arg == "-help";
}

bool isVersionFlag(const std::string& arg) {
    return arg == "-v" || arg == "--version" || arg == "-version";
}

} // namespace

Environment::Environment(std::shared_ptr<registry::Registry> registry, std::shared_ptr<ui::IUi> ui,
                         std::shared_ptr<components::ICache> cache)
    : registry_(std::move(registry)), ui_(std::move(ui)), cache_(std::move(cache)) {}

Environment::~Environment() {
    cleanup();
}

void Environment::cleanup() {
    clients_.killAll();
}

CancellationToken Environment::cancellation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancellation_;
}

Result<std::shared_ptr<components::IBuilder>> Environment::builder(const std::string& name) {
    return registry_->loadBuilder(name, clients_);
}

Result<std::shared_ptr<components::IProvisioner>>
Environment::provisioner(const std::string& name) {
    return registry_->loadProvisioner(name, clients_);
}

Result<std::shared_ptr<components::IPostProcessor>>
Environment::postProcessor(const std::string& name) {
    return registry_->loadPostProcessor(name, clients_);
}

Result<std::shared_ptr<components::IHook>> Environment::hook(const std::string& name) {
    return registry_->loadHook(name, clients_);
}

Result<std::shared_ptr<components::ICommand>> Environment::command(const std::string& name) {
    return registry_->loadCommand(name, clients_);
}

std::string Environment::usage() const {
    std::string out = "Usage: kiln [--version] [--help] [--machine-readable] <command> [<args>]\n\n"
                      "Available commands are:\n";
    for (const auto& name : registry_->names(ComponentKind::Command)) {
        std::string synopsis = "(plugin)";
        if (registry_->isBuiltin(ComponentKind::Command, name)) {
            // Built-ins never start a subprocess, so a scratch set is enough.
            plugin::ClientSet scratch;
            if (auto cmd = registry_->loadCommand(name, scratch)) {
                synopsis = cmd.value()->synopsis();
            }
        }
        out += fmt::format("    {:<12} {}\n", name, synopsis);
    }
    return out;
}

void Environment::reportError(const Error& error) {
    ui_->error("Error: " + app::formatErrorWithHint(error));
}

int Environment::cli(const std::vector<std::string>& args, CancellationToken cancel) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancellation_ = cancel;
    }
    CancellationSubscription onCancel(cancel, [this] {
        spdlog::info("interrupt received, stopping all plugins");
        cleanup();
    });

    std::string name;
    std::vector<std::string> commandArgs;
    bool helpRequested = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (isHelpFlag(arg)) {
            helpRequested = true;
            continue;
        }
        if (isVersionFlag(arg)) {
            name = "version";
            break;
        }
        if (!arg.empty() && arg[0] == '-') {
            spdlog::debug("ignoring unknown global flag {}", arg);
            continue;
        }
        name = arg;
        commandArgs.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
        break;
    }

    if (name.empty()) {
        if (helpRequested) {
            ui_->say(usage());
            return 0;
        }
        ui_->error(usage());
        return 1;
    }
    if (helpRequested) {
        commandArgs.insert(commandArgs.begin(), "--help");
    }

    auto resolved = registry_->resolve(ComponentKind::Command, name);
    if (!resolved) {
        ui_->error("Error: unknown command '" + name + "'\n");
        ui_->error(usage());
        return 1;
    }

    spdlog::debug("running command '{}' with {} argument(s)", name, commandArgs.size());
    auto cmd = command(name);
    if (!cmd) {
        reportError(cmd.error());
        cleanup();
        return 1;
    }

    auto result = cmd.value()->run(*this, commandArgs);
    cleanup();
    if (!result) {
        reportError(result.error());
        return 1;
    }
    int code = result.value();
    if (code == 0 && cancel.isCancelled()) {
        code = 1;
    }
    spdlog::debug("command '{}' exited with {}", name, code);
    return code;
}

bool extractMachineReadable(std::vector<std::string>& args) {
    auto before = args.size();
    args.erase(std::remove_if(args.begin(), args.end(),
                              [](const std::string& arg) {
                                  return arg == "--machine-readable" || arg == "-machine-readable";
                              }),
               args.end());
    return args.size() != before;
}

} // namespace kiln
