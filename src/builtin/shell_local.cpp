#include <kiln/builtin/components.h>
#include <kiln/config/config_bundle.h>
#include <kiln/plugin/plugin_process.hpp>

#include <spdlog/spdlog.h>

#include <condition_variable>

namespace kiln::builtin {

using namespace std::chrono_literals;

namespace {

constexpr const char* kShell = "/bin/sh";

// Both output pipes reach EOF once the command and its children are done.
struct OutputDrain {
    std::mutex mutex;
    std::condition_variable cv;
    int open{2};

    void closed() {
        std::lock_guard<std::mutex> lock(mutex);
        --open;
        cv.notify_all();
    }
};

} // namespace

Result<void> ShellLocalProvisioner::prepare(const std::vector<ConfigBundle>& configs) {
    const auto merged = config::mergeBundles(configs);
    config::ConfigDecoder decoder(merged);
    auto command = decoder.optionalString("command");
    auto lines = decoder.optionalStringList("inline");
    env_ = decoder.optionalStringList("environment_vars");
    decoder.rejectUnknownKeys({"command", "inline", "environment_vars"});

    if (decoder.has("command") == decoder.has("inline")) {
        decoder.fail("exactly one of 'command' or 'inline' must be specified");
    }
    for (const auto& kv : env_) {
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            decoder.fail("environment variable '" + kv + "' must be in KEY=VALUE form");
        }
    }
    if (auto r = decoder.finish(); !r) {
        return r;
    }

    script_ = command;
    for (const auto& line : lines) {
        script_ += line + "\n";
    }
    return Result<void>();
}

Result<void> ShellLocalProvisioner::provision(ui::IUi& ui) {
    if (cancelled_) {
        return Error{ErrorCode::OperationCancelled, "provisioning cancelled"};
    }
    ui.say("Running local shell script");

    auto drain = std::make_shared<OutputDrain>();
    plugin::PluginProcessConfig pc{.executable = kShell, .args = {"-c", script_}};
    for (const auto& kv : env_) {
        auto eq = kv.find('=');
        pc.with_env(kv.substr(0, eq), kv.substr(eq + 1));
    }
    pc.on_stdout([&ui](std::string_view line) { ui.message(std::string(line)); })
        .on_stderr([&ui](std::string_view line) { ui.error(std::string(line)); });
    pc.stdout_closed = [drain] { drain->closed(); };
    pc.stderr_closed = [drain] { drain->closed(); };

    auto spawned = plugin::PluginProcess::spawn(std::move(pc));
    if (!spawned) {
        return Error{ErrorCode::BuildFailed,
                     "failed to start local shell: " + spawned.error().message};
    }
    auto process = std::move(spawned).value();

    while (!process->wait_for_exit(100ms)) {
        if (cancelled_) {
            process->terminate(2s);
            break;
        }
    }
    {
        std::unique_lock<std::mutex> lock(drain->mutex);
        drain->cv.wait_for(lock, 2s, [&] { return drain->open == 0; });
    }

    if (cancelled_) {
        return Error{ErrorCode::OperationCancelled, "provisioning cancelled"};
    }
    auto code = process->exit_code();
    if (!code || *code != 0) {
        return Error{ErrorCode::BuildFailed,
                     "local shell script exited with status " +
                         (code ? std::to_string(*code) : std::string("unknown"))};
    }
    return Result<void>();
}

void ShellLocalProvisioner::cancel() {
    spdlog::debug("shell-local provisioner cancelled");
    cancelled_ = true;
}

} // namespace kiln::builtin
