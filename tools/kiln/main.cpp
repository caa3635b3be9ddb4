#include <kiln/builtin/builtins.h>
#include <kiln/builtin/commands.h>
#include <kiln/cache/file_cache.h>
#include <kiln/config/host_config.h>
#include <kiln/core/cancellation.h>
#include <kiln/core/logging.h>
#include <kiln/environment/environment.h>
#include <kiln/registry/registry.h>
#include <kiln/ui/machine_readable.h>
#include <kiln/ui/ui.h>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>
#include <sys/utsname.h>

namespace {

std::string targetPlatform() {
    struct utsname info {};
    if (::uname(&info) != 0) {
        return "unknown";
    }
    return std::string(info.sysname) + " " + info.machine;
}

/**
 * Waits for SIGINT/SIGTERM on its own thread. The first signal cancels the
 * run; later ones are ignored while cleanup finishes.
 */
class SignalWatcher {
public:
    explicit SignalWatcher(kiln::CancellationSource& source) : source_(source) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        thread_ = std::thread([this] { loop(); });
    }

    ~SignalWatcher() {
        done_.store(true);
        ::pthread_kill(thread_.native_handle(), SIGTERM);
        thread_.join();
    }

    // Must run before any other thread starts so every thread inherits the mask.
    static void blockSignals() {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        ::pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    }

private:
    void loop() {
        while (true) {
            int sig = 0;
            if (::sigwait(&signals_, &sig) != 0) {
                continue;
            }
            if (done_.load()) {
                return;
            }
            if (source_.cancel()) {
                std::cerr << "Cancelling build after receiving signal " << sig << std::endl;
                spdlog::warn("received signal {}, cancelling the run", sig);
            } else {
                spdlog::debug("ignoring signal {} while cleanup is running", sig);
            }
        }
    }

    kiln::CancellationSource& source_;
    sigset_t signals_{};
    std::atomic<bool> done_{false};
    std::thread thread_;
};

int run(std::vector<std::string> args) {
    // Taken out before parsing: CLI11 stops at the command name, and a command's
    // own parser does not know the flag.
    bool machineReadable = kiln::extractMachineReadable(args);
    bool verbose = false;

    CLI::App app{"kiln builds machine images from templates", "kiln"};
    app.prefix_command();
    app.allow_extras();
    // -h and --version are handled by the dispatcher so they list commands.
    app.set_help_flag();
    app.add_flag("--verbose", verbose, "Log at debug level to stderr");

    std::vector<std::string> reversed(args.rbegin(), args.rend());
    try {
        app.parse(reversed);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }
    auto remaining = app.remaining();

    if (auto r = kiln::configureHostLogging(verbose); !r) {
        std::cerr << r.error().message << std::endl;
        return 1;
    }
    spdlog::info("Kiln version: {}", kiln::builtin::versionString());
    spdlog::info("Kiln target platform: {}", targetPlatform());

    auto config = kiln::config::loadHostConfig();
    if (!config) {
        std::cerr << "Error loading configuration: \n\n" << kiln::formatError(config.error())
                  << std::endl;
        return 1;
    }
    spdlog::info("Kiln config: source={} plugin_dirs={} network={} precedence={}",
                 config.value().source.empty() ? "<defaults>" : config.value().source.string(),
                 config.value().plugins.directories.size(), config.value().plugins.network,
                 kiln::config::precedenceName(config.value().precedence));

    auto cacheDir = kiln::cache::FileCache::resolveDirectory();
    if (!cacheDir) {
        std::cerr << "Error preparing cache directory: \n\n" << cacheDir.error().message
                  << std::endl;
        return 1;
    }
    spdlog::info("Setting cache directory: {}", cacheDir.value().string());

    auto registry = std::make_shared<kiln::registry::Registry>(std::move(config).value());
    if (auto r = kiln::builtin::registerBuiltins(*registry); !r) {
        std::cerr << "Kiln initialization error: \n\n" << kiln::formatError(r.error())
                  << std::endl;
        return 1;
    }

    std::shared_ptr<kiln::ui::IUi> ui;
    if (machineReadable) {
        ui = std::make_shared<kiln::ui::MachineReadableUi>(
            std::make_shared<kiln::ui::LineWriter>(std::cout));
    } else {
        ui = std::make_shared<kiln::ui::BasicUi>(std::cin, std::cout, std::cerr);
    }

    kiln::Environment env(registry,
                          ui, std::make_shared<kiln::cache::FileCache>(cacheDir.value()));
    kiln::CancellationSource cancel;
    SignalWatcher watcher(cancel);

    int code = env.cli(remaining, cancel.token());
    env.cleanup();
    return code;
}

} // namespace

int main(int argc, char* argv[]) {
    SignalWatcher::blockSignals();
    try {
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");
        return run(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& e) {
        std::cerr << "Error executing CLI: " << e.what() << std::endl;
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
