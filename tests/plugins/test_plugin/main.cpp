// Plugin executable used by the integration tests. KILN_TEST_PLUGIN_MODE or a
// leading --mode=X argument selects what it serves or how it misbehaves.

#include <kiln/components/environment.h>
#include <kiln/config/config_bundle.h>
#include <kiln/plugin/server.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

namespace {

using namespace kiln;
using namespace std::chrono_literals;

constexpr const char* kModeEnv = "KILN_TEST_PLUGIN_MODE";

class TestBuilder : public components::IBuilder {
public:
    Result<std::vector<std::string>> prepare(const std::vector<ConfigBundle>& configs) override {
        auto merged = config::mergeBundles(configs);
        config::ConfigDecoder decoder(merged, "test builder");
        message_ = decoder.optionalString("message", "hello from plugin");
        cacheKey_ = decoder.optionalString("cache_key");
        fail_ = decoder.optionalBool("fail", false);
        crash_ = decoder.optionalBool("crash", false);
        if (decoder.optionalBool("invalid", false)) {
            decoder.fail("first invalid setting");
            decoder.fail("second invalid setting");
        }
        if (auto r = decoder.finish(); !r) {
            return r.error();
        }
        return std::vector<std::string>{"test builder warning"};
    }

    Result<std::shared_ptr<components::IArtifact>>
    run(ui::IUi& ui, components::IHook& hook, components::ICache& cache) override {
        ui.say(message_);
        if (crash_) {
            std::_Exit(3);
        }
        if (fail_) {
            return Error{ErrorCode::BuildFailed, "requested failure"};
        }
        if (!cacheKey_.empty()) {
            auto lease = cache.acquire(cacheKey_);
            if (!lease) {
                return lease.error();
            }
            ui.message("cache path: " + lease.value()->path().string());
            lease.value()->release();
        }
        if (auto r = hook.run(components::kHookProvision, ui, nlohmann::json{{"from", "plugin"}});
            !r) {
            return r.error();
        }
        return std::shared_ptr<components::IArtifact>(std::make_shared<components::BasicArtifact>(
            "kiln.test", "test-artifact", std::vector<std::string>{}, "Test artifact"));
    }

    void cancel() override { spdlog::info("test builder cancelled"); }

private:
    std::string message_;
    std::string cacheKey_;
    bool fail_{false};
    bool crash_{false};
};

class TestProvisioner : public components::IProvisioner {
public:
    Result<void> prepare(const std::vector<ConfigBundle>&) override { return Result<void>(); }
    Result<void> provision(ui::IUi& ui) override {
        ui.say("provisioned by plugin");
        return Result<void>();
    }
    void cancel() override {}
};

class TestPostProcessor : public components::IPostProcessor {
public:
    Result<void> configure(const std::vector<ConfigBundle>&) override { return Result<void>(); }
    Result<components::PostProcessResult>
    postProcess(ui::IUi& ui, std::shared_ptr<components::IArtifact> artifact) override {
        ui.say("processing " + artifact->id());
        auto processed = std::make_shared<components::BasicArtifact>(
            "kiln.test-post-processor", artifact->id() + "-processed", artifact->files(),
            "Processed " + artifact->string());
        return components::PostProcessResult{processed, false};
    }
};

class TestHook : public components::IHook {
public:
    Result<void> run(const std::string& name, ui::IUi& ui, const nlohmann::json& data) override {
        ui.say("hook " + name + " ran with " + data.dump());
        return Result<void>();
    }
};

class TestCommand : public components::ICommand {
public:
    std::string help() const override { return "Usage: kiln test [args]"; }
    std::string synopsis() const override { return "Test command served by a plugin"; }

    Result<int> run(components::IEnvironment& env, const std::vector<std::string>& args) override {
        std::string joined;
        for (const auto& a : args) {
            joined += (joined.empty() ? "" : " ") + a;
        }
        env.ui()->say("command args: " + joined);
        if (args.size() == 2 && args[0] == "load-builder") {
            auto builder = env.builder(args[1]);
            if (!builder) {
                return builder.error();
            }
            env.ui()->say("loaded builder " + args[1]);
            return 0;
        }
        if (!args.empty() && args[0] == "fail") {
            return Error{ErrorCode::BuildFailed, "command failed on request"};
        }
        if (!args.empty() && args[0].rfind("exit=", 0) == 0) {
            return std::stoi(args[0].substr(5));
        }
        return 0;
    }
};

[[noreturn]] void sleepForever() {
    while (true) {
        std::this_thread::sleep_for(1h);
    }
}

int exitAfterHandshake() {
    auto server = plugin::Server::create("test-plugin");
    if (!server) {
        std::cerr << server.error().message << std::endl;
        return 1;
    }
    server.value()->announce(std::cout);
    [[maybe_unused]] auto connection = server.value()->accept();
    std::_Exit(1);
}

} // namespace

int main(int argc, char** argv) {
    // --mode=X on the command line wins over the environment.
    const char* raw = std::getenv(kModeEnv);
    std::string mode = raw ? raw : "builder";
    if (argc > 1 && std::string_view(argv[1]).rfind("--mode=", 0) == 0) {
        mode = std::string(argv[1] + 7);
    }

    if (mode == "builder")
        return plugin::serveBuilder("test-builder", std::make_shared<TestBuilder>());
    if (mode == "provisioner")
        return plugin::serveProvisioner("test-provisioner", std::make_shared<TestProvisioner>());
    if (mode == "post-processor")
        return plugin::servePostProcessor("test-post-processor",
                                          std::make_shared<TestPostProcessor>());
    if (mode == "hook")
        return plugin::serveHook("test-hook", std::make_shared<TestHook>());
    if (mode == "command")
        return plugin::serveCommand("test-command", std::make_shared<TestCommand>());
    if (mode == "exit-after-handshake")
        return exitAfterHandshake();
    if (mode == "silent")
        sleepForever();
    if (mode == "malformed-handshake") {
        std::cout << "this is not a handshake" << std::endl;
        sleepForever();
    }
    if (mode == "version-mismatch") {
        std::cout << "99|unix|/tmp/kiln-nonexistent.sock" << std::endl;
        sleepForever();
    }
    std::cerr << "unknown " << kModeEnv << ": " << mode << std::endl;
    return 2;
}
