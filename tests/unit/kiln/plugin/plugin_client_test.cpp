#include <gtest/gtest.h>
#include <kiln/cache/file_cache.h>
#include <kiln/plugin/client_set.h>
#include <kiln/plugin/plugin_client.h>

#include "support/recording_ui.hpp"
#include "support/temp_dir_scope.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <thread>
#include <vector>

#include <sys/types.h>

using namespace kiln;
using namespace kiln::plugin;
using namespace std::chrono_literals;
using kiln::test_support::RecordingUi;
using kiln::test_support::TempDirScope;

namespace {

PluginClientConfig testPlugin(const std::string& mode) {
    PluginClientConfig config;
    config.name = "test-" + mode;
    config.executable = KILN_TEST_PLUGIN_PATH;
    config.args = {"--mode=" + mode};
    config.startTimeout = 10s;
    config.killGrace = 500ms;
    return config;
}

bool processGone(int64_t pid) {
    return pid > 0 && ::kill(static_cast<pid_t>(pid), 0) == -1 && errno == ESRCH;
}

class NoopHook : public components::IHook {
public:
    Result<void> run(const std::string& name, ui::IUi&, const nlohmann::json& data) override {
        runs.push_back(name + " " + data.dump());
        return Result<void>();
    }
    std::vector<std::string> runs;
};

} // namespace

TEST(PluginClient, StartsAndServesBuilder) {
    PluginClient client(testPlugin("builder"));
    ASSERT_TRUE(client.start());
    EXPECT_EQ(client.state(), ClientState::Connected);
    EXPECT_GT(client.pid(), 0);
    EXPECT_FALSE(client.address().empty());
    EXPECT_TRUE(client.start()) << "start is idempotent once connected";

    auto builder = client.builder();
    ASSERT_TRUE(builder);
    auto warnings = builder.value()->prepare({ConfigBundle{{"message", "hi"}}});
    ASSERT_TRUE(warnings) << warnings.error().message;
    EXPECT_EQ(warnings.value(), (std::vector<std::string>{"test builder warning"}));

    auto pid = client.pid();
    client.kill();
    EXPECT_EQ(client.state(), ClientState::Exited);
    EXPECT_TRUE(processGone(pid));
}

TEST(PluginClient, RunRelaysUiHookAndCacheCallbacks) {
    auto dir = TempDirScope::unique_under("kiln_client_test");
    cache::FileCache fc(dir.path());
    RecordingUi ui;
    NoopHook hook;

    PluginClient client(testPlugin("builder"));
    ASSERT_TRUE(client.start());
    auto builder = client.builder().value();
    ASSERT_TRUE(builder->prepare({ConfigBundle{{"cache_key", "base.iso"}}}));

    auto artifact = builder->run(ui, hook, fc);
    ASSERT_TRUE(artifact) << artifact.error().message;
    EXPECT_EQ(artifact.value()->id(), "test-artifact");
    EXPECT_EQ(artifact.value()->builderId(), "kiln.test");
    EXPECT_TRUE(ui.contains("say: hello from plugin"));
    EXPECT_TRUE(ui.contains("message: cache path: " + fc.pathFor("base.iso").value().string()));
    ASSERT_EQ(hook.runs.size(), 1u);
    EXPECT_EQ(hook.runs[0], std::string(components::kHookProvision) + " {\"from\":\"plugin\"}");
    client.close();
    EXPECT_TRUE(client.exited());
}

TEST(PluginClient, ConfigErrorsCrossTheWireAggregated) {
    PluginClient client(testPlugin("builder"));
    ASSERT_TRUE(client.start());
    auto r = client.builder().value()->prepare({ConfigBundle{{"invalid", true}}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConfigError);
    EXPECT_EQ(r.error().causes.size(), 2u);
}

TEST(PluginClient, HandshakeTimeoutLeavesNoProcess) {
    auto config = testPlugin("silent");
    config.startTimeout = 300ms;
    PluginClient client(config);

    auto started = std::chrono::steady_clock::now();
    auto r = client.start();
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PluginTimeout);
    EXPECT_LT(elapsed, 5s);
    EXPECT_EQ(client.state(), ClientState::Exited);
    EXPECT_TRUE(processGone(client.pid()));
}

TEST(PluginClient, MalformedHandshakeIsProtocolError) {
    for (const char* mode : {"malformed-handshake", "version-mismatch"}) {
        PluginClient client(testPlugin(mode));
        auto r = client.start();
        ASSERT_FALSE(r) << mode;
        EXPECT_EQ(r.error().code, ErrorCode::PluginProtocol) << mode;
        EXPECT_TRUE(client.exited()) << mode;
        EXPECT_TRUE(processGone(client.pid())) << mode;
    }
}

TEST(PluginClient, MissingExecutableIsPluginNotFound) {
    PluginClientConfig config;
    config.executable = "/nonexistent/kiln-builder-missing";
    PluginClient client(config);
    auto r = client.start();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PluginNotFound);
    EXPECT_EQ(client.name(), "kiln-builder-missing");
}

TEST(PluginClient, PluginExitAfterHandshakeFailsCalls) {
    PluginClient client(testPlugin("exit-after-handshake"));
    auto started = client.start();
    if (!started) {
        // The plugin may die before the host finishes dialing.
        EXPECT_TRUE(isLaunchError(started.error().code));
        return;
    }
    std::this_thread::sleep_for(200ms);
    auto builder = client.builder();
    if (!builder) {
        EXPECT_EQ(builder.error().code, ErrorCode::CommunicationFailed);
        return;
    }
    auto r = builder.value()->prepare({});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::CommunicationFailed);
}

TEST(PluginClient, CrashDuringRunIsCommunicationFailure) {
    auto dir = TempDirScope::unique_under("kiln_client_test");
    cache::FileCache fc(dir.path());
    RecordingUi ui;
    NoopHook hook;

    PluginClient client(testPlugin("builder"));
    ASSERT_TRUE(client.start());
    auto builder = client.builder().value();
    ASSERT_TRUE(builder->prepare({ConfigBundle{{"crash", true}}}));
    auto r = builder->run(ui, hook, fc);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::CommunicationFailed);
    EXPECT_NE(r.error().message.find("exited"), std::string::npos) << r.error().message;
}

TEST(PluginClient, KillIsIdempotentAndSafeBeforeStart) {
    PluginClient unstarted(testPlugin("builder"));
    unstarted.kill();
    unstarted.kill();
    EXPECT_TRUE(unstarted.exited());
    auto r = unstarted.start();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);

    PluginClient client(testPlugin("builder"));
    ASSERT_TRUE(client.start());
    std::thread a([&] { client.kill(); });
    std::thread b([&] { client.kill(); });
    a.join();
    b.join();
    EXPECT_TRUE(client.exited());
    auto capability = client.builder();
    ASSERT_FALSE(capability);
    EXPECT_EQ(capability.error().code, ErrorCode::CommunicationFailed);
}

TEST(PluginClient, KillDuringHandshakeWaitAbortsStart) {
    auto config = testPlugin("silent");
    config.startTimeout = 30s;
    PluginClient client(config);

    std::thread killer([&] {
        std::this_thread::sleep_for(300ms);
        client.kill();
    });
    auto started = std::chrono::steady_clock::now();
    auto r = client.start();
    killer.join();

    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 10s);
    EXPECT_TRUE(client.exited());
}

TEST(ClientSet, KillAllTwiceAndRejectsLateClients) {
    ClientSet set;
    auto first = std::make_shared<PluginClient>(testPlugin("builder"));
    auto second = std::make_shared<PluginClient>(testPlugin("provisioner"));
    ASSERT_TRUE(set.add(first));
    ASSERT_TRUE(set.add(second));
    ASSERT_TRUE(first->start());
    ASSERT_TRUE(second->start());
    EXPECT_EQ(set.liveCount(), 2u);

    set.killAll();
    set.killAll();
    EXPECT_TRUE(set.closed());
    EXPECT_EQ(set.liveCount(), 0u);
    EXPECT_TRUE(first->exited());
    EXPECT_TRUE(second->exited());

    auto late = std::make_shared<PluginClient>(testPlugin("builder"));
    auto added = set.add(late);
    ASSERT_FALSE(added);
    EXPECT_EQ(added.error().code, ErrorCode::OperationCancelled);
}

TEST(ClientSet, CompletionRacingInterruptLeavesNoSubprocess) {
    ClientSet set;
    std::vector<int64_t> pids;
    for (const char* mode : {"builder", "provisioner", "post-processor"}) {
        auto client = std::make_shared<PluginClient>(testPlugin(mode));
        ASSERT_TRUE(set.add(client));
        ASSERT_TRUE(client->start());
        pids.push_back(client->pid());
    }
    ASSERT_EQ(set.liveCount(), 3u);

    // One caller plays normal completion, the other the signal path.
    std::atomic<bool> go{false};
    auto cleanup = [&] {
        while (!go.load()) {
            std::this_thread::yield();
        }
        set.killAll();
    };
    std::thread completion(cleanup);
    std::thread interrupt(cleanup);
    go = true;
    completion.join();
    interrupt.join();

    EXPECT_TRUE(set.closed());
    EXPECT_EQ(set.liveCount(), 0u);
    EXPECT_EQ(set.size(), 0u);
    for (auto pid : pids) {
        EXPECT_TRUE(processGone(pid)) << "pid " << pid << " still running";
    }
}
