#include <gtest/gtest.h>
#include <kiln/build/build.h>
#include <kiln/build/hooks.h>
#include <kiln/builtin/components.h>
#include <kiln/cache/file_cache.h>

#include "support/recording_ui.hpp"
#include "support/temp_dir_scope.hpp"

#include <fstream>
#include <sstream>
#include <thread>

using namespace kiln;
using namespace kiln::builtin;
using namespace std::chrono_literals;
using kiln::test_support::RecordingUi;
using kiln::test_support::TempDirScope;

namespace {

class CapturingHook : public components::IHook {
public:
    Result<void> run(const std::string& name, ui::IUi&, const nlohmann::json& data) override {
        calls.emplace_back(name, data);
        return Result<void>();
    }
    std::vector<std::pair<std::string, nlohmann::json>> calls;
};

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

TEST(NullBuilder, ProducesConfiguredArtifactAndRunsProvisionHook) {
    auto dir = TempDirScope::unique_under("kiln_builtin_test");
    cache::FileCache fc(dir.path());
    RecordingUi ui;
    CapturingHook hook;

    NullBuilder builder;
    ASSERT_TRUE(builder.prepare({ConfigBundle{{"artifact_id", "abc"}, {"files", {"x"}}},
                                 ConfigBundle{{build::kBuildNameKey, "n"}}}));
    auto artifact = builder.run(ui, hook, fc);
    ASSERT_TRUE(artifact);
    EXPECT_EQ(artifact.value()->builderId(), kNullBuilderId);
    EXPECT_EQ(artifact.value()->id(), "abc");
    EXPECT_EQ(artifact.value()->files(), (std::vector<std::string>{"x"}));
    EXPECT_EQ(artifact.value()->string(), "Null artifact: abc");
    ASSERT_EQ(hook.calls.size(), 1u);
    EXPECT_EQ(hook.calls[0].first, components::kHookProvision);
}

TEST(NullBuilder, RejectsUnknownKeysAndCancelledRuns) {
    NullBuilder builder;
    auto bad = builder.prepare({ConfigBundle{{"artifact", "typo"}}});
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::ConfigError);

    auto dir = TempDirScope::unique_under("kiln_builtin_test");
    cache::FileCache fc(dir.path());
    RecordingUi ui;
    CapturingHook hook;
    NullBuilder cancelled;
    ASSERT_TRUE(cancelled.prepare({}));
    cancelled.cancel();
    auto r = cancelled.run(ui, hook, fc);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
}

TEST(FileBuilder, ConfigProblemsAreReportedTogether) {
    FileBuilder builder;
    auto r = builder.prepare({ConfigBundle{{"content", "x"}, {"source", "/nonexistent/file"}}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConfigError);
    EXPECT_EQ(r.error().causes.size(), 3u);
}

TEST(FileBuilder, WritesContentAndWarnsWhenEmpty) {
    auto dir = TempDirScope::unique_under("kiln_builtin_test");
    cache::FileCache fc(dir.path() / "cache");
    RecordingUi ui;
    CapturingHook hook;
    const auto target = dir.path() / "out" / "hello.txt";

    FileBuilder builder;
    auto warnings = builder.prepare({ConfigBundle{{"target", target.string()}, {"content", "hi"}}});
    ASSERT_TRUE(warnings);
    EXPECT_TRUE(warnings.value().empty());
    auto artifact = builder.run(ui, hook, fc);
    ASSERT_TRUE(artifact) << artifact.error().message;
    EXPECT_EQ(readFile(target), "hi");
    EXPECT_EQ(artifact.value()->files(), (std::vector<std::string>{target.string()}));
    ASSERT_EQ(hook.calls.size(), 1u);
    EXPECT_EQ(hook.calls[0].second["path"], target.string());

    FileBuilder empty;
    auto emptyWarnings = empty.prepare({ConfigBundle{{"target", target.string()}, {"content", ""}}});
    ASSERT_TRUE(emptyWarnings);
    EXPECT_EQ(emptyWarnings.value().size(), 1u);
}

TEST(FileBuilder, SourceIsCopiedThroughCacheOnce) {
    auto dir = TempDirScope::unique_under("kiln_builtin_test");
    cache::FileCache fc(dir.path() / "cache");
    std::filesystem::create_directories(dir.path() / "cache");
    const auto source = dir.path() / "source.img";
    {
        std::ofstream out(source);
        out << "image-bytes";
    }

    for (int i = 0; i < 2; ++i) {
        RecordingUi ui;
        CapturingHook hook;
        const auto target = dir.path() / ("copy" + std::to_string(i) + ".img");
        FileBuilder builder;
        ASSERT_TRUE(builder.prepare(
            {ConfigBundle{{"target", target.string()}, {"source", source.string()}}}));
        ASSERT_TRUE(builder.run(ui, hook, fc));
        EXPECT_EQ(readFile(target), "image-bytes");
        if (i == 0) {
            EXPECT_TRUE(ui.contains("say: Caching " + source.string()));
        } else {
            EXPECT_TRUE(ui.contains("message: Using cached copy of " + source.string()));
        }
    }
}

TEST(ShellLocal, StreamsOutputToUi) {
    RecordingUi ui;
    ShellLocalProvisioner shell;
    ASSERT_TRUE(shell.prepare({ConfigBundle{{"inline", {"echo out-line", "echo err-line >&2"}},
                                            {"environment_vars", {"GREETING=hello"}}},
                               ConfigBundle{{build::kBuildNameKey, "web"}}}));
    ASSERT_TRUE(shell.provision(ui));
    EXPECT_TRUE(ui.contains("message: out-line"));
    EXPECT_TRUE(ui.contains("error: err-line"));

    RecordingUi envUi;
    ShellLocalProvisioner withEnv;
    ASSERT_TRUE(withEnv.prepare({ConfigBundle{{"command", "echo $GREETING"},
                                              {"environment_vars", {"GREETING=hello"}}}}));
    ASSERT_TRUE(withEnv.provision(envUi));
    EXPECT_TRUE(envUi.contains("message: hello"));
}

TEST(ShellLocal, NonZeroExitFailsTheBuild) {
    RecordingUi ui;
    ShellLocalProvisioner shell;
    ASSERT_TRUE(shell.prepare({ConfigBundle{{"command", "exit 7"}}}));
    auto r = shell.provision(ui);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::BuildFailed);
    EXPECT_NE(r.error().message.find("status 7"), std::string::npos);
}

TEST(ShellLocal, ConfigValidation) {
    ShellLocalProvisioner neither;
    EXPECT_FALSE(neither.prepare({ConfigBundle::object()}));

    ShellLocalProvisioner badEnv;
    auto r = badEnv.prepare({ConfigBundle{{"command", "true"}, {"environment_vars", {"NOEQUALS"}}}});
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("KEY=VALUE"), std::string::npos);
}

TEST(ShellLocal, CancelStopsRunningScript) {
    RecordingUi ui;
    ShellLocalProvisioner shell;
    ASSERT_TRUE(shell.prepare({ConfigBundle{{"command", "sleep 30"}}}));
    std::thread canceller([&] {
        std::this_thread::sleep_for(300ms);
        shell.cancel();
    });
    auto started = std::chrono::steady_clock::now();
    auto r = shell.provision(ui);
    canceller.join();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 20s);
}

TEST(Manifest, AppendsOneRecordPerArtifact) {
    auto dir = TempDirScope::unique_under("kiln_builtin_test");
    const auto output = dir.path() / "manifest.json";
    RecordingUi ui;

    for (const char* name : {"web", "db"}) {
        ManifestPostProcessor manifest;
        ASSERT_TRUE(manifest.configure({ConfigBundle{{"output", output.string()}},
                                        ConfigBundle{{build::kBuildNameKey, name},
                                                     {build::kBuilderTypeKey, "null"}}}));
        auto artifact = std::make_shared<components::BasicArtifact>(
            kNullBuilderId, std::string("id-") + name, std::vector<std::string>{"f"}, "d");
        auto r = manifest.postProcess(ui, artifact);
        ASSERT_TRUE(r) << r.error().message;
        EXPECT_EQ(r.value().artifact, artifact);
        EXPECT_TRUE(r.value().keep);
    }

    auto json = nlohmann::json::parse(readFile(output));
    ASSERT_EQ(json["builds"].size(), 2u);
    EXPECT_EQ(json["builds"][0]["name"], "web");
    EXPECT_EQ(json["builds"][1]["artifact_id"], "id-db");
    EXPECT_EQ(json["builds"][1]["builder_type"], "null");
    EXPECT_EQ(json["builds"][1]["files"][0], "f");
}

TEST(Manifest, CorruptExistingManifestIsAnError) {
    auto dir = TempDirScope::unique_under("kiln_builtin_test");
    const auto output = dir.path() / "manifest.json";
    {
        std::ofstream out(output);
        out << "{not json";
    }
    RecordingUi ui;
    ManifestPostProcessor manifest;
    ASSERT_TRUE(manifest.configure({ConfigBundle{{"output", output.string()}}}));
    auto r = manifest.postProcess(
        ui, std::make_shared<components::BasicArtifact>("b", "i", std::vector<std::string>{}, "d"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::BuildFailed);
}

TEST(ProvisionHook, RunsProvisionersInOrderAndWrapsErrors) {
    auto first = std::make_shared<ShellLocalProvisioner>();
    auto second = std::make_shared<ShellLocalProvisioner>();
    ASSERT_TRUE(first->prepare({ConfigBundle{{"command", "echo first"}}}));
    ASSERT_TRUE(second->prepare({ConfigBundle{{"command", "exit 3"}}}));

    build::ProvisionHook hook({{"shell-local", first}, {"shell-local", second}});
    RecordingUi ui;
    auto r = hook.run(components::kHookProvision, ui, nlohmann::json::object());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message.rfind("error running provisioner shell-local: ", 0), 0u);
    auto lines = ui.lines();
    ASSERT_GE(lines.size(), 2u);
    EXPECT_EQ(lines[0], "say: Provisioning with shell-local...");
    EXPECT_TRUE(ui.contains("message: first"));
}
