#include <gtest/gtest.h>
#include <kiln/build/build.h>
#include <kiln/builtin/builtins.h>
#include <kiln/cache/file_cache.h>
#include <kiln/environment/environment.h>

#include "support/recording_ui.hpp"
#include "support/temp_dir_scope.hpp"

#include <fstream>

using namespace kiln;
using namespace kiln::build;
using kiln::test_support::RecordingUi;
using kiln::test_support::TempDirScope;

namespace {

// Wraps its input in a new artifact and asks for the input to be discarded.
class RewrapPostProcessor : public components::IPostProcessor {
public:
    Result<void> configure(const std::vector<ConfigBundle>& configs) override {
        auto merged = config::mergeBundles(configs);
        config::ConfigDecoder d(merged);
        keep_ = d.optionalBool("keep", false);
        d.rejectUnknownKeys({"keep"});
        return d.finish();
    }
    Result<components::PostProcessResult>
    postProcess(ui::IUi&, std::shared_ptr<components::IArtifact> artifact) override {
        auto wrapped = std::make_shared<components::BasicArtifact>(
            "kiln.rewrap", artifact->id() + "+rewrap", std::vector<std::string>{},
            "Rewrapped " + artifact->id());
        return components::PostProcessResult{wrapped, keep_};
    }

private:
    bool keep_{false};
};

class BuildFixture : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDirScope>(TempDirScope::unique_under("kiln_build_test"));
        registry_ = std::make_shared<registry::Registry>();
        ASSERT_TRUE(builtin::registerBuiltins(*registry_));
        ASSERT_TRUE(registry_->registerBuiltin<components::IPostProcessor>(
            ComponentKind::PostProcessor, "rewrap",
            [] { return std::make_shared<RewrapPostProcessor>(); }));
        ui_ = std::make_shared<RecordingUi>();
        env_ = std::make_unique<Environment>(
            registry_, ui_, std::make_shared<cache::FileCache>(dir_->path() / "cache"));
    }

    Result<std::vector<std::shared_ptr<components::IArtifact>>>
    runSingle(const std::string& templateText) {
        auto tpl = parseTemplate(templateText);
        if (!tpl) {
            return tpl.error();
        }
        auto builds = createBuilds(tpl.value(), *env_, {});
        if (!builds) {
            return builds.error();
        }
        EXPECT_EQ(builds.value().size(), 1u);
        auto& b = builds.value().front();
        if (auto prepared = b->prepare(); !prepared) {
            return prepared.error();
        }
        return b->run(ui::forTarget(ui_, b->name()), env_->cache());
    }

    std::string filePath(const std::string& name) const { return (dir_->path() / name).string(); }

    std::unique_ptr<TempDirScope> dir_;
    std::shared_ptr<registry::Registry> registry_;
    std::shared_ptr<RecordingUi> ui_;
    std::unique_ptr<Environment> env_;
};

} // namespace

TEST_F(BuildFixture, ProvisionersRunThroughBuilderHook) {
    auto artifacts = runSingle(R"({
        "builders": [{"type": "null", "name": "web"}],
        "provisioners": [{"type": "shell-local", "command": "echo provisioned-$kiln_marker",
                          "environment_vars": ["kiln_marker=ok"]}]
    })");
    ASSERT_TRUE(artifacts) << artifacts.error().message;
    ASSERT_EQ(artifacts.value().size(), 1u);
    EXPECT_EQ(artifacts.value()[0]->builderId(), "kiln.null");
    EXPECT_TRUE(ui_->contains("say: ==> web: Provisioning with shell-local..."));
    EXPECT_TRUE(ui_->contains("message:     web: provisioned-ok"));
}

TEST_F(BuildFixture, DiscardedInputArtifactIsDestroyed) {
    const auto target = filePath("discarded.txt");
    auto artifacts = runSingle(R"({
        "builders": [{"type": "file", "target": ")" + target + R"(", "content": "x"}],
        "post-processors": ["rewrap"]
    })");
    ASSERT_TRUE(artifacts) << artifacts.error().message;
    ASSERT_EQ(artifacts.value().size(), 1u);
    EXPECT_EQ(artifacts.value()[0]->builderId(), "kiln.rewrap");
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_TRUE(ui_->contains("Deleting intermediate artifact: " + target));
}

TEST_F(BuildFixture, KeepInputArtifactOverridesPostProcessor) {
    const auto target = filePath("kept.txt");
    auto artifacts = runSingle(R"({
        "builders": [{"type": "file", "target": ")" + target + R"(", "content": "x"}],
        "post-processors": [{"type": "rewrap", "keep_input_artifact": true}]
    })");
    ASSERT_TRUE(artifacts) << artifacts.error().message;
    ASSERT_EQ(artifacts.value().size(), 2u);
    EXPECT_EQ(artifacts.value()[0]->builderId(), "kiln.file");
    EXPECT_EQ(artifacts.value()[1]->builderId(), "kiln.rewrap");
    EXPECT_TRUE(std::filesystem::exists(target));
}

TEST_F(BuildFixture, PassThroughPostProcessorDoesNotDuplicateArtifact) {
    auto artifacts = runSingle(R"({
        "builders": [{"type": "null"}],
        "post-processors": [{"type": "manifest", "output": ")" + filePath("m.json") + R"("}]
    })");
    ASSERT_TRUE(artifacts) << artifacts.error().message;
    ASSERT_EQ(artifacts.value().size(), 1u);
    EXPECT_TRUE(std::filesystem::exists(filePath("m.json")));
}

TEST_F(BuildFixture, ChainDestroysIntermediateArtifacts) {
    auto artifacts = runSingle(R"({
        "builders": [{"type": "null", "artifact_id": "base"}],
        "post-processors": [["rewrap", "rewrap"]]
    })");
    ASSERT_TRUE(artifacts) << artifacts.error().message;
    ASSERT_EQ(artifacts.value().size(), 1u);
    EXPECT_EQ(artifacts.value()[0]->id(), "base+rewrap+rewrap");
    EXPECT_TRUE(ui_->contains("Deleting intermediate artifact: base+rewrap"));
    EXPECT_TRUE(ui_->contains("Deleting intermediate artifact: base"));
}

TEST_F(BuildFixture, PrepareAggregatesConfigErrorsAcrossComponents) {
    auto tpl = parseTemplate(R"({
        "builders": [{"type": "file", "name": "f"}],
        "provisioners": [{"type": "shell-local"}],
        "post-processors": [{"type": "rewrap", "unexpected": 1}]
    })");
    ASSERT_TRUE(tpl);
    auto builds = createBuilds(tpl.value(), *env_, {});
    ASSERT_TRUE(builds);
    auto r = builds.value()[0]->prepare();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConfigError);
    EXPECT_EQ(r.error().message.rfind("build 'f': ", 0), 0u);
    EXPECT_GE(r.error().causes.size(), 4u);
}

TEST_F(BuildFixture, RunBeforePrepareIsInvalidState) {
    auto tpl = parseTemplate(R"({"builders": [{"type": "null"}]})");
    ASSERT_TRUE(tpl);
    auto builds = createBuilds(tpl.value(), *env_, {});
    ASSERT_TRUE(builds);
    auto r = builds.value()[0]->run(ui_, env_->cache());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);
}

TEST_F(BuildFixture, CancelBeforeRunStopsTheBuild) {
    auto tpl = parseTemplate(R"({"builders": [{"type": "null"}]})");
    ASSERT_TRUE(tpl);
    auto builds = createBuilds(tpl.value(), *env_, {});
    ASSERT_TRUE(builds);
    auto& b = builds.value()[0];
    ASSERT_TRUE(b->prepare());
    b->cancel();
    auto r = b->run(ui_, env_->cache());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
}

TEST_F(BuildFixture, FiltersSelectBuildsAndRejectUnknownNames) {
    auto tpl = parseTemplate(R"({"builders": [{"type": "null", "name": "a"},
                                              {"type": "null", "name": "b"}]})");
    ASSERT_TRUE(tpl);

    auto onlyB = createBuilds(tpl.value(), *env_, BuildFilter{{"b"}, {}});
    ASSERT_TRUE(onlyB);
    ASSERT_EQ(onlyB.value().size(), 1u);
    EXPECT_EQ(onlyB.value()[0]->name(), "b");

    auto exceptA = createBuilds(tpl.value(), *env_, BuildFilter{{}, {"a"}});
    ASSERT_TRUE(exceptA);
    EXPECT_EQ(exceptA.value()[0]->name(), "b");

    auto unknown = createBuilds(tpl.value(), *env_, BuildFilter{{"zzz"}, {}});
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::InvalidArgument);
}

TEST_F(BuildFixture, UnknownComponentsAreReportedTogether) {
    auto tpl = parseTemplate(R"({
        "builders": [{"type": "no-such-builder-xyz"}],
        "provisioners": [{"type": "no-such-provisioner-xyz"}]
    })");
    ASSERT_TRUE(tpl);
    auto single = createBuilds(tpl.value(), *env_, {});
    ASSERT_FALSE(single);
    // The builder is missing so its provisioners are never looked up.
    EXPECT_EQ(single.error().code, ErrorCode::ComponentNotFound);

    auto tpl2 = parseTemplate(R"({
        "builders": [{"type": "null"}, {"type": "no-such-builder-xyz"}],
        "provisioners": [{"type": "no-such-provisioner-xyz"}]
    })");
    ASSERT_TRUE(tpl2);
    auto multiple = createBuilds(tpl2.value(), *env_, {});
    ASSERT_FALSE(multiple);
    EXPECT_EQ(multiple.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(multiple.error().causes.size(), 2u);
    EXPECT_EQ(env_->clients().size(), 0u);
}
