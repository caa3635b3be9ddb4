#include <gtest/gtest.h>
#include <kiln/config/host_config.h>

#include "support/temp_dir_scope.hpp"

#include <fstream>
#include <sstream>

using namespace kiln;
using namespace kiln::config;

namespace {

Result<HostConfig> parse(const std::string& text) {
    std::istringstream in(text);
    return parseHostConfig(in, "config.toml");
}

} // namespace

TEST(HostConfig, DefaultsWhenEmpty) {
    auto r = parse("");
    ASSERT_TRUE(r);
    const auto& cfg = r.value();
    EXPECT_EQ(cfg.precedence, Precedence::BuiltinFirst);
    EXPECT_EQ(cfg.plugins.network, "unix");
    EXPECT_EQ(cfg.plugins.minPort, 10000);
    EXPECT_EQ(cfg.plugins.maxPort, 25000);
    EXPECT_EQ(cfg.plugins.startTimeout, std::chrono::milliseconds(60000));
    EXPECT_TRUE(cfg.bindings.empty());
}

TEST(HostConfig, ParsesSectionsAndDottedKeys) {
    auto r = parse(R"(
# plugin settings
[plugins]
directories = ["/opt/kiln/plugins", "/usr/lib/kiln"]
network = "tcp"
min_port = 20000   # inline comment
start_timeout_ms = 500

[builders]
qemu = "/opt/kiln/bin/kiln-builder-qemu"

[post-processors]
compress = "/opt/kiln/bin/compress"
)");
    ASSERT_TRUE(r) << r.error().message;
    const auto& cfg = r.value();
    ASSERT_EQ(cfg.plugins.directories.size(), 2u);
    EXPECT_EQ(cfg.plugins.directories[1], std::filesystem::path("/usr/lib/kiln"));
    EXPECT_EQ(cfg.plugins.network, "tcp");
    EXPECT_EQ(cfg.plugins.minPort, 20000);
    EXPECT_EQ(cfg.plugins.startTimeout, std::chrono::milliseconds(500));
    EXPECT_EQ(cfg.bindings.at(ComponentKind::Builder).at("qemu"),
              std::filesystem::path("/opt/kiln/bin/kiln-builder-qemu"));
    EXPECT_EQ(cfg.bindings.at(ComponentKind::PostProcessor).at("compress"),
              std::filesystem::path("/opt/kiln/bin/compress"));

    auto dotted = parse("registry.precedence = \"plugin-first\"\n");
    ASSERT_TRUE(dotted);
    EXPECT_EQ(dotted.value().precedence, Precedence::PluginFirst);
}

TEST(HostConfig, CollectsErrorsWithLineNumbers) {
    auto r = parse(R"([plugins]
network = "udp"
max_port = 99999
bogus = 1
[unknown]
x = 1
)");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConfigError);
    ASSERT_EQ(r.error().causes.size(), 4u);
    EXPECT_EQ(r.error().causes[0].message.rfind("config.toml:2: ", 0), 0u);
    EXPECT_NE(r.error().causes[2].message.find("unknown key 'bogus'"), std::string::npos);
    EXPECT_NE(r.error().causes[3].message.find("unknown section 'unknown'"), std::string::npos);
}

TEST(HostConfig, PortRangeMustBeOrdered) {
    auto r = parse("[plugins]\nmin_port = 3000\nmax_port = 2000\n");
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("min_port must not exceed"), std::string::npos);
}

TEST(HostConfig, MissingOptionalFileUsesDefaults) {
    auto dir = kiln::test_support::TempDirScope::unique_under("kiln_host_config");
    auto missing = loadHostConfig(dir.path() / "absent.toml", false);
    ASSERT_TRUE(missing);
    EXPECT_TRUE(missing.value().source.empty());

    auto required = loadHostConfig(dir.path() / "absent.toml", true);
    ASSERT_FALSE(required);
    EXPECT_EQ(required.error().code, ErrorCode::ConfigError);
}

TEST(HostConfig, LoadsFileAndRecordsSource) {
    auto dir = kiln::test_support::TempDirScope::unique_under("kiln_host_config");
    auto path = dir.path() / "config.toml";
    {
        std::ofstream out(path);
        out << "[registry]\nprecedence = plugin-first\n";
    }
    auto r = loadHostConfig(path, true);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().source, path);
    EXPECT_EQ(r.value().precedence, Precedence::PluginFirst);
}

TEST(HostConfigHelpers, PathListAcceptsBracketsAndQuotes) {
    auto paths = parse_path_list(" [ \"/a\", '/b' ,, /c ] ");
    ASSERT_EQ(paths.size(), 3u);
    EXPECT_EQ(paths[0], std::filesystem::path("/a"));
    EXPECT_EQ(paths[1], std::filesystem::path("/b"));
    EXPECT_EQ(paths[2], std::filesystem::path("/c"));
}
