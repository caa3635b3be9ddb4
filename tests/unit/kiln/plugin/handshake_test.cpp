#include <gtest/gtest.h>
#include <kiln/plugin/handshake.h>

using namespace kiln;
using namespace kiln::plugin;

TEST(Handshake, FormatsAndParsesUnixLine) {
    HandshakeLine line{kProtocolVersion, "unix", "/tmp/kiln-plugin-1234.sock"};
    auto text = formatHandshake(line);
    EXPECT_EQ(text, "1|unix|/tmp/kiln-plugin-1234.sock");

    auto parsed = parseHandshake(text + "\n");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().network, "unix");
    EXPECT_EQ(parsed.value().address, "/tmp/kiln-plugin-1234.sock");
}

TEST(Handshake, TcpAddressKeepsPort) {
    auto parsed = parseHandshake("1|tcp|127.0.0.1:10042\r\n");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().network, "tcp");
    EXPECT_EQ(parsed.value().address, "127.0.0.1:10042");
}

TEST(Handshake, RejectsMalformedLines) {
    for (const char* bad : {"this is not a handshake", "1|unix", "x|unix|/tmp/s", "1|udp|host:1",
                            "1|unix|", ""}) {
        auto parsed = parseHandshake(bad);
        ASSERT_FALSE(parsed) << bad;
        EXPECT_EQ(parsed.error().code, ErrorCode::PluginProtocol) << bad;
    }
}

TEST(Handshake, RejectsOtherProtocolVersions) {
    auto parsed = parseHandshake("99|unix|/tmp/kiln-nonexistent.sock");
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::PluginProtocol);
    EXPECT_NE(parsed.error().message.find("incompatible plugin protocol version 99"),
              std::string::npos);
}

TEST(Handshake, ExecutableNameFollowsKindAndName) {
    EXPECT_EQ(pluginExecutableName(ComponentKind::Builder, "qemu"), "kiln-builder-qemu");
    EXPECT_EQ(pluginExecutableName(ComponentKind::PostProcessor, "compress"),
              "kiln-post-processor-compress");
}
