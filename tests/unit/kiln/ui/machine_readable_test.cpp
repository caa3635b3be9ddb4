#include <gtest/gtest.h>
#include <kiln/ui/machine_readable.h>

#include <set>
#include <sstream>
#include <thread>
#include <vector>

using namespace kiln;
using namespace kiln::ui;

namespace {

std::shared_ptr<MachineReadableUi> makeUi(std::ostringstream& out, std::string target = {}) {
    return std::make_shared<MachineReadableUi>(std::make_shared<LineWriter>(out),
                                               std::move(target), [] { return int64_t{1700000000}; });
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

TEST(MachineReadableEscape, EscapesSeparatorsAndNewlines) {
    EXPECT_EQ(escapeField("a,b"), "a\\,b");
    EXPECT_EQ(escapeField("line1\nline2"), "line1\\nline2");
    EXPECT_EQ(escapeField("C:\\dir"), "C:\\\\dir");
    EXPECT_EQ(escapeField("plain"), "plain");
}

TEST(MachineReadableEscape, UnescapeRestoresOriginal) {
    const std::string original = "a,b\\c\nd\re";
    EXPECT_EQ(unescapeField(escapeField(original)), original);
}

TEST(MachineReadableEncode, MessageBecomesUiRecord) {
    auto event = UiEvent::forMessage("web", MessageKind::Say, "Starting build, please wait");
    event.timestamp = 1700000000;
    EXPECT_EQ(encodeEvent(event), "1700000000,web,ui,say,Starting build\\, please wait");
}

TEST(MachineReadableEncode, DecodeSplitsOnlyUnescapedCommas) {
    auto decoded = decodeEvent("42,,artifact,0,id,a\\,b\\nc");
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value().timestamp, 42);
    EXPECT_EQ(decoded.value().target, "");
    EXPECT_EQ(decoded.value().type, "artifact");
    ASSERT_EQ(decoded.value().data.size(), 3u);
    EXPECT_EQ(decoded.value().data[2], "a,b\nc");
}

TEST(MachineReadableEncode, DecodeRejectsShortAndMalformedRecords) {
    auto tooShort = decodeEvent("1,target");
    ASSERT_FALSE(tooShort);
    EXPECT_EQ(tooShort.error().code, ErrorCode::InvalidArgument);

    auto badTimestamp = decodeEvent("soon,target,ui,say,x");
    ASSERT_FALSE(badTimestamp);
}

TEST(MachineReadableUi, MultiLineMessageStaysOnOneRecord) {
    std::ostringstream out;
    auto ui = makeUi(out, "web");
    ui->message("first\nsecond");

    auto lines = splitLines(out.str());
    ASSERT_EQ(lines.size(), 1u);
    auto decoded = decodeEvent(lines[0]);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value().target, "web");
    EXPECT_EQ(decoded.value().data, (std::vector<std::string>{"message", "first\nsecond"}));
}

TEST(MachineReadableUi, AskIsNotSupported) {
    std::ostringstream out;
    auto ui = makeUi(out);
    auto answer = ui->ask("Continue?");
    ASSERT_FALSE(answer);
    EXPECT_EQ(answer.error().code, ErrorCode::NotSupported);
    EXPECT_NE(out.str().find(",ui,question,Continue?"), std::string::npos);
}

TEST(MachineReadableUi, ForTargetStampsBuildName) {
    std::ostringstream out;
    std::shared_ptr<IUi> ui = makeUi(out);
    auto scoped = forTarget(ui, "db");
    scoped->machine("artifact-count", {"1"});
    EXPECT_EQ(out.str(), "1700000000,db,artifact-count,1\n");
}

TEST(MachineReadableUi, ConcurrentWritersNeverInterleaveWithinALine) {
    std::ostringstream out;
    auto ui = makeUi(out);
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            auto scoped = ui->withTarget("build-" + std::to_string(t));
            for (int i = 0; i < kPerThread; ++i) {
                scoped->say("message " + std::to_string(i) + ", with comma");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    auto lines = splitLines(out.str());
    ASSERT_EQ(lines.size(), static_cast<size_t>(kThreads * kPerThread));
    std::set<std::string> targets;
    for (const auto& line : lines) {
        auto decoded = decodeEvent(line);
        ASSERT_TRUE(decoded) << line;
        ASSERT_EQ(decoded.value().data.size(), 2u) << line;
        targets.insert(decoded.value().target);
    }
    EXPECT_EQ(targets.size(), static_cast<size_t>(kThreads));
}
