#include <gtest/gtest.h>
#include <kiln/ui/ui.h>

#include "support/recording_ui.hpp"

#include <sstream>

using namespace kiln;
using kiln::test_support::RecordingUi;

TEST(TargetedUi, PrefixesEveryLineWithBuildName) {
    auto recorder = std::make_shared<RecordingUi>();
    auto ui = ui::forTarget(recorder, "web");

    ui->say("Starting");
    ui->message("out1\nout2");
    ui->error("boom");

    auto lines = recorder->lines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "say: ==> web: Starting");
    EXPECT_EQ(lines[1], "message:     web: out1\n    web: out2");
    EXPECT_EQ(lines[2], "error: ==> web: boom");
}

TEST(TargetedUi, MachineRecordsPassThroughUnchanged) {
    auto recorder = std::make_shared<RecordingUi>();
    auto ui = ui::forTarget(recorder, "web");
    ui->machine("artifact", {"0", "id", "x"});
    EXPECT_EQ(recorder->lines(), (std::vector<std::string>{"machine: artifact,0,id,x"}));
}

TEST(BasicUi, AskReadsOneLine) {
    std::istringstream in("yes\r\nno\n");
    std::ostringstream out;
    std::ostringstream err;
    ui::BasicUi basic(in, out, err);

    auto first = basic.ask("Proceed?");
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value(), "yes");
    EXPECT_EQ(out.str(), "Proceed? ");

    basic.error("bad");
    EXPECT_EQ(err.str(), "bad\n");
}

TEST(BasicUi, AskFailsWithoutInput) {
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    ui::BasicUi basic(in, out, err);
    auto answer = basic.ask("Proceed?");
    ASSERT_FALSE(answer);
    EXPECT_EQ(answer.error().code, ErrorCode::IOError);
}
