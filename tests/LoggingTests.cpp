#include <gtest/gtest.h>

#include "TestFixtures.h"

using namespace FCBForge;
using namespace FCBForge::Testing;

TEST(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(ParseLogLevel("debug", WARNING), DEBUG);
    EXPECT_EQ(ParseLogLevel("Message", WARNING), MESSAGE);
    EXPECT_EQ(ParseLogLevel("ERROR", WARNING), ERROR);
    EXPECT_EQ(ParseLogLevel("verbose", MESSAGE), MESSAGE);
    EXPECT_EQ(ParseLogLevel("", ERROR), ERROR);
    EXPECT_STREQ(LogLevelName(WARNING), "WARNING");
}

TEST(LoggingTest, MemoryWriterCollectsFormattedMessages) {
    auto log = testLog();
    FlushLogs();
    log->clear();

    Log(WARNING, "LoggingTest", "{} of {} files failed", 2, 5);
    Log(DEBUG, "LoggingTest", "detail {}", "x");
    FlushLogs();

    EXPECT_EQ(log->countContaining(WARNING, "2 of 5 files failed"), 1u);
    EXPECT_EQ(log->countContaining(ERROR, "2 of 5 files failed"), 0u);
    EXPECT_EQ(log->countContaining(DEBUG, "detail x"), 1u);

    auto messages = log->messages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].owner, "LoggingTest");
}

TEST(LoggingTest, DisabledLoggingDropsMessages) {
    auto log = testLog();
    FlushLogs();
    log->clear();

    ToggleLogging(false);
    Log(ERROR, "LoggingTest", "dropped");
    ToggleLogging(true);
    FlushLogs();
    EXPECT_EQ(log->countContaining(ERROR, "dropped"), 0u);
}
