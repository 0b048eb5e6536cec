#include <gtest/gtest.h>

#include "TestFixtures.h"
#include "core/CFG.h"
#include "core/ConfigParser.h"

using namespace FCBForge;
using namespace FCBForge::Testing;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testLog();
        FCBFORGE_CFG.resetToDefaults();
    }
    void TearDown() override { FCBFORGE_CFG.resetToDefaults(); }
};

} // namespace

TEST_F(ConfigTest, ParsesKeyValueLines) {
    ConfigParser parser;
    parser.loadFromString(
        "# comment\n"
        "; another comment\n"
        "\n"
        "LevelPath = /levels/far_cry \n"
        "LogFile=\"quoted name.log\"\n"
        "Empty=\n");

    EXPECT_EQ(parser.get("LevelPath"), "/levels/far_cry");
    EXPECT_EQ(parser.get("LogFile"), "quoted name.log");
    EXPECT_TRUE(parser.hasKey("Empty"));
    EXPECT_EQ(parser.get("Empty", "fallback"), "");
    EXPECT_EQ(parser.get("Missing", "fallback"), "fallback");
    EXPECT_EQ(parser.getAllValues().size(), 3u);
}

TEST_F(ConfigTest, TypedGettersFallBackOnBadValues) {
    ConfigParser parser;
    parser.loadFromString("A=yes\nB=Off\nC=maybe\nN=12\nM=12abc\nD=2.5\nE=x");

    EXPECT_TRUE(parser.getBool("A", false));
    EXPECT_FALSE(parser.getBool("B", true));
    EXPECT_TRUE(parser.getBool("C", true));
    EXPECT_FALSE(parser.getBool("Missing", false));
    EXPECT_EQ(parser.getInt("N", 0), 12);
    EXPECT_EQ(parser.getInt("M", 7), 7);
    EXPECT_DOUBLE_EQ(parser.getDouble("D", 0.0), 2.5);
    EXPECT_DOUBLE_EQ(parser.getDouble("E", 20.0), 20.0);
}

TEST_F(ConfigTest, MalformedLinesAreReported) {
    FlushLogs();
    testLog()->clear();
    ConfigParser parser;
    parser.loadFromString("Good=1\nthis line has no separator\n", "sample.cfg");
    FlushLogs();
    EXPECT_EQ(testLog()->countContaining(WARNING, "sample.cfg:2"), 1u);
    EXPECT_TRUE(parser.hasKey("Good"));
}

TEST_F(ConfigTest, AppliesSettings) {
    ConfigParser parser;
    parser.loadFromString(
        "LevelPath=/levels/a\n"
        "WorkerThreads=3\n"
        "WriteMarkupSidecars=false\n"
        "PreserveUnknownTags=0\n"
        "CacheDir=/tmp/cache\n"
        "KeepBackups=true\n"
        "DuplicateOffset=5.5\n");
    FCBFORGE_CFG.applyConfig(parser);

    EXPECT_EQ(FCBFORGE_CFG.getLevelPath(), "/levels/a");
    EXPECT_EQ(FCBFORGE_CFG.getSectorPath(), "/levels/a");
    EXPECT_EQ(FCBFORGE_CFG.getWorkerThreadCount(), 3u);
    EXPECT_FALSE(FCBFORGE_CFG.WriteMarkupSidecars);
    EXPECT_FALSE(FCBFORGE_CFG.PreserveUnknownTags);
    EXPECT_EQ(FCBFORGE_CFG.CacheDir, "/tmp/cache");
    EXPECT_TRUE(FCBFORGE_CFG.KeepBackups);
    EXPECT_DOUBLE_EQ(FCBFORGE_CFG.DuplicateOffset, 5.5);

    parser.loadFromString("SectorPath=/levels/a/worldsectors\n");
    FCBFORGE_CFG.applyConfig(parser);
    EXPECT_EQ(FCBFORGE_CFG.getSectorPath(), "/levels/a/worldsectors");
}

TEST_F(ConfigTest, DefaultsAndWorkerThreadFallback) {
    EXPECT_TRUE(FCBFORGE_CFG.WriteMarkupSidecars);
    EXPECT_TRUE(FCBFORGE_CFG.PreserveUnknownTags);
    EXPECT_DOUBLE_EQ(FCBFORGE_CFG.DuplicateOffset, 20.0);
    EXPECT_FALSE(FCBFORGE_CFG.PreferredForm.has_value());
    EXPECT_GE(FCBFORGE_CFG.getWorkerThreadCount(), 1u);

    ConfigParser parser;
    parser.set("WorkerThreads", "-4");
    FCBFORGE_CFG.applyConfig(parser);
    EXPECT_EQ(FCBFORGE_CFG.WorkerThreads, 0);
}

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    TempDir dir;
    FCBFORGE_CFG.initialize((dir / "absent.cfg").string());
    EXPECT_EQ(FCBFORGE_CFG.CacheDir, ".fcbforge");

    writeText(dir / "present.cfg", "CacheDir=elsewhere\nLogLevel=debug\n");
    FCBFORGE_CFG.initialize((dir / "present.cfg").string());
    EXPECT_EQ(FCBFORGE_CFG.CacheDir, "elsewhere");
    EXPECT_EQ(ParseLogLevel(FCBFORGE_CFG.LogLevel, WARNING), DEBUG);
}
