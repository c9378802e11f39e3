#include "hb/util/Logger.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace hb::util;

// Captures formatted lines for the duration of a test.
class LoggerFixture : public ::testing::Test {
protected:
    void SetUp() override {
        logger().setLevel(LogLevel::Trace);
        logger().setFormatJson(false);
        logger().setSink([this](LogLevel, const std::string& line) { lines.push_back(line); });
    }
    void TearDown() override {
        logger().setSink({});
        logger().setFormatJson(false);
        logger().setLevel(LogLevel::Info);
    }
    std::vector<std::string> lines;
};

TEST(LoggerLevelTest, ParseLevelIsCaseInsensitive) {
    EXPECT_EQ(parseLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("Error"), LogLevel::Error);
    EXPECT_EQ(parseLevel("bogus"), LogLevel::Info);
    EXPECT_STREQ(levelName(LogLevel::Trace), "TRACE");
}

TEST_F(LoggerFixture, PlainFormatCarriesFields) {
    logger().log(LogLevel::Info, "hello", {{"port", "9485"}, {"who", "me"}});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("INFO  hello port=9485 who=me"), std::string::npos);
    EXPECT_EQ(lines[0].front(), '[');
}

TEST_F(LoggerFixture, JsonFormatEscapes) {
    logger().setFormatJson(true);
    logger().log(LogLevel::Warn, "say \"hi\"\n", {{"k", "a\\b"}});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("\"lvl\":\"WARN\""), std::string::npos);
    EXPECT_NE(lines[0].find("\"msg\":\"say \\\"hi\\\"\\n\""), std::string::npos);
    EXPECT_NE(lines[0].find("\"k\":\"a\\\\b\""), std::string::npos);
}

TEST_F(LoggerFixture, LevelFiltersLowerSeverities) {
    logger().setLevel(LogLevel::Warn);
    logger().log(LogLevel::Info, "dropped", {});
    logger().log(LogLevel::Debug, "dropped", {});
    logger().log(LogLevel::Error, "kept", {});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("kept"), std::string::npos);
    EXPECT_FALSE(logger().enabled(LogLevel::Info));
}
