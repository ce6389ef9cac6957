#include "utils/logging.hpp"
#include <gtest/gtest.h>

using namespace fastnet::utils;

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::enable();
        Logger::setLevel(LogLevel::INFO);
        Logger::setTag("");
    }
};

TEST_F(LoggingTest, ParseLevelIsCaseInsensitive) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("Info"), LogLevel::INFO);
    EXPECT_EQ(Logger::parseLevel("WARNING"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("loud", LogLevel::WARN), LogLevel::WARN);
}

TEST_F(LoggingTest, LevelNamesParseBack) {
    for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR}) {
        EXPECT_EQ(Logger::parseLevel(Logger::levelName(level), LogLevel::INFO), level);
    }
}

TEST_F(LoggingTest, EnableDisable) {
    Logger::disable();
    EXPECT_FALSE(Logger::isEnabled());
    EXPECT_NO_THROW(Logger::error("dropped"));

    Logger::enable();
    EXPECT_TRUE(Logger::isEnabled());
}

TEST_F(LoggingTest, TagAndLevel) {
    Logger::setTag("FastNet");
    Logger::setLevel(LogLevel::WARN);
    EXPECT_EQ(Logger::getTag(), "FastNet");
    EXPECT_EQ(Logger::getLevel(), LogLevel::WARN);
    EXPECT_NO_THROW(Logger::debug("filtered"));
}
