#include "logging/logger.hpp"

#include <gtest/gtest.h>

using namespace tether::logging;

class LoggerTest : public ::testing::Test {
protected:
    Level saved_ = Level::LVL_INFO;

    void SetUp() override { saved_ = Logger::level(); }
    void TearDown() override { Logger::set_level(saved_); }
};

TEST_F(LoggerTest, ParsesLevelNamesCaseInsensitively) {
    EXPECT_EQ(string_to_level("debug"), Level::LVL_DEBUG);
    EXPECT_EQ(string_to_level("INFO"), Level::LVL_INFO);
    EXPECT_EQ(string_to_level("Warn"), Level::LVL_WARN);
    EXPECT_EQ(string_to_level("warning"), Level::LVL_WARN);
    EXPECT_EQ(string_to_level("error"), Level::LVL_ERROR);
    EXPECT_EQ(string_to_level("none"), Level::LVL_NONE);
    EXPECT_EQ(string_to_level("off"), Level::LVL_NONE);
}

TEST_F(LoggerTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(string_to_level("verbose"), Level::LVL_INFO);
    EXPECT_EQ(string_to_level(""), Level::LVL_INFO);
}

TEST_F(LoggerTest, LevelNamesRoundTrip) {
    for (Level level : {Level::LVL_DEBUG, Level::LVL_INFO, Level::LVL_WARN, Level::LVL_ERROR, Level::LVL_NONE}) {
        EXPECT_EQ(string_to_level(level_to_string(level)), level);
    }
}

TEST_F(LoggerTest, ThresholdFiltersLowerLevels) {
    Logger::set_level(Level::LVL_WARN);
    EXPECT_FALSE(Logger::is_enabled(Level::LVL_DEBUG));
    EXPECT_FALSE(Logger::is_enabled(Level::LVL_INFO));
    EXPECT_TRUE(Logger::is_enabled(Level::LVL_WARN));
    EXPECT_TRUE(Logger::is_enabled(Level::LVL_ERROR));

    Logger::set_level(Level::LVL_DEBUG);
    EXPECT_TRUE(Logger::is_enabled(Level::LVL_DEBUG));
}

TEST_F(LoggerTest, DisabledMacroSkipsFormatting) {
    Logger::set_level(Level::LVL_ERROR);
    int evaluated = 0;
    auto touch = [&evaluated]() {
        ++evaluated;
        return "x";
    };
    LOG_DEBUG("[Test] " << touch());
    LOG_INFO("[Test] " << touch());
    EXPECT_EQ(evaluated, 0);

    LOG_ERROR("[Test] " << touch());
    EXPECT_EQ(evaluated, 1);
}
