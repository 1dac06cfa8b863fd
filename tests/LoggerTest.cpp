#include <gtest/gtest.h>

#include "System/Logger.hpp"

TEST(LoggerConfigTest, ParsesKnownLevels) {
    EXPECT_EQ(LoggerConfig::parseLevel("debug").unwrap(), spdlog::level::debug);
    EXPECT_EQ(LoggerConfig::parseLevel("warning").unwrap(), spdlog::level::warn);
    EXPECT_EQ(LoggerConfig::parseLevel("off").unwrap(), spdlog::level::off);
}

TEST(LoggerConfigTest, RejectsUnknownLevel) {
    auto level = LoggerConfig::parseLevel("verbose");
    ASSERT_TRUE(level.isErr());
    EXPECT_NE(level.unwrapErr().find("verbose"), std::string::npos);
    EXPECT_TRUE(LoggerConfig::parseLevel("").isErr());
}
