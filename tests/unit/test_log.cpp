#include <gtest/gtest.h>

#include "util/log.hpp"

TEST(LogTest, ParsesLevelNames)
{
    EXPECT_EQ(parseLogLevel("debug").value_or(spdlog::level::off), spdlog::level::debug);
    EXPECT_EQ(parseLogLevel("warning").value_or(spdlog::level::off), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("error").value_or(spdlog::level::off), spdlog::level::err);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}
