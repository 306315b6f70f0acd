/**
 * @file test_log.cpp
 * @brief Log level filtering
 */

#include "panicscan/log.hpp"

#include <gtest/gtest.h>

using namespace panicscan;

TEST(Log, QuietDisablesEverything)
{
    log::set_level(log::Level::kQuiet);
    EXPECT_FALSE(log::enabled(log::Level::kWarn));
    EXPECT_FALSE(log::enabled(log::Level::kInfo));
    EXPECT_FALSE(log::enabled(log::Level::kDebug));
}

TEST(Log, LevelsAreCumulative)
{
    log::set_level(log::Level::kInfo);
    EXPECT_EQ(log::level(), log::Level::kInfo);
    EXPECT_TRUE(log::enabled(log::Level::kWarn));
    EXPECT_TRUE(log::enabled(log::Level::kInfo));
    EXPECT_FALSE(log::enabled(log::Level::kDebug));

    log::set_level(log::Level::kDebug);
    EXPECT_TRUE(log::enabled(log::Level::kDebug));
    EXPECT_FALSE(log::enabled(log::Level::kQuiet));
    log::set_level(log::Level::kQuiet);
}
