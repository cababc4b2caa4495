/**
 * @file test_log.cpp
 * @brief Tests for the library logger (GoogleTest)
 */

#include <gtest/gtest.h>
#include "agentcfg/Errors.hpp"
#include "agentcfg/Log.hpp"

using namespace agentcfg;

TEST(Log, SharedNamedLogger) {
    auto log = logger();
    ASSERT_NE(log, nullptr);
    EXPECT_EQ(log->name(), "agentcfg");
    EXPECT_EQ(log, logger());
    EXPECT_EQ(spdlog::get("agentcfg"), log);
}

TEST(Log, SetLevel) {
    set_log_level("DEBUG");
    EXPECT_EQ(logger()->level(), spdlog::level::debug);
    set_log_level("off");
    EXPECT_EQ(logger()->level(), spdlog::level::off);
    set_log_level("warn");
    EXPECT_EQ(logger()->level(), spdlog::level::warn);
}

TEST(Log, UnknownLevel) {
    EXPECT_THROW(set_log_level("loud"), ConfigError);
    EXPECT_EQ(logger()->level(), spdlog::level::warn);
}
