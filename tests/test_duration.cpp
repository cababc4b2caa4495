/**
 * @file test_duration.cpp
 * @brief Unit tests for duration literals (GoogleTest)
 */

#include <gtest/gtest.h>
#include "agentcfg/Duration.hpp"
#include "agentcfg/Errors.hpp"

#include <limits>

using namespace agentcfg;
using namespace std::chrono_literals;

// ============================================================================
// parse_duration
// ============================================================================

TEST(ParseDuration, SingleUnit) {
    EXPECT_EQ(parse_duration("5m"), Duration(5min));
    EXPECT_EQ(parse_duration("30s"), Duration(30s));
    EXPECT_EQ(parse_duration("2h"), Duration(2h));
    EXPECT_EQ(parse_duration("300ms"), Duration(300ms));
    EXPECT_EQ(parse_duration("10us"), Duration(10us));
    EXPECT_EQ(parse_duration("7ns"), Duration(7ns));
}

TEST(ParseDuration, MicroSigns) {
    EXPECT_EQ(parse_duration("3\xC2\xB5s"), Duration(3us));
    EXPECT_EQ(parse_duration("3\xCE\xBCs"), Duration(3us));
}

TEST(ParseDuration, CompoundAndFraction) {
    EXPECT_EQ(parse_duration("1h30m"), Duration(90min));
    EXPECT_EQ(parse_duration("1.5h"), Duration(90min));
    EXPECT_EQ(parse_duration("1h2m3s4ms"), Duration(1h + 2min + 3s + 4ms));
    EXPECT_EQ(parse_duration(".5s"), Duration(500ms));
    EXPECT_EQ(parse_duration("1.s"), Duration(1s));
}

TEST(ParseDuration, Sign) {
    EXPECT_EQ(parse_duration("-1.5h"), -Duration(90min));
    EXPECT_EQ(parse_duration("+5s"), Duration(5s));
    EXPECT_EQ(parse_duration("-9223372036854775808ns"),
              Duration(std::numeric_limits<std::int64_t>::min()));
}

TEST(ParseDuration, BareZero) {
    EXPECT_EQ(parse_duration("0"), Duration::zero());
    EXPECT_EQ(parse_duration("-0"), Duration::zero());
    EXPECT_EQ(parse_duration("0s"), Duration::zero());
}

TEST(ParseDuration, Invalid) {
    EXPECT_THROW(parse_duration(""), DurationError);
    EXPECT_THROW(parse_duration("-"), DurationError);
    EXPECT_THROW(parse_duration("5"), DurationError);
    EXPECT_THROW(parse_duration("abc"), DurationError);
    EXPECT_THROW(parse_duration("5x"), DurationError);
    EXPECT_THROW(parse_duration(".s"), DurationError);
    EXPECT_THROW(parse_duration("1h 30m"), DurationError);
}

TEST(ParseDuration, Overflow) {
    EXPECT_THROW(parse_duration("9223372036854775808ns"), DurationError);
    EXPECT_THROW(parse_duration("3000000h"), DurationError);
    EXPECT_THROW(parse_duration("9223372036854775807ns1ns"), DurationError);
    EXPECT_THROW(parse_duration("9223372036854775808ns9223372036854775808ns"), DurationError);
    EXPECT_THROW(parse_duration("2562047h2562047h"), DurationError);
}

TEST(ParseDuration, ErrorMessageQuotesInput) {
    try {
        parse_duration("5y");
        FAIL() << "expected DurationError";
    } catch (const DurationError& e) {
        EXPECT_STREQ(e.what(), "invalid duration \"5y\"");
    }
}

// ============================================================================
// format_duration
// ============================================================================

TEST(FormatDuration, Zero) {
    EXPECT_EQ(format_duration(Duration::zero()), "0s");
}

TEST(FormatDuration, SecondsAndAbove) {
    EXPECT_EQ(format_duration(Duration(5min)), "5m0s");
    EXPECT_EQ(format_duration(Duration(30s)), "30s");
    EXPECT_EQ(format_duration(Duration(90min)), "1h30m0s");
    EXPECT_EQ(format_duration(Duration(1500ms)), "1.5s");
    EXPECT_EQ(format_duration(-Duration(2s)), "-2s");
}

TEST(FormatDuration, BelowOneSecond) {
    EXPECT_EQ(format_duration(Duration(300ms)), "300ms");
    EXPECT_EQ(format_duration(Duration(7ns)), "7ns");
    EXPECT_EQ(format_duration(Duration(1500ns)), "1.5\xC2\xB5s");
}

TEST(FormatDuration, ParsesBack) {
    for (const char* text : {"5m0s", "1h30m0s", "300ms", "1.5s", "-2s"}) {
        EXPECT_EQ(format_duration(parse_duration(text)), text);
    }
}
