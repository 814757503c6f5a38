/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include <initializer_list>

#include <bastion/internal/duration.h>

using namespace std::chrono_literals;
using bastion::format_duration;
using bastion::parse_duration;

TEST(duration_test, formats_zero)
{
    EXPECT_EQ(format_duration(0ns), "0s");
}

TEST(duration_test, formats_sub_second_values_with_the_largest_unit)
{
    EXPECT_EQ(format_duration(1ns), "1ns");
    EXPECT_EQ(format_duration(1500ns), "1.5us");
    EXPECT_EQ(format_duration(500ms), "500ms");
    EXPECT_EQ(format_duration(std::chrono::nanoseconds(1'100'000)), "1.1ms");
}

TEST(duration_test, formats_hours_minutes_seconds)
{
    EXPECT_EQ(format_duration(1s), "1s");
    EXPECT_EQ(format_duration(90s), "1m30s");
    EXPECT_EQ(format_duration(1h + 2min + 3500ms), "1h2m3.5s");
    EXPECT_EQ(format_duration(2h), "2h0m0s");
}

TEST(duration_test, formats_negative_values)
{
    EXPECT_EQ(format_duration(-80ms), "-80ms");
    EXPECT_EQ(format_duration(-61s), "-1m1s");
}

TEST(duration_test, parses_single_units)
{
    std::chrono::nanoseconds d{};
    ASSERT_TRUE(parse_duration("500ms", d));
    EXPECT_EQ(d, 500ms);
    ASSERT_TRUE(parse_duration("3ns", d));
    EXPECT_EQ(d, 3ns);
    ASSERT_TRUE(parse_duration("2us", d));
    EXPECT_EQ(d, 2us);
    ASSERT_TRUE(parse_duration("2\xc2\xb5s", d));
    EXPECT_EQ(d, 2us);
    ASSERT_TRUE(parse_duration("4m", d));
    EXPECT_EQ(d, 4min);
    ASSERT_TRUE(parse_duration("1h", d));
    EXPECT_EQ(d, 1h);
}

TEST(duration_test, parses_compound_and_fractional_values)
{
    std::chrono::nanoseconds d{};
    ASSERT_TRUE(parse_duration("1m30s", d));
    EXPECT_EQ(d, 90s);
    ASSERT_TRUE(parse_duration("1.5s", d));
    EXPECT_EQ(d, 1500ms);
    ASSERT_TRUE(parse_duration(".5ms", d));
    EXPECT_EQ(d, 500us);
    ASSERT_TRUE(parse_duration("-1h2m3.5s", d));
    EXPECT_EQ(d, -(1h + 2min + 3500ms));
    ASSERT_TRUE(parse_duration("+10s", d));
    EXPECT_EQ(d, 10s);
    ASSERT_TRUE(parse_duration("0", d));
    EXPECT_EQ(d, 0ns);
}

TEST(duration_test, rejects_malformed_text)
{
    std::chrono::nanoseconds d = 7ns;
    for (const char* text : {"", "-", "10", "ms", "1x", "1.s.", "1..5s", "s10", "1 s", "."})
    {
        EXPECT_FALSE(parse_duration(text, d)) << text;
    }
    EXPECT_EQ(d, 7ns);
}

TEST(duration_test, formatted_values_parse_back)
{
    for (std::chrono::nanoseconds value : std::initializer_list<std::chrono::nanoseconds>{1ns, 999ns, 1234us, 59999ms, std::chrono::nanoseconds(3723000000123)})
    {
        std::chrono::nanoseconds parsed{};
        ASSERT_TRUE(parse_duration(format_duration(value), parsed)) << format_duration(value);
        EXPECT_EQ(parsed, value);
    }
}
