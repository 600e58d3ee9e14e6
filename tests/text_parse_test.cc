// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/support/text_parse.hpp"

namespace dealcalc {
namespace {

TEST(ParseOrZeroTest, PlainNumbers) {
    EXPECT_DOUBLE_EQ(parse_or_zero("1500"), 1500.0);
    EXPECT_DOUBLE_EQ(parse_or_zero("1500.25"), 1500.25);
    EXPECT_DOUBLE_EQ(parse_or_zero("-2500"), -2500.0);
    EXPECT_DOUBLE_EQ(parse_or_zero("+42"), 42.0);
    EXPECT_DOUBLE_EQ(parse_or_zero("1e3"), 1000.0);
}

TEST(ParseOrZeroTest, LeadingWhitespaceSkipped) {
    EXPECT_DOUBLE_EQ(parse_or_zero("  \t750"), 750.0);
}

TEST(ParseOrZeroTest, LongestNumericPrefix) {
    EXPECT_DOUBLE_EQ(parse_or_zero("1500abc"), 1500.0);
    EXPECT_DOUBLE_EQ(parse_or_zero("99.5$"), 99.5);
}

TEST(ParseOrZeroTest, GarbageIsZero) {
    EXPECT_DOUBLE_EQ(parse_or_zero(""), 0.0);
    EXPECT_DOUBLE_EQ(parse_or_zero("   "), 0.0);
    EXPECT_DOUBLE_EQ(parse_or_zero("abc"), 0.0);
    EXPECT_DOUBLE_EQ(parse_or_zero("-"), 0.0);
    EXPECT_DOUBLE_EQ(parse_or_zero("--5"), 0.0);
    EXPECT_DOUBLE_EQ(parse_or_zero("+-5"), 0.0);
}

TEST(ParseOrZeroTest, NonFiniteIsZero) {
    EXPECT_DOUBLE_EQ(parse_or_zero("nan"), 0.0);
    EXPECT_DOUBLE_EQ(parse_or_zero("inf"), 0.0);
    EXPECT_DOUBLE_EQ(parse_or_zero("-infinity"), 0.0);
    EXPECT_DOUBLE_EQ(parse_or_zero("1e999"), 0.0);
}

TEST(TextParseTest, TrimAndLower) {
    EXPECT_EQ(trim_ascii("  Grand Cherokee \n"), "Grand Cherokee");
    EXPECT_EQ(trim_ascii("   "), "");
    EXPECT_EQ(ascii_lower("RAM 1500"), "ram 1500");
}

TEST(TextParseTest, SplitTokensDropsEmpty) {
    auto tokens = split_tokens("Sport, Rebel,, Laramie ");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "Sport");
    EXPECT_EQ(tokens[1], "Rebel");
    EXPECT_EQ(tokens[2], "Laramie");

    EXPECT_TRUE(split_tokens("").empty());
    EXPECT_TRUE(split_tokens(" , ").empty());
}

TEST(TextParseTest, CaseInsensitiveComparisons) {
    EXPECT_TRUE(contains_ignore_case("Grand Cherokee L", "grand cherokee"));
    EXPECT_FALSE(contains_ignore_case("Cherokee", "Grand Cherokee"));
    EXPECT_TRUE(contains_ignore_case("anything", ""));
    EXPECT_FALSE(contains_ignore_case("", "x"));

    EXPECT_TRUE(equals_ignore_case("JEEP", "Jeep"));
    EXPECT_FALSE(equals_ignore_case("Jeep", "Jeeps"));
}

}  // namespace
}  // namespace dealcalc
