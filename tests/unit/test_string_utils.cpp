#include <gtest/gtest.h>
#include "utils/string_utils.h"

using namespace monthclose::utils;

TEST(StringUtilsTest, ToLower) {
    EXPECT_EQ(to_lower("HELLO"), "hello");
    EXPECT_EQ(to_lower("Serie 1"), "serie 1");
    EXPECT_EQ(to_lower(""), "");
}

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(trim("  hello  "), "hello");
    EXPECT_EQ(trim("hello"), "hello");
    EXPECT_EQ(trim("  "), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("\t\n hello \t\n"), "hello");
}

TEST(StringUtilsTest, Split) {
    auto parts = split("a,b,c", ',');
    ASSERT_EQ(parts.size(), 3);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(parts[2], "c");

    parts = split("no-delimiter", ',');
    ASSERT_EQ(parts.size(), 1);
    EXPECT_EQ(parts[0], "no-delimiter");

    parts = split("", ',');
    EXPECT_TRUE(parts.empty());
}

TEST(StringUtilsTest, Join) {
    std::vector<std::string> parts = {"a", "b", "c"};
    EXPECT_EQ(join(parts, ","), "a,b,c");
    EXPECT_EQ(join(parts, "\n"), "a\nb\nc");

    std::vector<std::string> empty;
    EXPECT_EQ(join(empty, ","), "");

    std::vector<std::string> single = {"only"};
    EXPECT_EQ(join(single, ","), "only");
}

TEST(StringUtilsTest, ParseBool) {
    EXPECT_EQ(parse_bool("true"), true);
    EXPECT_EQ(parse_bool(" Yes "), true);
    EXPECT_EQ(parse_bool("1"), true);
    EXPECT_EQ(parse_bool("on"), true);
    EXPECT_EQ(parse_bool("FALSE"), false);
    EXPECT_EQ(parse_bool("0"), false);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
    EXPECT_FALSE(parse_bool("").has_value());
}

TEST(StringUtilsTest, FormatDuration) {
    EXPECT_EQ(format_duration(0), "0 ms");
    EXPECT_EQ(format_duration(850), "850 ms");
    EXPECT_EQ(format_duration(12400), "12.4 s");
    EXPECT_EQ(format_duration(185000), "3m 05s");
}

TEST(StringUtilsTest, ReplaceAll) {
    EXPECT_EQ(replace_all("a\"b\"c", "\"", "\\\""), "a\\\"b\\\"c");
    EXPECT_EQ(replace_all("aaa", "a", "aa"), "aaaaaa");
    EXPECT_EQ(replace_all("abc", "", "x"), "abc");
}
