#include "sandcell/utils/string_utils.hpp"

#include <gtest/gtest.h>

using sandcell::utils::StringUtils;

TEST(StringUtilsTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(StringUtils::Trim("  3f4e5d6c7b8a\n"), "3f4e5d6c7b8a");
    EXPECT_EQ(StringUtils::Trim("\t\r\n "), "");
    EXPECT_EQ(StringUtils::Trim(""), "");
}

TEST(StringUtilsTest, SplitSkipsEmptyTokens) {
    auto lines = StringUtils::Split("Unable to find image\n\nabc123\n", '\n');
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "Unable to find image");
    EXPECT_EQ(lines[1], "abc123");
    EXPECT_TRUE(StringUtils::Split("", '\n').empty());
}

TEST(StringUtilsTest, JoinPlacesDelimiterBetweenItems) {
    EXPECT_EQ(StringUtils::Join({"docker", "rm", "--force"}, " "), "docker rm --force");
    EXPECT_EQ(StringUtils::Join({"python3"}, " "), "python3");
    EXPECT_EQ(StringUtils::Join({}, ", "), "");
}

TEST(StringUtilsTest, FirstLineSkipsBlankLines) {
    EXPECT_EQ(StringUtils::FirstLine("\n  \n  Error response from daemon: gone  \nmore"),
              "Error response from daemon: gone");
    EXPECT_EQ(StringUtils::FirstLine("\n\n"), "");
}

TEST(StringUtilsTest, ContainsAnyMatchesOneNeedle) {
    EXPECT_TRUE(StringUtils::ContainsAny("error: no such container: abc", {"no such object", "no such container"}));
    EXPECT_FALSE(StringUtils::ContainsAny("conflict", {"no such object", "no such container"}));
    EXPECT_FALSE(StringUtils::ContainsAny("anything", {}));
}

TEST(StringUtilsTest, StartsWithAndToLower) {
    EXPECT_TRUE(StringUtils::StartsWith("/tmp/work", "/"));
    EXPECT_FALSE(StringUtils::StartsWith("tmp", "/tmp"));
    EXPECT_EQ(StringUtils::ToLower("Cannot Connect"), "cannot connect");
}

TEST(StringUtilsTest, TruncateKeepsSuffixWithinLimit) {
    EXPECT_EQ(StringUtils::Truncate("print('hello world')", 10), "print(...");
    EXPECT_EQ(StringUtils::Truncate("short", 10), "short");
    EXPECT_EQ(StringUtils::Truncate("abcdef", 2), "ab");
}
