/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string utility functions
 */

#include <gtest/gtest.h>
#include <fluentval/utils/string_utils.h>

using namespace fluentval::utils;

class StringUtilsTest : public ::testing::Test {
};

// toLower / toUpper
TEST_F(StringUtilsTest, ToLower_Mixed) {
    EXPECT_EQ(toLower("HeLLo WoRLd"), "hello world");
}

TEST_F(StringUtilsTest, ToLower_Empty) {
    EXPECT_EQ(toLower(""), "");
}

TEST_F(StringUtilsTest, ToUpper_WithNumbers) {
    EXPECT_EQ(toUpper("test123"), "TEST123");
}

// trim
TEST_F(StringUtilsTest, Trim_BothEnds) {
    EXPECT_EQ(trim("   hello   "), "hello");
}

TEST_F(StringUtilsTest, Trim_OnlySpaces) {
    EXPECT_EQ(trim("     "), "");
}

TEST_F(StringUtilsTest, Trim_TabsAndNewlines) {
    EXPECT_EQ(trim("\t\nhello\n\t"), "hello");
}

// split / join
TEST_F(StringUtilsTest, Split_CommaDelimiter) {
    auto result = split("a,b,c", ',');
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "b");
    EXPECT_EQ(result[2], "c");
}

TEST_F(StringUtilsTest, Split_EmptyString) {
    auto result = split("", ',');
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], "");
}

TEST_F(StringUtilsTest, Split_TrailingDelimiter) {
    auto result = split("a,b,", ',');
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[2], "");
}

TEST_F(StringUtilsTest, Join_RoundTripsSplit) {
    EXPECT_EQ(join(split("x;y;;z", ';'), ";"), "x;y;;z");
}

TEST_F(StringUtilsTest, Join_Empty) {
    EXPECT_EQ(join({}, ", "), "");
}

// startsWith / endsWith
TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(startsWith("Forename", "Fore"));
    EXPECT_FALSE(startsWith("Fore", "Forename"));
}

TEST_F(StringUtilsTest, EndsWith) {
    EXPECT_TRUE(endsWith("Forename", "name"));
    EXPECT_FALSE(endsWith("name", "Forename"));
}

// replaceAll
TEST_F(StringUtilsTest, ReplaceAll_Multiple) {
    EXPECT_EQ(replaceAll("{A} and {A}", "{A}", "x"), "x and x");
}

TEST_F(StringUtilsTest, ReplaceAll_EmptyPattern) {
    EXPECT_EQ(replaceAll("abc", "", "x"), "abc");
}

TEST_F(StringUtilsTest, ReplaceAll_ReplacementContainsPattern) {
    EXPECT_EQ(replaceAll("aa", "a", "aa"), "aaaa");
}

// splitPascalCase
TEST_F(StringUtilsTest, SplitPascalCase_SingleWord) {
    EXPECT_EQ(splitPascalCase("Forename"), "Forename");
}

TEST_F(StringUtilsTest, SplitPascalCase_TwoWords) {
    EXPECT_EQ(splitPascalCase("NullableInt"), "Nullable Int");
}

TEST_F(StringUtilsTest, SplitPascalCase_Acronym) {
    EXPECT_EQ(splitPascalCase("HTTPServer"), "HTTP Server");
}

TEST_F(StringUtilsTest, SplitPascalCase_Digits) {
    EXPECT_EQ(splitPascalCase("Line1Text"), "Line1 Text");
}

TEST_F(StringUtilsTest, SplitPascalCase_AlreadySpaced) {
    EXPECT_EQ(splitPascalCase("First Name"), "First Name");
}

TEST_F(StringUtilsTest, SplitPascalCase_Empty) {
    EXPECT_EQ(splitPascalCase(""), "");
}

// Ordinal comparison
TEST_F(StringUtilsTest, CompareOrdinal_EmbeddedNul) {
    std::string withNul("a\0", 2);
    EXPECT_LT(compareOrdinal("a", withNul), 0);
    EXPECT_GT(compareOrdinal(withNul, "a"), 0);
}

TEST_F(StringUtilsTest, CompareOrdinal_CaseSensitive) {
    EXPECT_LT(compareOrdinal("FOO", "foo"), 0);
    EXPECT_EQ(compareOrdinal("foo", "foo"), 0);
}

TEST_F(StringUtilsTest, CompareOrdinalIgnoreCase) {
    EXPECT_EQ(compareOrdinalIgnoreCase("FOO", "foo"), 0);
    EXPECT_LT(compareOrdinalIgnoreCase("abc", "ABD"), 0);
    EXPECT_GT(compareOrdinalIgnoreCase("abcd", "ABC"), 0);
}

TEST_F(StringUtilsTest, EqualsIgnoreCase) {
    EXPECT_TRUE(equalsIgnoreCase("Foo", "fOO"));
    EXPECT_FALSE(equalsIgnoreCase("Foo", "Foo "));
}
