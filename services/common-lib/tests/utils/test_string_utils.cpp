/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string utility functions
 */

#include <gtest/gtest.h>
#include <registry/utils/string_utils.h>

using namespace registry::utils;

class StringUtilsTest : public ::testing::Test {
protected:
    // Test setup if needed
};

// toLower tests
TEST_F(StringUtilsTest, ToLower_Mixed) {
    EXPECT_EQ(toLower("HeLLo WoRLd"), "hello world");
}

TEST_F(StringUtilsTest, ToLower_Empty) {
    EXPECT_EQ(toLower(""), "");
}

TEST_F(StringUtilsTest, ToLower_WithNumbers) {
    EXPECT_EQ(toLower("Test123"), "test123");
}

// toUpper tests
TEST_F(StringUtilsTest, ToUpper_Mixed) {
    EXPECT_EQ(toUpper("gOld"), "GOLD");
}

TEST_F(StringUtilsTest, ToUpper_Empty) {
    EXPECT_EQ(toUpper(""), "");
}

TEST_F(StringUtilsTest, ToUpper_SymbolsUnchanged) {
    EXPECT_EQ(toUpper("btc-2x"), "BTC-2X");
}

// trim tests
TEST_F(StringUtilsTest, Trim_BothEnds) {
    EXPECT_EQ(trim("  desc  "), "desc");
}

TEST_F(StringUtilsTest, Trim_NoSpaces) {
    EXPECT_EQ(trim("asc"), "asc");
}

TEST_F(StringUtilsTest, Trim_OnlySpaces) {
    EXPECT_EQ(trim("     "), "");
}

TEST_F(StringUtilsTest, Trim_Empty) {
    EXPECT_EQ(trim(""), "");
}

TEST_F(StringUtilsTest, Trim_TabsAndNewlines) {
    EXPECT_EQ(trim("\t\nname\r\n"), "name");
}

TEST_F(StringUtilsTest, Trim_InnerSpacesKept) {
    EXPECT_EQ(trim(" Gold Bar "), "Gold Bar");
}

// containsWhitespace tests
TEST_F(StringUtilsTest, ContainsWhitespace_Space) {
    EXPECT_TRUE(containsWhitespace("GO LD"));
}

TEST_F(StringUtilsTest, ContainsWhitespace_TabAndNewline) {
    EXPECT_TRUE(containsWhitespace("GOLD\t"));
    EXPECT_TRUE(containsWhitespace("\nGOLD"));
}

TEST_F(StringUtilsTest, ContainsWhitespace_None) {
    EXPECT_FALSE(containsWhitespace("GOLD"));
    EXPECT_FALSE(containsWhitespace(""));
}
