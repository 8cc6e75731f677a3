/*
 * ============================================================================
 * PromptShield String Utilities Unit Tests
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * ============================================================================
 */

#include <gtest/gtest.h>
#include "../../../src/Utils/StringUtils.hpp"
#include <string>
#include <vector>

using namespace PromptShield::Utils::StringUtils;

class StringUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
    }

    void TearDown() override {
    }
};

// ============================================================================
// Case / Trim
// ============================================================================

TEST_F(StringUtilsTest, ToLower_AsciiOnly) {
    EXPECT_EQ(ToLowerCopy("IGNORE All Previous"), "ignore all previous");

    std::string s = "MiXeD \xC3\x89";
    ToLower(s);
    EXPECT_EQ(s, "mixed \xC3\x89");
}

TEST_F(StringUtilsTest, Trim_Whitespace) {
    EXPECT_EQ(TrimView("  \t hello \r\n"), "hello");
    EXPECT_EQ(TrimCopy("\n\n"), "");
    EXPECT_EQ(TrimCopy(""), "");
    EXPECT_TRUE(IsSpace('\v'));
    EXPECT_FALSE(IsSpace('x'));
}

// ============================================================================
// Comparison / Search
// ============================================================================

TEST_F(StringUtilsTest, IEquals) {
    EXPECT_TRUE(IEquals("System", "SYSTEM"));
    EXPECT_FALSE(IEquals("System", "Systems"));
    EXPECT_TRUE(IEquals("", ""));
}

TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(StartsWith("promptshield", "prompt"));
    EXPECT_FALSE(StartsWith("prompt", "promptshield"));
    EXPECT_TRUE(StartsWith("x", ""));
}

TEST_F(StringUtilsTest, IContainsAndIFind) {
    EXPECT_TRUE(IContains("Please IGNORE this", "ignore"));
    EXPECT_FALSE(IContains("Please proceed", "ignore"));
    EXPECT_EQ(IFind("abcABC", "abc", 1), 3u);
    EXPECT_EQ(IFind("abc", "zzz"), std::string_view::npos);
}

// ============================================================================
// Split / Join
// ============================================================================

TEST_F(StringUtilsTest, Split_KeepsEmptyFields) {
    const auto parts = Split("a,,b,", ",");
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
    EXPECT_EQ(parts[3], "");
}

TEST_F(StringUtilsTest, Split_EmptyDelimiter) {
    const auto parts = Split("abc", "");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], "abc");
}

TEST_F(StringUtilsTest, Join) {
    EXPECT_EQ(Join({ "a", "b", "c" }, ", "), "a, b, c");
    EXPECT_EQ(Join({}, ","), "");
}

// ============================================================================
// UTF-8
// ============================================================================

TEST_F(StringUtilsTest, IsValidUtf8) {
    EXPECT_TRUE(IsValidUtf8("plain ascii"));
    EXPECT_TRUE(IsValidUtf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"));
    EXPECT_FALSE(IsValidUtf8("\xC3"));
    EXPECT_FALSE(IsValidUtf8("\xFF\xFE"));
    EXPECT_FALSE(IsValidUtf8("\xC0\xAF"));
}

TEST_F(StringUtilsTest, TruncateUtf8_DoesNotSplitSequence) {
    const std::string s = "ab\xE2\x82\xAC";
    EXPECT_EQ(TruncateUtf8(s, 10), s);
    EXPECT_EQ(TruncateUtf8(s, 4), "ab");
    EXPECT_EQ(TruncateUtf8(s, 2), "ab");
    EXPECT_EQ(TruncateUtf8(s, 0), "");
}

TEST_F(StringUtilsTest, PercentDecode) {
    const auto decoded = PercentDecode("ignore%20all%20previous");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "ignore all previous");

    EXPECT_EQ(PercentDecode("a+b").value_or(""), "a+b");
    EXPECT_FALSE(PercentDecode("100%").has_value());
    EXPECT_FALSE(PercentDecode("%zz").has_value());
    EXPECT_FALSE(PercentDecode("%FF").has_value());
}

// ============================================================================
// Parsing
// ============================================================================

TEST_F(StringUtilsTest, ParseBool) {
    EXPECT_EQ(ParseBool("true"), true);
    EXPECT_EQ(ParseBool(" TRUE "), true);
    EXPECT_EQ(ParseBool("1"), true);
    EXPECT_EQ(ParseBool("off"), false);
    EXPECT_EQ(ParseBool("No"), false);
    EXPECT_FALSE(ParseBool("maybe").has_value());
    EXPECT_FALSE(ParseBool("").has_value());
}

TEST_F(StringUtilsTest, ParseInt) {
    EXPECT_EQ(ParseInt("42"), 42);
    EXPECT_EQ(ParseInt(" -7 "), -7);
    EXPECT_FALSE(ParseInt("12abc").has_value());
    EXPECT_FALSE(ParseInt("").has_value());
    EXPECT_FALSE(ParseInt("99999999999999999999999").has_value());
}
