#include "codebox/utils/string_utils.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using codebox::utils::StringUtils;

TEST(StringUtilsTest, TrimAndLower) {
    EXPECT_EQ(StringUtils::Trim("  hello \n\t"), "hello");
    EXPECT_EQ(StringUtils::Trim(" \n "), "");
    EXPECT_EQ(StringUtils::ToLower("Cannot CONNECT"), "cannot connect");
}

TEST(StringUtilsTest, JoinAndReplace) {
    EXPECT_EQ(StringUtils::Join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(StringUtils::Join({}, ","), "");
    EXPECT_EQ(StringUtils::ReplaceAll("{x} and {x}", "{x}", "y"), "y and y");
    EXPECT_EQ(StringUtils::ReplaceAll("abc", "", "z"), "abc");
}

TEST(StringUtilsTest, ShellQuoteLeavesSafeWordsAlone) {
    EXPECT_EQ(StringUtils::ShellQuote("requests==2.31.0"), "requests==2.31.0");
    EXPECT_EQ(StringUtils::ShellQuote("@types/node"), "@types/node");
    EXPECT_EQ(StringUtils::ShellQuote("github.com/pkg/errors@v0.9.1"), "github.com/pkg/errors@v0.9.1");
}

TEST(StringUtilsTest, ShellQuoteEscapesMetacharacters) {
    EXPECT_EQ(StringUtils::ShellQuote(""), "''");
    EXPECT_EQ(StringUtils::ShellQuote("a b"), "'a b'");
    EXPECT_EQ(StringUtils::ShellQuote("x; rm -rf /"), "'x; rm -rf /'");
    EXPECT_EQ(StringUtils::ShellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(StringUtils::ShellQuote("$(id)"), "'$(id)'");
}

TEST(StringUtilsTest, ShellJoin) {
    EXPECT_EQ(StringUtils::ShellJoin({"lodash", "left pad"}), "lodash 'left pad'");
    EXPECT_EQ(StringUtils::ShellJoin({}), "");
}

TEST(StringUtilsTest, Truncate) {
    EXPECT_EQ(StringUtils::Truncate("short", 10), "short");
    EXPECT_EQ(StringUtils::Truncate("0123456789", 8), "01234...");
    EXPECT_EQ(StringUtils::Truncate("0123456789", 2), "..");
}

}  // namespace
