#include "glob_pattern.hpp"
#include <gtest/gtest.h>

namespace cachex {

TEST(GlobPatternTest, StarAndQuestionBecomeLike) {
    auto p = glob_to_sql("user:*:name?");
    EXPECT_FALSE(p.regex);
    EXPECT_STREQ(p.op(), "LIKE");
    EXPECT_EQ(p.pattern, "user:%:name_");
}

TEST(GlobPatternTest, LikeWildcardsInKeysAreLiteral) {
    auto p = glob_to_sql("100%_done*");
    EXPECT_FALSE(p.regex);
    EXPECT_EQ(p.pattern, "100\\%\\_done%");
}

TEST(GlobPatternTest, BackslashIsLiteral) {
    EXPECT_EQ(glob_to_sql("a\\b").pattern, "a\\\\b");
    EXPECT_EQ(glob_to_sql("a\\[b]").pattern, "^a\\\\[b]$");
}

TEST(GlobPatternTest, BracketClassSwitchesToRegex) {
    auto p = glob_to_sql("key[12]*");
    EXPECT_TRUE(p.regex);
    EXPECT_STREQ(p.op(), "~");
    EXPECT_EQ(p.pattern, "^key[12].*$");
}

TEST(GlobPatternTest, RegexEscapesMetacharacters) {
    EXPECT_EQ(glob_to_sql("a.b[xy]?").pattern, "^a\\.b[xy].$");
    EXPECT_EQ(glob_to_sql("(x)[ab]+").pattern, "^\\(x\\)[ab]\\+$");
}

TEST(GlobPatternTest, NegatedAndLeadingBracketClass) {
    EXPECT_EQ(glob_to_sql("h[^e]llo").pattern, "^h[^e]llo$");
    EXPECT_EQ(glob_to_sql("[]a]").pattern, "^[]a]$");
}

TEST(GlobPatternTest, UnterminatedClassIsLiteral) {
    EXPECT_EQ(glob_to_sql("a[bc").pattern, "^a\\[bc$");
}

TEST(GlobPatternTest, PlainTextMatchesExactly) {
    auto p = glob_to_sql("session");
    EXPECT_FALSE(p.regex);
    EXPECT_EQ(p.pattern, "session");
}

} // namespace cachex
