#include "zset_rules.hpp"
#include <cmath>
#include <gtest/gtest.h>

namespace cachex {

TEST(ZAddRulesTest, NewMemberInserted) {
    auto d = decide_zadd(std::nullopt, 1.0, {});
    EXPECT_EQ(d.action, ZAddAction::INSERT);
    EXPECT_TRUE(d.counted);
}

TEST(ZAddRulesTest, XxSkipsNewMember) {
    ZAddFlags f;
    f.xx = true;
    EXPECT_EQ(decide_zadd(std::nullopt, 1.0, f).action, ZAddAction::SKIP);
    auto d = decide_zadd(1.0, 2.0, f);
    EXPECT_EQ(d.action, ZAddAction::UPDATE);
    EXPECT_FALSE(d.counted);
}

TEST(ZAddRulesTest, NxSkipsExistingMember) {
    ZAddFlags f;
    f.nx = true;
    EXPECT_EQ(decide_zadd(1.0, 5.0, f).action, ZAddAction::SKIP);
    EXPECT_EQ(decide_zadd(std::nullopt, 5.0, f).action, ZAddAction::INSERT);
}

TEST(ZAddRulesTest, GtOnlyRaises) {
    ZAddFlags f;
    f.gt = true;
    f.ch = true;
    EXPECT_EQ(decide_zadd(5.0, 3.0, f).action, ZAddAction::SKIP);
    auto d = decide_zadd(5.0, 7.0, f);
    EXPECT_EQ(d.action, ZAddAction::UPDATE);
    EXPECT_TRUE(d.counted);
    // New members are still added under GT
    EXPECT_EQ(decide_zadd(std::nullopt, 1.0, f).action, ZAddAction::INSERT);
}

TEST(ZAddRulesTest, LtOnlyLowers) {
    ZAddFlags f;
    f.lt = true;
    EXPECT_EQ(decide_zadd(5.0, 7.0, f).action, ZAddAction::SKIP);
    EXPECT_EQ(decide_zadd(5.0, 3.0, f).action, ZAddAction::UPDATE);
}

TEST(ZAddRulesTest, ChCountsOnlyRealChanges) {
    ZAddFlags f;
    f.ch = true;
    EXPECT_FALSE(decide_zadd(2.0, 2.0, f).counted);
    EXPECT_TRUE(decide_zadd(2.0, 2.5, f).counted);
    EXPECT_FALSE(decide_zadd(2.0, 2.5, {}).counted);
}

TEST(ScoreBoundTest, ParsesInfinities) {
    EXPECT_TRUE(std::isinf(ScoreBound::parse("-inf").value));
    EXPECT_LT(ScoreBound::parse("-inf").value, 0);
    EXPECT_GT(ScoreBound::parse("+inf").value, 0);
    EXPECT_TRUE(std::isinf(ScoreBound::parse("inf").value));
}

TEST(ScoreBoundTest, ParsesExclusive) {
    ScoreBound b("(1.5");
    EXPECT_DOUBLE_EQ(b.value, 1.5);
    EXPECT_FALSE(b.inclusive);
    EXPECT_STREQ(b.lower_op(), ">");
    EXPECT_STREQ(b.upper_op(), "<");

    ScoreBound c(std::string("3"));
    EXPECT_TRUE(c.inclusive);
    EXPECT_STREQ(c.lower_op(), ">=");
}

TEST(ScoreBoundTest, RejectsGarbage) {
    EXPECT_THROW(ScoreBound::parse("abc"), CacheError);
    EXPECT_THROW(ScoreBound::parse("("), CacheError);
    EXPECT_THROW(ScoreBound::parse("1.5x"), CacheError);
}

} // namespace cachex
