#include "list_index.hpp"
#include <limits>
#include <gtest/gtest.h>

namespace cachex {

TEST(ListIndexTest, ResolvesPositiveAndNegative) {
    EXPECT_EQ(resolve_list_index(0, 3), 0u);
    EXPECT_EQ(resolve_list_index(2, 3), 2u);
    EXPECT_EQ(resolve_list_index(-1, 3), 2u);
    EXPECT_EQ(resolve_list_index(-3, 3), 0u);
}

TEST(ListIndexTest, OutOfRangeIsNullopt) {
    EXPECT_FALSE(resolve_list_index(3, 3));
    EXPECT_FALSE(resolve_list_index(-4, 3));
    EXPECT_FALSE(resolve_list_index(0, 0));
}

// For every i in [-n, n), lindex(i) is lrange(i, i)[0]
TEST(ListIndexTest, IndexAgreesWithSingleElementRange) {
    const size_t n = 5;
    for (int64_t i = -static_cast<int64_t>(n); i < static_cast<int64_t>(n); i++) {
        auto idx = resolve_list_index(i, n);
        auto range = normalize_range(i, i, n);
        ASSERT_TRUE(idx);
        ASSERT_TRUE(range);
        EXPECT_EQ(range->first, *idx);
        EXPECT_EQ(range->second, *idx);
    }
}

TEST(ListIndexTest, RangeClampsToList) {
    auto r = normalize_range(-100, 100, 4);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->first, 0u);
    EXPECT_EQ(r->second, 3u);

    r = normalize_range(0, -1, 4);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->second, 3u);
}

TEST(ListIndexTest, EmptyWindows) {
    EXPECT_FALSE(normalize_range(0, -1, 0));
    EXPECT_FALSE(normalize_range(3, 1, 5));
    EXPECT_FALSE(normalize_range(5, 10, 5));
    EXPECT_FALSE(normalize_range(0, -6, 5));
}

TEST(ListIndexTest, LposFirstMatch) {
    std::vector<bool> m = {false, true, false, true, true};
    EXPECT_EQ(lpos_select(m, {}, 1), (std::vector<int64_t>{1}));
    EXPECT_EQ(lpos_select(m, {}, 0), (std::vector<int64_t>{1, 3, 4}));
}

TEST(ListIndexTest, LposRank) {
    std::vector<bool> m = {true, false, true, false, true};
    LposOptions second;
    second.rank = 2;
    EXPECT_EQ(lpos_select(m, second, 1), (std::vector<int64_t>{2}));

    LposOptions last;
    last.rank = -1;
    EXPECT_EQ(lpos_select(m, last, 0), (std::vector<int64_t>{4, 2, 0}));

    LposOptions too_far;
    too_far.rank = 4;
    EXPECT_TRUE(lpos_select(m, too_far, 1).empty());
}

TEST(ListIndexTest, LposMaxlen) {
    std::vector<bool> m = {false, false, true, true};
    LposOptions head;
    head.maxlen = 2;
    EXPECT_TRUE(lpos_select(m, head, 0).empty());

    LposOptions tail;
    tail.rank = -1;
    tail.maxlen = 1;
    EXPECT_EQ(lpos_select(m, tail, 0), (std::vector<int64_t>{3}));

    LposOptions unlimited;
    unlimited.maxlen = 0;
    EXPECT_EQ(lpos_select(m, unlimited, 0).size(), 2u);
}

TEST(ListIndexTest, LposExtremeRanks) {
    std::vector<bool> m = {true, true, true};
    LposOptions lowest;
    lowest.rank = std::numeric_limits<int64_t>::min();
    EXPECT_TRUE(lpos_select(m, lowest, 0).empty());

    LposOptions highest;
    highest.rank = std::numeric_limits<int64_t>::max();
    EXPECT_TRUE(lpos_select(m, highest, 0).empty());
}

} // namespace cachex
