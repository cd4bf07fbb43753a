// Tests for scoring::BucketTable -- boundaries, ordering and validation.

#include "scoring/BucketTable.hpp"

#include <gtest/gtest.h>

using namespace scoring;

TEST(BucketTable, GenericBoundariesGoToBetterBucket) {
    const auto t = BucketTable::generic();
    EXPECT_EQ(t.lookup(100.0), "excellent");
    EXPECT_EQ(t.lookup(75.0), "excellent");
    EXPECT_EQ(t.lookup(74.99), "good");
    EXPECT_EQ(t.lookup(60.0), "good");
    EXPECT_EQ(t.lookup(45.0), "medium");
    EXPECT_EQ(t.lookup(44.9), "poor");
    EXPECT_EQ(t.lookup(0.0), "poor");
}

TEST(BucketTable, RankIsMonotonicInScore) {
    const auto t = BucketTable::generic();
    size_t previous = t.rank(0.0);
    for (double v = 0.0; v <= 100.0; v += 0.5) {
        const size_t r = t.rank(v);
        EXPECT_LE(r, previous) << "at " << v;
        previous = r;
    }
    EXPECT_EQ(t.rank(100.0), 0u);
}

TEST(BucketTable, LowerIsBetterTable) {
    BucketTable t("deviation", BucketOrder::LowerIsBetter, {
        {5.0, "excellent"}, {15.0, "good"}, {25.0, "medium"}, {0.0, "poor"},
    });
    EXPECT_EQ(t.lookup(0.0), "excellent");
    EXPECT_EQ(t.lookup(5.0), "excellent");
    EXPECT_EQ(t.lookup(5.01), "good");
    EXPECT_EQ(t.lookup(25.0), "medium");
    EXPECT_EQ(t.lookup(90.0), "poor");
    EXPECT_EQ(t.rank(90.0), 3u);
    EXPECT_EQ(t.axis(), "deviation");
}

TEST(BucketTable, TopLevel) {
    const auto t = BucketTable::generic();
    EXPECT_TRUE(t.isTopLevel("excellent"));
    EXPECT_FALSE(t.isTopLevel("good"));
}

TEST(BucketTable, SingleBucketCatchesEverything) {
    BucketTable t("score", BucketOrder::HigherIsBetter, {{50.0, "only"}});
    EXPECT_EQ(t.lookup(-10.0), "only");
    EXPECT_EQ(t.lookup(1e9), "only");
}

TEST(BucketTable, RejectsEmptyOrUnorderedTables) {
    EXPECT_THROW(BucketTable("score", BucketOrder::HigherIsBetter, {}), std::invalid_argument);
    EXPECT_THROW(BucketTable("score", BucketOrder::HigherIsBetter,
                             {{60.0, "good"}, {75.0, "excellent"}, {0.0, "poor"}}),
                 std::invalid_argument);
    EXPECT_THROW(BucketTable("deviation", BucketOrder::LowerIsBetter,
                             {{5.0, "a"}, {5.0, "b"}, {0.0, "c"}}),
                 std::invalid_argument);
}
