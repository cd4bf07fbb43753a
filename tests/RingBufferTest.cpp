// Tests for core::RingBuffer -- overwrite-oldest semantics.

#include "core/RingBuffer.hpp"

#include <gtest/gtest.h>

using core::RingBuffer;

TEST(RingBuffer, ZeroCapacityRejected) {
    EXPECT_THROW(RingBuffer<int>(0), std::invalid_argument);
}

TEST(RingBuffer, FillsInOrder) {
    RingBuffer<int> rb(4);
    EXPECT_TRUE(rb.empty());

    EXPECT_FALSE(rb.push(1));
    EXPECT_FALSE(rb.push(2));
    EXPECT_FALSE(rb.push(3));

    ASSERT_EQ(rb.size(), 3u);
    EXPECT_EQ(rb.front(), 1);
    EXPECT_EQ(rb.back(), 3);
    EXPECT_EQ(rb[1], 2);
    EXPECT_FALSE(rb.full());
}

TEST(RingBuffer, EvictsOldestWhenFull) {
    RingBuffer<int> rb(3);
    for (int i = 0; i < 3; ++i) rb.push(i);
    EXPECT_TRUE(rb.full());

    EXPECT_TRUE(rb.push(3));
    EXPECT_TRUE(rb.push(4));

    ASSERT_EQ(rb.size(), 3u);
    EXPECT_EQ(rb.evicted(), 2u);
    EXPECT_EQ(rb.toVector(), (std::vector<int>{2, 3, 4}));
}

TEST(RingBuffer, WrapsManyTimes) {
    RingBuffer<int> rb(5);
    for (int i = 0; i < 103; ++i) rb.push(i);

    ASSERT_EQ(rb.size(), 5u);
    for (size_t i = 0; i < rb.size(); ++i) {
        EXPECT_EQ(rb[i], 98 + static_cast<int>(i));
    }
}

TEST(RingBuffer, ClearKeepsCapacity) {
    RingBuffer<int> rb(2);
    rb.push(7);
    rb.push(8);
    rb.clear();

    EXPECT_TRUE(rb.empty());
    EXPECT_EQ(rb.capacity(), 2u);
    rb.push(9);
    EXPECT_EQ(rb.front(), 9);
}
