// Tests for math::OneEuroFilter and math::PointFilter.

#include "math/Filters.hpp"

#include <gtest/gtest.h>

using math::OneEuroFilter;
using math::PointFilter;

TEST(OneEuroFilter, FirstValuePassesThrough) {
    OneEuroFilter f;
    EXPECT_DOUBLE_EQ(f.filter(0.42, 0.0), 0.42);
}

TEST(OneEuroFilter, ConstantInputStaysConstant) {
    OneEuroFilter f;
    double out = 0.0;
    for (int i = 0; i < 30; ++i) out = f.filter(0.5, i / 30.0);
    EXPECT_NEAR(out, 0.5, 1e-12);
}

TEST(OneEuroFilter, StepIsSmoothedThenConverges) {
    OneEuroFilter f(1.0, 0.0);
    f.filter(0.0, 0.0);

    const double first = f.filter(1.0, 1.0 / 30.0);
    EXPECT_GT(first, 0.0);
    EXPECT_LT(first, 1.0);

    double out = first;
    for (int i = 2; i < 300; ++i) out = f.filter(1.0, i / 30.0);
    EXPECT_NEAR(out, 1.0, 1e-3);
}

TEST(OneEuroFilter, ResetForgetsHistory) {
    OneEuroFilter f;
    f.filter(0.0, 0.0);
    f.filter(0.1, 0.1);
    f.reset();
    EXPECT_DOUBLE_EQ(f.filter(0.9, 0.2), 0.9);
}

TEST(PointFilter, FiltersEachAxis) {
    PointFilter f(1.0, 0.0);
    f.filter(cv::Point3d(0.0, 0.0, 0.0), 0.0);
    const cv::Point3d p = f.filter(cv::Point3d(1.0, -1.0, 0.0), 1.0 / 30.0);

    EXPECT_GT(p.x, 0.0);
    EXPECT_LT(p.x, 1.0);
    EXPECT_NEAR(p.y, -p.x, 1e-12);
    EXPECT_DOUBLE_EQ(p.z, 0.0);
}
