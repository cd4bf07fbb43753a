// Tests for math geometry helpers and the piecewise-linear score curves.

#include "math/Geometry.hpp"

#include <gtest/gtest.h>

using namespace math;

TEST(Geometry, JointAngleRightAngle) {
    EXPECT_NEAR(jointAngleDeg({1, 0, 0}, {0, 0, 0}, {0, 1, 0}), 90.0, 1e-9);
    EXPECT_NEAR(jointAngleDeg({1, 0, 0}, {0, 0, 0}, {-1, 0, 0}), 180.0, 1e-9);
}

TEST(Geometry, JointAngleIgnoresDepth) {
    EXPECT_NEAR(jointAngleDeg({1, 0, 5}, {0, 0, 0}, {0, 1, -3}), 90.0, 1e-9);
}

TEST(Geometry, DegenerateVectorGivesZero) {
    EXPECT_DOUBLE_EQ(angleBetweenDeg({0, 0, 0}, {1, 0, 0}), 0.0);
}

TEST(Geometry, OrientationWrapsToPositive) {
    EXPECT_NEAR(orientationDeg({0, 0, 0}, {1, 0, 0}), 0.0, 1e-9);
    EXPECT_NEAR(orientationDeg({0, 0, 0}, {0, 1, 0}), 90.0, 1e-9);
    EXPECT_NEAR(orientationDeg({0, 0, 0}, {0, -1, 0}), 270.0, 1e-9);
}

TEST(Geometry, AngularDifferenceTakesShortWay) {
    EXPECT_NEAR(angularDifferenceDeg(350.0, 10.0), 20.0, 1e-9);
    EXPECT_NEAR(angularDifferenceDeg(90.0, 270.0), 180.0, 1e-9);
}

TEST(Geometry, MeanAndStddev) {
    const std::vector<double> v = {2, 4, 4, 4, 5, 5, 7, 9};
    EXPECT_NEAR(mean(v), 5.0, 1e-12);
    EXPECT_NEAR(stddev(v), 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(mean({}), 0.0);
    EXPECT_DOUBLE_EQ(stddev({3.0}), 0.0);
}

TEST(Geometry, Distance2DIgnoresDepth) {
    EXPECT_NEAR(distance2D({0, 0, 0}, {3, 4, 10}), 5.0, 1e-12);
    EXPECT_NEAR(distance({0, 0, 0}, {0, 3, 4}), 5.0, 1e-12);
}

TEST(PiecewiseLinear, InterpolatesAndClamps) {
    PiecewiseLinear curve({{0.0, 100.0}, {100.0, 90.0}, {200.0, 70.0}});
    EXPECT_DOUBLE_EQ(curve.evaluate(-5.0), 100.0);
    EXPECT_DOUBLE_EQ(curve.evaluate(50.0), 95.0);
    EXPECT_DOUBLE_EQ(curve.evaluate(150.0), 80.0);
    EXPECT_DOUBLE_EQ(curve.evaluate(1000.0), 70.0);
}

TEST(PiecewiseLinear, RejectsUnsortedKnots) {
    EXPECT_THROW(PiecewiseLinear({{1.0, 0.0}, {1.0, 5.0}}), std::invalid_argument);
    EXPECT_THROW(PiecewiseLinear({{2.0, 0.0}, {1.0, 5.0}}), std::invalid_argument);
}
