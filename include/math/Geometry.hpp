#pragma once

#include <utility>
#include <vector>
#include <opencv2/core.hpp>

namespace math {

// ═══════════════════════════════════════════════════════════
// Geometry helpers on normalized image coordinates
// (x right, y down, z towards the camera when present)
// ═══════════════════════════════════════════════════════════

[[nodiscard]] cv::Point3d midpoint(const cv::Point3d& a, const cv::Point3d& b);

[[nodiscard]] double distance(const cv::Point3d& a, const cv::Point3d& b);
[[nodiscard]] double distance2D(const cv::Point3d& a, const cv::Point3d& b);

/**
 * Angle between two vectors in degrees, [0, 180].
 * Returns 0 when either vector is degenerate.
 */
[[nodiscard]] double angleBetweenDeg(const cv::Point3d& u, const cv::Point3d& v);

/**
 * Interior angle at `vertex` formed by a-vertex-c in the image plane, degrees.
 */
[[nodiscard]] double jointAngleDeg(const cv::Point3d& a, const cv::Point3d& vertex, const cv::Point3d& c);

/**
 * Direction of the segment from -> to in the image plane, degrees in [0, 360).
 */
[[nodiscard]] double orientationDeg(const cv::Point3d& from, const cv::Point3d& to);

/**
 * Smallest absolute difference between two orientations, [0, 180].
 */
[[nodiscard]] double angularDifferenceDeg(double a, double b);

[[nodiscard]] double mean(const std::vector<double>& values);

/**
 * Population standard deviation (cv::meanStdDev); 0 for fewer than 2 values.
 */
[[nodiscard]] double stddev(const std::vector<double>& values);

/**
 * Piecewise-linear curve through (x, y) knots sorted by x.
 * Values outside the knot range clamp to the end knots.
 */
class PiecewiseLinear {
public:
    PiecewiseLinear() = default;
    explicit PiecewiseLinear(std::vector<std::pair<double, double>> knots);

    [[nodiscard]] double evaluate(double x) const;
    [[nodiscard]] const std::vector<std::pair<double, double>>& knots() const { return knots_; }
    [[nodiscard]] bool empty() const { return knots_.empty(); }

private:
    std::vector<std::pair<double, double>> knots_;
};

} // namespace math
