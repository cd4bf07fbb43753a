#include "math/Geometry.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace math {

cv::Point3d midpoint(const cv::Point3d& a, const cv::Point3d& b) {
    return (a + b) * 0.5;
}

double distance(const cv::Point3d& a, const cv::Point3d& b) {
    return cv::norm(a - b);
}

double distance2D(const cv::Point3d& a, const cv::Point3d& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

double angleBetweenDeg(const cv::Point3d& u, const cv::Point3d& v) {
    const double nu = cv::norm(u);
    const double nv = cv::norm(v);
    if (nu < 1e-9 || nv < 1e-9) return 0.0;

    double c = u.dot(v) / (nu * nv);
    c = std::clamp(c, -1.0, 1.0);
    return std::acos(c) * 180.0 / M_PI;
}

double jointAngleDeg(const cv::Point3d& a, const cv::Point3d& vertex, const cv::Point3d& c) {
    cv::Point3d u(a.x - vertex.x, a.y - vertex.y, 0.0);
    cv::Point3d v(c.x - vertex.x, c.y - vertex.y, 0.0);
    return angleBetweenDeg(u, v);
}

double orientationDeg(const cv::Point3d& from, const cv::Point3d& to) {
    double deg = std::atan2(to.y - from.y, to.x - from.x) * 180.0 / M_PI;
    if (deg < 0.0) deg += 360.0;
    return deg;
}

double angularDifferenceDeg(double a, double b) {
    double d = std::fmod(std::abs(a - b), 360.0);
    return d > 180.0 ? 360.0 - d : d;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    cv::Scalar m = cv::mean(cv::Mat(values));
    return m[0];
}

double stddev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    cv::Scalar m, s;
    cv::meanStdDev(cv::Mat(values), m, s);
    return s[0];
}

PiecewiseLinear::PiecewiseLinear(std::vector<std::pair<double, double>> knots)
    : knots_(std::move(knots)) {
    for (size_t i = 1; i < knots_.size(); ++i) {
        if (!(knots_[i].first > knots_[i - 1].first)) {
            throw std::invalid_argument("PiecewiseLinear knots must be strictly increasing in x");
        }
    }
}

double PiecewiseLinear::evaluate(double x) const {
    if (knots_.empty()) return 0.0;
    if (x <= knots_.front().first) return knots_.front().second;
    if (x >= knots_.back().first) return knots_.back().second;

    for (size_t i = 1; i < knots_.size(); ++i) {
        const auto& [x1, y1] = knots_[i];
        if (x <= x1) {
            const auto& [x0, y0] = knots_[i - 1];
            const double t = (x - x0) / (x1 - x0);
            return y0 + t * (y1 - y0);
        }
    }
    return knots_.back().second;
}

} // namespace math
