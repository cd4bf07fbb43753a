#include "math/Filters.hpp"
#include <cmath>

namespace math {

OneEuroFilter::OneEuroFilter(double minCutoff, double beta, double dCutoff)
    : _minCutoff(minCutoff), _beta(beta), _dCutoff(dCutoff) {
    reset();
}

double OneEuroFilter::filter(double value, double timestamp) {
    if (_lastTimestamp != -1.0 && timestamp != -1.0) {
        double dt = timestamp - _lastTimestamp;
        if (dt > 0) {
            // Compute the filtered derivative of the signal.
            double dx = (value - _xFilter.s) / dt;
            double edx = _dxFilter.filter(dx, alpha(_dCutoff, dt));

            // Use the result to update the cutoff frequency for the main filter.
            double cutoff = _minCutoff + _beta * std::abs(edx);

            // Filter the signal using the variable cutoff frequency.
            double result = _xFilter.filter(value, alpha(cutoff, dt));

            _lastTimestamp = timestamp;
            return result;
        }
    }

    _lastTimestamp = timestamp;
    // If first time or invalid dt, just set the value
    return _xFilter.filter(value, 1.0);
}

void OneEuroFilter::reset() {
    _xFilter.reset();
    _dxFilter.reset();
    _lastTimestamp = -1.0;
}

PointFilter::PointFilter(double minCutoff, double beta)
    : _x(minCutoff, beta), _y(minCutoff, beta), _z(minCutoff, beta) {}

cv::Point3d PointFilter::filter(const cv::Point3d& p, double timestamp) {
    return {
        _x.filter(p.x, timestamp),
        _y.filter(p.y, timestamp),
        _z.filter(p.z, timestamp)
    };
}

void PointFilter::reset() {
    _x.reset();
    _y.reset();
    _z.reset();
}

} // namespace math
