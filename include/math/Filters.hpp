#pragma once

#include <cmath>
#include <opencv2/core.hpp>

namespace math {

class OneEuroFilter {
public:
    OneEuroFilter(double minCutoff = 1.0, double beta = 0.007, double dCutoff = 1.0);
    double filter(double value, double timestamp);
    void reset();

private:
    struct LowPassFilter {
        double y = 0.0;
        double s = 0.0;
        bool initialized = false;

        double filter(double value, double alpha) {
            if (!initialized) {
                y = value;
                s = value;
                initialized = true;
                return value;
            }
            y = value;
            double result = alpha * value + (1.0 - alpha) * s;
            s = result;
            return result;
        }

        void reset() { initialized = false; }
    };

    double _minCutoff;
    double _beta;
    double _dCutoff;
    LowPassFilter _xFilter;
    LowPassFilter _dxFilter;
    double _lastTimestamp = -1.0;

    double alpha(double cutoff, double dt) {
        double tau = 1.0 / (2 * M_PI * cutoff);
        return 1.0 / (1.0 + tau / dt);
    }
};

/**
 * One Euro filter per axis for joint positions.
 */
class PointFilter {
public:
    PointFilter(double minCutoff = 1.0, double beta = 0.007);

    cv::Point3d filter(const cv::Point3d& p, double timestamp);
    void reset();

private:
    OneEuroFilter _x;
    OneEuroFilter _y;
    OneEuroFilter _z;
};

} // namespace math
