#include "scoring/BucketTable.hpp"
#include <stdexcept>

namespace scoring {

BucketTable::BucketTable(std::string axis, BucketOrder order, std::vector<Bucket> buckets)
    : axis_(std::move(axis)), order_(order), buckets_(std::move(buckets)) {
    if (buckets_.empty()) {
        throw std::invalid_argument("BucketTable '" + axis_ + "' needs at least one bucket");
    }

    // Thresholds of all but the catch-all bucket must be strictly ordered
    for (size_t i = 1; i + 1 < buckets_.size(); ++i) {
        const double prev = buckets_[i - 1].threshold;
        const double cur = buckets_[i].threshold;
        const bool ordered = (order_ == BucketOrder::HigherIsBetter) ? cur < prev : cur > prev;
        if (!ordered) {
            throw std::invalid_argument("BucketTable '" + axis_ + "' thresholds out of order at '" +
                                        buckets_[i].level + "'");
        }
    }
}

size_t BucketTable::rank(double value) const {
    for (size_t i = 0; i + 1 < buckets_.size(); ++i) {
        const double t = buckets_[i].threshold;
        const bool hit = (order_ == BucketOrder::HigherIsBetter) ? value >= t : value <= t;
        if (hit) return i;
    }
    return buckets_.size() - 1;
}

const std::string& BucketTable::lookup(double value) const {
    return buckets_[rank(value)].level;
}

bool BucketTable::isTopLevel(const std::string& level) const {
    return !buckets_.empty() && buckets_.front().level == level;
}

BucketTable BucketTable::generic(const std::string& axis) {
    return BucketTable(axis, BucketOrder::HigherIsBetter, {
        {75.0, "excellent"},
        {60.0, "good"},
        {45.0, "medium"},
        {0.0, "poor"},
    });
}

} // namespace scoring
