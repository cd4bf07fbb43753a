#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace scoring {

enum class BucketOrder : uint8_t {
    HigherIsBetter = 0,
    LowerIsBetter
};

/**
 * One band of a bucket table.
 * HigherIsBetter: value >= threshold; LowerIsBetter: value <= threshold.
 * The threshold of the last (worst) bucket is ignored: it catches the rest.
 */
struct Bucket {
    double threshold = 0.0;
    std::string level;
};

/**
 * Ordered bucket table of one category.
 *
 * Buckets are listed best first. Lookup walks them in order and returns
 * the first one satisfied, so a value exactly on a threshold belongs to
 * the better bucket. Throws std::invalid_argument when thresholds are not
 * strictly ordered in the direction of `order`.
 */
class BucketTable {
public:
    BucketTable() = default;
    BucketTable(std::string axis, BucketOrder order, std::vector<Bucket> buckets);

    [[nodiscard]] const std::string& lookup(double value) const;

    /**
     * 0 = best bucket
     */
    [[nodiscard]] size_t rank(double value) const;

    [[nodiscard]] bool isTopLevel(const std::string& level) const;

    [[nodiscard]] const std::string& axis() const { return axis_; }
    [[nodiscard]] BucketOrder order() const { return order_; }
    [[nodiscard]] const std::vector<Bucket>& buckets() const { return buckets_; }

    /**
     * excellent >= 75, good >= 60, medium >= 45, poor
     */
    static BucketTable generic(const std::string& axis = "score");

private:
    std::string axis_ = "score";
    BucketOrder order_ = BucketOrder::HigherIsBetter;
    std::vector<Bucket> buckets_;
};

} // namespace scoring
