#pragma once

#include "BucketTable.hpp"
#include "analysis/Categories.hpp"
#include "analysis/FeatureExtractors.hpp"
#include "math/Geometry.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scoring {

using analysis::Category;

constexpr const char* INDETERMINATE_GRADE = "indeterminate";

struct GradeEntry {
    double minScore = 0.0;
    std::string label;
};

/**
 * Hip score is derived from its deviation bucket; beyond the last
 * explicit bucket it decays linearly down to a floor.
 */
struct HipRule {
    std::map<std::string, double> levelScores = {{"excellent", 95.0}, {"good", 80.0}, {"medium", 60.0}};
    double decayFromDeg = 25.0;
    double decayStart = 45.0;
    double decayPerDegree = 1.5;
    double floor = 20.0;
};

/**
 * Immutable scoring configuration.
 * Two sessions may run with different configurations side by side.
 */
struct ScoringConfig {
    std::map<Category, double> weights = defaultWeights();
    std::map<Category, BucketTable> buckets = defaultBuckets();
    std::vector<GradeEntry> grades = defaultGrades();

    HipRule hip;
    math::PiecewiseLinear quietFeetCurve{{{-1.0, 100.0}, {0.0, 75.0}, {0.5, 60.0}, {1.0, 45.0}, {2.0, 30.0}, {3.0, 20.0}}};
    math::PiecewiseLinear rhythmCurve{{{0.0, 100.0}, {100.0, 90.0}, {200.0, 70.0}, {350.0, 50.0}, {700.0, 0.0}}};
    math::PiecewiseLinear dynamicCurve{{{0.3, 100.0}, {0.5, 90.0}, {1.0, 70.0}, {1.5, 50.0}, {3.0, 10.0}}};
    math::PiecewiseLinear gripCurve{{{0.0, 100.0}, {5.0, 90.0}, {15.0, 70.0}, {30.0, 50.0}, {60.0, 10.0}}};

    double routePreviewTau = 3.0;     // seconds
    double routePauseTau = 2.0;       // pauses
    double routeFloor = 20.0;

    double diagonalFloor = 10.0;
    double swayThreshold = 0.02;
    double swayPenaltyScale = 500.0;
    double maxSwayPenalty = 30.0;

    double stabilityScale = 10000.0;
    double legScale = 1.5;

    static std::map<Category, double> defaultWeights();
    static std::map<Category, BucketTable> defaultBuckets();
    static std::vector<GradeEntry> defaultGrades();
};

struct MetricResult {
    Category category = Category::QuietFeet;
    std::string name;
    double score = 0.0;                   // [0, 100]
    std::string level;
    size_t rank = 0;                      // 0 = top bucket of the category
    std::map<std::string, double> raw;    // placeholder name -> value, always has "score"

    bool operator==(const MetricResult& other) const {
        return category == other.category && name == other.name && score == other.score &&
               level == other.level && rank == other.rank && raw == other.raw;
    }
};

struct InsufficientCategory {
    Category category = Category::QuietFeet;
    std::string reason;
};

struct TechniqueProfile {
    std::map<Category, MetricResult> metrics;            // sufficient categories only
    std::vector<InsufficientCategory> insufficient;
    std::map<Category, double> effectiveWeights;
    std::optional<double> overallScore;                  // empty when nothing could be weighted
    std::string grade = INDETERMINATE_GRADE;
    analysis::SessionStats stats;

    [[nodiscard]] const MetricResult* metric(Category category) const {
        auto it = metrics.find(category);
        return it == metrics.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool isInsufficient(Category category) const {
        for (const auto& i : insufficient) {
            if (i.category == category) return true;
        }
        return false;
    }
};

/**
 * Maps a RawSignal to a 0-100 score and a level of its category's bucket table.
 * Deterministic: the result depends only on the signal and the configuration.
 */
class Scorer {
public:
    explicit Scorer(ScoringConfig config = ScoringConfig{});

    [[nodiscard]] MetricResult score(const analysis::RawSignal& signal) const;

    /**
     * Category-specific normalization rule, clamped to [0, 100]
     */
    [[nodiscard]] double normalize(const analysis::RawSignal& signal) const;

    [[nodiscard]] const BucketTable& table(Category category) const;
    [[nodiscard]] const ScoringConfig& config() const { return config_; }

private:
    ScoringConfig config_;
    BucketTable fallback_ = BucketTable::generic();

    [[nodiscard]] double hipScore(double deviation) const;
};

/**
 * Weighted overall score and grade estimate.
 */
class Aggregator {
public:
    explicit Aggregator(ScoringConfig config = ScoringConfig{});

    /**
     * Configured weights restricted to the metrics present, renormalized to sum to 1
     */
    [[nodiscard]] std::map<Category, double> effectiveWeights(const std::map<Category, MetricResult>& metrics) const;

    [[nodiscard]] std::optional<double> overallScore(const std::map<Category, MetricResult>& metrics) const;

    /**
     * First grade (highest threshold first) whose minimum is <= score.
     * Total over [0, 100]; values outside are clamped.
     */
    [[nodiscard]] std::string estimateGrade(double score) const;

    [[nodiscard]] TechniqueProfile buildProfile(const std::vector<analysis::ExtractionResult>& results,
                                                const Scorer& scorer,
                                                const analysis::SessionStats& stats) const;

    [[nodiscard]] const ScoringConfig& config() const { return config_; }

private:
    ScoringConfig config_;
};

} // namespace scoring
