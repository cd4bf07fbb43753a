#include "scoring/Scorer.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace scoring {

// ============================================================
// Defaults
// ============================================================

std::map<Category, double> ScoringConfig::defaultWeights() {
    return {
        {Category::QuietFeet, 0.20},
        {Category::HipPosition, 0.20},
        {Category::Diagonal, 0.15},
        {Category::GripRelease, 0.15},
        {Category::Rhythm, 0.10},
        {Category::DynamicControl, 0.10},
        {Category::RouteReading, 0.10},
    };
}

std::map<Category, BucketTable> ScoringConfig::defaultBuckets() {
    std::map<Category, BucketTable> tables;
    for (Category c : analysis::allCategories()) {
        tables.emplace(c, BucketTable::generic());
    }

    // Hip level comes from the deviation itself; the score follows the level
    tables[Category::HipPosition] = BucketTable("deviation", BucketOrder::LowerIsBetter, {
        {5.0, "excellent"},
        {15.0, "good"},
        {25.0, "medium"},
        {0.0, "poor"},
    });
    tables[Category::Exhaustion] = BucketTable("percent", BucketOrder::LowerIsBetter, {
        {30.0, "low"},
        {50.0, "moderate"},
        {70.0, "high"},
        {0.0, "critical"},
    });
    tables[Category::ArmEfficiency] = BucketTable("arm_load", BucketOrder::LowerIsBetter, {
        {40.0, "optimal"},
        {50.0, "acceptable"},
        {65.0, "overloaded"},
        {0.0, "critical"},
    });
    tables[Category::LegEfficiency] = BucketTable("leg_load", BucketOrder::HigherIsBetter, {
        {60.0, "optimal"},
        {50.0, "good"},
        {40.0, "underused"},
        {0.0, "passive"},
    });
    return tables;
}

std::vector<GradeEntry> ScoringConfig::defaultGrades() {
    return {
        {85.0, "7b+"},
        {80.0, "7a-7b"},
        {75.0, "6c-7a"},
        {68.0, "6b-6c"},
        {60.0, "6a-6b"},
        {50.0, "5c-6a"},
        {40.0, "5b-5c"},
        {30.0, "5a-5b"},
        {0.0, "below 5a"},
    };
}

// ============================================================
// Scorer
// ============================================================

Scorer::Scorer(ScoringConfig config) : config_(std::move(config)) {}

const BucketTable& Scorer::table(Category category) const {
    auto it = config_.buckets.find(category);
    return it == config_.buckets.end() ? fallback_ : it->second;
}

double Scorer::hipScore(double deviation) const {
    const std::string& level = table(Category::HipPosition).lookup(deviation);
    auto it = config_.hip.levelScores.find(level);
    if (it != config_.hip.levelScores.end()) return it->second;

    const double decayed = config_.hip.decayStart - (deviation - config_.hip.decayFromDeg) * config_.hip.decayPerDegree;
    return std::max(config_.hip.floor, decayed);
}

double Scorer::normalize(const analysis::RawSignal& signal) const {
    const double v = signal.value;
    double score = 0.0;

    switch (signal.category) {
        case Category::QuietFeet:
            score = config_.quietFeetCurve.evaluate(v);
            break;

        case Category::HipPosition:
            score = hipScore(v);
            break;

        case Category::Diagonal: {
            const double sway = signal.field("sway").value_or(0.0);
            const double penalty = std::min(config_.maxSwayPenalty,
                                            std::max(0.0, sway - config_.swayThreshold) * config_.swayPenaltyScale);
            score = std::clamp(v * 100.0 - penalty, config_.diagonalFloor, 100.0);
            break;
        }

        case Category::RouteReading: {
            // Diminishing returns on both planning time and pauses
            const double pauses = signal.field("pauses").value_or(0.0);
            const double preview = 50.0 * (1.0 - std::exp(-std::max(0.0, v) / config_.routePreviewTau));
            const double reading = 50.0 * (1.0 - std::exp(-std::max(0.0, pauses) / config_.routePauseTau));
            score = std::max(config_.routeFloor, preview + reading);
            break;
        }

        case Category::Rhythm:
            score = config_.rhythmCurve.evaluate(v);
            break;

        case Category::DynamicControl:
            score = config_.dynamicCurve.evaluate(v);
            break;

        case Category::GripRelease:
            score = config_.gripCurve.evaluate(v);
            break;

        case Category::Stability:
            score = 100.0 - v * config_.stabilityScale;
            break;

        case Category::Exhaustion:
            score = 100.0 - v;
            break;

        case Category::ArmEfficiency:
            if (v <= 40.0) {
                score = 100.0;
            } else if (v <= 50.0) {
                score = 100.0 - (v - 40.0) * 5.0;
            } else {
                score = std::max(0.0, 50.0 - (v - 50.0) * 3.0);
            }
            break;

        case Category::LegEfficiency:
            score = v * config_.legScale;
            break;

        default:
            break;
    }

    if (!std::isfinite(score)) return 0.0;
    return std::clamp(score, 0.0, 100.0);
}

MetricResult Scorer::score(const analysis::RawSignal& signal) const {
    MetricResult result;
    result.category = signal.category;
    result.name = analysis::categoryName(signal.category);
    result.score = normalize(signal);

    const BucketTable& buckets = table(signal.category);
    const double axisValue = (buckets.axis() == "score") ? result.score : signal.value;
    result.rank = buckets.rank(axisValue);
    result.level = buckets.buckets()[result.rank].level;

    result.raw = signal.fields;
    result.raw["score"] = std::round(result.score);

    core::Logger::debug("Scorer: ", result.name, " raw=", signal.value, " score=", result.score,
                        " level=", result.level);
    return result;
}

// ============================================================
// Aggregator
// ============================================================

Aggregator::Aggregator(ScoringConfig config) : config_(std::move(config)) {
    if (config_.grades.empty()) {
        throw std::invalid_argument("Grade table must not be empty");
    }
    for (size_t i = 1; i < config_.grades.size(); ++i) {
        if (!(config_.grades[i].minScore < config_.grades[i - 1].minScore)) {
            throw std::invalid_argument("Grade table must be ordered by strictly decreasing minimum");
        }
    }
    if (config_.grades.back().minScore > 0.0) {
        throw std::invalid_argument("Grade table must cover a score of 0");
    }

    double sum = 0.0;
    for (const auto& [category, weight] : config_.weights) {
        if (weight < 0.0) {
            throw std::invalid_argument(std::string("Negative weight for ") + analysis::categoryName(category));
        }
        sum += weight;
    }
    if (std::abs(sum - 1.0) > 1e-6) {
        core::Logger::warn("Aggregator: configured weights sum to ", sum, ", renormalizing");
    }
}

std::map<Category, double> Aggregator::effectiveWeights(const std::map<Category, MetricResult>& metrics) const {
    std::map<Category, double> out;
    double sum = 0.0;
    for (const auto& [category, weight] : config_.weights) {
        if (weight <= 0.0 || metrics.count(category) == 0) continue;
        out[category] = weight;
        sum += weight;
    }

    if (sum <= 0.0) return {};
    for (auto& [category, weight] : out) {
        weight /= sum;
    }
    return out;
}

std::optional<double> Aggregator::overallScore(const std::map<Category, MetricResult>& metrics) const {
    const auto weights = effectiveWeights(metrics);
    if (weights.empty()) return std::nullopt;

    double total = 0.0;
    for (const auto& [category, weight] : weights) {
        total += weight * metrics.at(category).score;
    }
    return total;
}

std::string Aggregator::estimateGrade(double score) const {
    const double s = std::clamp(score, 0.0, 100.0);
    for (const auto& entry : config_.grades) {
        if (entry.minScore <= s) return entry.label;
    }
    return config_.grades.back().label;
}

TechniqueProfile Aggregator::buildProfile(const std::vector<analysis::ExtractionResult>& results,
                                          const Scorer& scorer,
                                          const analysis::SessionStats& stats) const {
    TechniqueProfile profile;
    profile.stats = stats;

    for (const auto& r : results) {
        if (r.ok()) {
            profile.metrics[r.category] = scorer.score(r.signal);
        } else {
            profile.insufficient.push_back({r.category, r.reason});
        }
    }

    profile.effectiveWeights = effectiveWeights(profile.metrics);
    profile.overallScore = overallScore(profile.metrics);
    profile.grade = profile.overallScore ? estimateGrade(*profile.overallScore) : INDETERMINATE_GRADE;

    if (profile.overallScore) {
        core::Logger::info("Aggregator: overall ", *profile.overallScore, " → grade ", profile.grade,
                           " (", profile.effectiveWeights.size(), " weighted categories)");
    } else {
        core::Logger::warn("Aggregator: no weighted category has sufficient data, grade ", profile.grade);
    }
    return profile;
}

} // namespace scoring
