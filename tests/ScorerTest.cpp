// Tests for scoring::Scorer and scoring::Aggregator.

#include "scoring/Scorer.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace scoring;
using analysis::Category;
using analysis::ExtractionResult;
using analysis::RawSignal;

namespace {

RawSignal rawSignal(Category category, double value, std::map<std::string, double> fields = {}) {
    RawSignal s;
    s.category = category;
    s.value = value;
    s.fields = std::move(fields);
    s.validSamples = 100;
    return s;
}

MetricResult metric(Category category, double score) {
    MetricResult m;
    m.category = category;
    m.name = analysis::categoryName(category);
    m.score = score;
    return m;
}

class ScorerTest : public ::testing::Test {
protected:
    testutil::QuietLogs quiet_;
    Scorer scorer_;
    Aggregator aggregator_;
};

} // namespace

// ═══════════════════════════════════════════════════════════
// Normalization
// ═══════════════════════════════════════════════════════════

TEST_F(ScorerTest, HipScoreFollowsDeviationBucket) {
    auto good = scorer_.score(rawSignal(Category::HipPosition, 10.0));
    EXPECT_DOUBLE_EQ(good.score, 80.0);
    EXPECT_EQ(good.level, "good");
    EXPECT_EQ(good.rank, 1u);

    auto excellent = scorer_.score(rawSignal(Category::HipPosition, 5.0));
    EXPECT_DOUBLE_EQ(excellent.score, 95.0);
    EXPECT_EQ(excellent.level, "excellent");
}

TEST_F(ScorerTest, HipScoreDecaysPastLastBucket) {
    EXPECT_DOUBLE_EQ(scorer_.normalize(rawSignal(Category::HipPosition, 30.0)), 37.5);
    EXPECT_DOUBLE_EQ(scorer_.normalize(rawSignal(Category::HipPosition, 100.0)), 20.0);
    EXPECT_EQ(scorer_.score(rawSignal(Category::HipPosition, 30.0)).level, "poor");
}

TEST_F(ScorerTest, QuietFeetCurve) {
    EXPECT_DOUBLE_EQ(scorer_.normalize(rawSignal(Category::QuietFeet, 0.0)), 75.0);
    EXPECT_DOUBLE_EQ(scorer_.normalize(rawSignal(Category::QuietFeet, -1.0)), 100.0);
    EXPECT_DOUBLE_EQ(scorer_.normalize(rawSignal(Category::QuietFeet, 0.25)), 67.5);
    EXPECT_DOUBLE_EQ(scorer_.normalize(rawSignal(Category::QuietFeet, 10.0)), 20.0);
}

TEST_F(ScorerTest, DiagonalSwayPenalty) {
    EXPECT_DOUBLE_EQ(scorer_.normalize(rawSignal(Category::Diagonal, 0.8, {{"sway", 0.0}})), 80.0);
    // (0.05 - 0.02) * 500 = 15
    EXPECT_NEAR(scorer_.normalize(rawSignal(Category::Diagonal, 0.8, {{"sway", 0.05}})), 65.0, 1e-9);
    EXPECT_DOUBLE_EQ(scorer_.normalize(rawSignal(Category::Diagonal, 0.0)), 10.0);
}

TEST_F(ScorerTest, RouteReadingHasFloor) {
    EXPECT_DOUBLE_EQ(scorer_.normalize(rawSignal(Category::RouteReading, 0.0, {{"pauses", 0.0}})), 20.0);
    const double longer = scorer_.normalize(rawSignal(Category::RouteReading, 6.0, {{"pauses", 2.0}}));
    EXPECT_GT(longer, 60.0);
    EXPECT_LE(longer, 100.0);
}

TEST_F(ScorerTest, AdditionalMetricsUseTheirOwnTables) {
    auto exhaustion = scorer_.score(rawSignal(Category::Exhaustion, 75.0, {{"percent", 75.0}}));
    EXPECT_DOUBLE_EQ(exhaustion.score, 25.0);
    EXPECT_EQ(exhaustion.level, "critical");

    auto arms = scorer_.score(rawSignal(Category::ArmEfficiency, 45.0, {{"arm_load", 45.0}}));
    EXPECT_DOUBLE_EQ(arms.score, 75.0);
    EXPECT_EQ(arms.level, "acceptable");

    auto legs = scorer_.score(rawSignal(Category::LegEfficiency, 70.0, {{"leg_load", 70.0}}));
    EXPECT_DOUBLE_EQ(legs.score, 100.0);
    EXPECT_EQ(legs.level, "optimal");
    EXPECT_EQ(legs.rank, 0u);
}

TEST_F(ScorerTest, ScoresAreClamped) {
    EXPECT_DOUBLE_EQ(scorer_.normalize(rawSignal(Category::Stability, 1.0)), 0.0);
    EXPECT_DOUBLE_EQ(scorer_.normalize(rawSignal(Category::Stability, 0.0)), 100.0);
    EXPECT_DOUBLE_EQ(scorer_.normalize(rawSignal(Category::Rhythm, std::numeric_limits<double>::quiet_NaN())), 0.0);
}

TEST_F(ScorerTest, RawCarriesFieldsAndRoundedScore) {
    auto m = scorer_.score(rawSignal(Category::QuietFeet, 0.25, {{"holds", 4.0}}));
    EXPECT_EQ(m.name, "quiet_feet");
    EXPECT_DOUBLE_EQ(m.raw.at("holds"), 4.0);
    EXPECT_DOUBLE_EQ(m.raw.at("score"), 68.0);
}

TEST_F(ScorerTest, ScoringIsDeterministic) {
    const auto s = rawSignal(Category::GripRelease, 12.3, {{"jerk", 12.3}});
    EXPECT_EQ(scorer_.score(s), scorer_.score(s));
    EXPECT_EQ(scorer_.score(s), Scorer().score(s));
}

// ═══════════════════════════════════════════════════════════
// Aggregation
// ═══════════════════════════════════════════════════════════

TEST_F(ScorerTest, OverallIsWeightedMean) {
    ScoringConfig config;
    config.weights = {{Category::QuietFeet, 0.5}, {Category::HipPosition, 0.5}};
    Aggregator aggregator(config);

    std::map<Category, MetricResult> metrics = {
        {Category::QuietFeet, metric(Category::QuietFeet, 80.0)},
        {Category::HipPosition, metric(Category::HipPosition, 40.0)},
        {Category::Stability, metric(Category::Stability, 0.0)},   // unweighted
    };
    ASSERT_TRUE(aggregator.overallScore(metrics).has_value());
    EXPECT_DOUBLE_EQ(*aggregator.overallScore(metrics), 60.0);
}

TEST_F(ScorerTest, MissingCategoriesRenormalizeWeights) {
    std::map<Category, MetricResult> metrics = {
        {Category::QuietFeet, metric(Category::QuietFeet, 90.0)},
        {Category::Rhythm, metric(Category::Rhythm, 60.0)},
    };
    const auto weights = aggregator_.effectiveWeights(metrics);
    ASSERT_EQ(weights.size(), 2u);
    EXPECT_NEAR(weights.at(Category::QuietFeet) + weights.at(Category::Rhythm), 1.0, 1e-12);
    EXPECT_NEAR(weights.at(Category::QuietFeet), 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(*aggregator_.overallScore(metrics), 80.0, 1e-9);
}

TEST_F(ScorerTest, NoWeightedMetricsMeansNoScore) {
    std::map<Category, MetricResult> metrics = {
        {Category::Exhaustion, metric(Category::Exhaustion, 50.0)},
    };
    EXPECT_TRUE(aggregator_.effectiveWeights(metrics).empty());
    EXPECT_FALSE(aggregator_.overallScore(metrics).has_value());
}

TEST_F(ScorerTest, GradeTableIsTotal) {
    EXPECT_EQ(aggregator_.estimateGrade(100.0), "7b+");
    EXPECT_EQ(aggregator_.estimateGrade(85.0), "7b+");
    EXPECT_EQ(aggregator_.estimateGrade(84.99), "7a-7b");
    EXPECT_EQ(aggregator_.estimateGrade(60.0), "6a-6b");
    EXPECT_EQ(aggregator_.estimateGrade(0.0), "below 5a");
    EXPECT_EQ(aggregator_.estimateGrade(-5.0), "below 5a");
    EXPECT_EQ(aggregator_.estimateGrade(250.0), "7b+");
}

TEST_F(ScorerTest, InvalidGradeTablesRejected) {
    ScoringConfig empty;
    empty.grades.clear();
    EXPECT_THROW(Aggregator{empty}, std::invalid_argument);

    ScoringConfig unordered;
    unordered.grades = {{50.0, "b"}, {70.0, "a"}, {0.0, "c"}};
    EXPECT_THROW(Aggregator{unordered}, std::invalid_argument);

    ScoringConfig gap;
    gap.grades = {{80.0, "a"}, {40.0, "b"}};
    EXPECT_THROW(Aggregator{gap}, std::invalid_argument);

    ScoringConfig negative;
    negative.weights[Category::Rhythm] = -0.1;
    EXPECT_THROW(Aggregator{negative}, std::invalid_argument);
}

TEST_F(ScorerTest, AllInsufficientIsIndeterminate) {
    std::vector<ExtractionResult> results;
    for (Category c : analysis::allCategories()) {
        results.push_back(ExtractionResult::insufficient(c, "no data"));
    }

    const auto profile = aggregator_.buildProfile(results, scorer_, {});
    EXPECT_TRUE(profile.metrics.empty());
    EXPECT_EQ(profile.insufficient.size(), analysis::CATEGORY_COUNT);
    EXPECT_FALSE(profile.overallScore.has_value());
    EXPECT_EQ(profile.grade, INDETERMINATE_GRADE);
}

TEST_F(ScorerTest, ProfileExcludesInsufficientCategories) {
    std::vector<ExtractionResult> results = {
        ExtractionResult::success(rawSignal(Category::HipPosition, 10.0, {{"angle", 10.0}})),
        ExtractionResult::insufficient(Category::QuietFeet, "only 1 footholds detected"),
        ExtractionResult::success(rawSignal(Category::Rhythm, 0.0, {{"variance", 0.0}})),
    };

    const auto profile = aggregator_.buildProfile(results, scorer_, {});
    EXPECT_EQ(profile.metric(Category::QuietFeet), nullptr);
    EXPECT_TRUE(profile.isInsufficient(Category::QuietFeet));
    EXPECT_EQ(profile.effectiveWeights.count(Category::QuietFeet), 0u);

    // 0.2 * 80 + 0.1 * 100 over 0.3
    ASSERT_TRUE(profile.overallScore.has_value());
    EXPECT_NEAR(*profile.overallScore, 26.0 / 0.3, 1e-9);
    EXPECT_EQ(profile.grade, "7b+");
}
