// Tests for report::SwotSynthesizer -- selection, ordering, caps and threat rules.

#include "report/SwotSynthesizer.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace report;
using analysis::Category;
using analysis::TensionEvent;
using analysis::TensionJoint;
using analysis::TensionKind;
using core::Side;
using scoring::MetricResult;
using scoring::TechniqueProfile;

namespace {

class SwotSynthesizerTest : public ::testing::Test {
protected:
    testutil::QuietLogs quiet_;
    SwotSynthesizer swot_;
    TechniqueProfile profile_;

    // Generic-table metric with its level and rank derived from the score
    MetricResult& add(Category category, double score, std::map<std::string, double> raw = {}) {
        const auto table = scoring::BucketTable::generic();
        MetricResult m;
        m.category = category;
        m.name = analysis::categoryName(category);
        m.score = score;
        m.rank = table.rank(score);
        m.level = table.lookup(score);
        m.raw = std::move(raw);
        m.raw["score"] = std::round(score);
        return profile_.metrics[category] = m;
    }

    MetricResult& addLevel(Category category, double score, const std::string& level, size_t rank,
                           std::map<std::string, double> raw = {}) {
        MetricResult& m = add(category, score, std::move(raw));
        m.level = level;
        m.rank = rank;
        return m;
    }
};

TensionEvent tension(TensionJoint joint, Side side, size_t count, double extremum = 0.0) {
    TensionEvent e;
    e.joint = joint;
    e.kind = joint == TensionJoint::Knee ? TensionKind::Rotation
           : joint == TensionJoint::LowerBack ? TensionKind::Twist : TensionKind::AngleLock;
    e.side = side;
    e.count = count;
    e.extremum = extremum;
    return e;
}

std::vector<std::string> ids(const std::vector<SwotItem>& items) {
    std::vector<std::string> out;
    for (const auto& i : items) out.push_back(i.id);
    return out;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Strengths and weaknesses
// ═══════════════════════════════════════════════════════════

TEST_F(SwotSynthesizerTest, StrengthsAreTopBucketSortedAndCapped) {
    add(Category::Diagonal, 90.0);
    add(Category::RouteReading, 95.0);
    add(Category::GripRelease, 80.0);
    add(Category::Stability, 85.0);
    add(Category::Rhythm, 99.0);
    add(Category::DynamicControl, 70.0);   // good: not a strength

    const auto report = swot_.synthesize(profile_, {}, std::nullopt);
    ASSERT_EQ(report.strengths.size(), MAX_STRENGTHS);
    EXPECT_EQ(ids(report.strengths),
              (std::vector<std::string>{"rhythm", "route_reading", "diagonal", "stability"}));
    EXPECT_DOUBLE_EQ(report.strengths[0].value, 99.0);
    EXPECT_TRUE(report.strengths[0].rendered);
    EXPECT_NE(report.strengths[0].text.find("99%"), std::string::npos);
    EXPECT_TRUE(report.weaknesses.empty());
}

TEST_F(SwotSynthesizerTest, WeaknessesAreBelowCutoffWorstFirst) {
    add(Category::Diagonal, 55.0);        // exactly on the cutoff: not a weakness
    add(Category::RouteReading, 54.0);
    add(Category::GripRelease, 20.0);
    add(Category::Stability, 47.0);
    add(Category::DynamicControl, 30.0, {{"time", 1.4}});
    add(Category::Rhythm, 10.0, {{"variance", 420.0}});

    const auto report = swot_.synthesize(profile_, {}, std::nullopt);
    ASSERT_EQ(report.weaknesses.size(), MAX_WEAKNESSES);
    EXPECT_EQ(ids(report.weaknesses),
              (std::vector<std::string>{"rhythm", "grip_release", "dynamic_control", "stability"}));
    EXPECT_NE(report.weaknesses[0].text.find("+/-420ms"), std::string::npos);
    for (const auto& w : report.weaknesses) {
        EXPECT_LT(w.value, WEAKNESS_CUTOFF);
        EXPECT_TRUE(w.rendered) << w.id;
    }
}

TEST_F(SwotSynthesizerTest, MissingPlaceholderKeepsLiteralText) {
    add(Category::Rhythm, 30.0);   // no variance value

    const auto report = swot_.synthesize(profile_, {}, std::nullopt);
    ASSERT_EQ(report.weaknesses.size(), 1u);
    EXPECT_FALSE(report.weaknesses[0].rendered);
    EXPECT_NE(report.weaknesses[0].text.find("{variance}"), std::string::npos);
}

TEST_F(SwotSynthesizerTest, LevelWithoutTextIsSkipped) {
    // "acceptable" arm load has neither a strength nor a weakness text
    addLevel(Category::ArmEfficiency, 50.0, "acceptable", 1, {{"arm_load", 48.0}});

    const auto report = swot_.synthesize(profile_, {}, std::nullopt);
    EXPECT_TRUE(report.strengths.empty());
    EXPECT_TRUE(report.weaknesses.empty());
}

// ═══════════════════════════════════════════════════════════
// Opportunities
// ═══════════════════════════════════════════════════════════

TEST_F(SwotSynthesizerTest, OpportunitiesFollowWeaknessOrder) {
    addLevel(Category::QuietFeet, 30.0, "poor", 3, {{"repositions", 3.5}, {"norm", 2.0}, {"holds", 4.0}});
    addLevel(Category::HipPosition, 40.0, "poor", 3, {{"angle", 30.0}, {"overload", 38.0}});

    const auto report = swot_.synthesize(profile_, {}, std::nullopt);
    ASSERT_EQ(report.opportunities.size(), 2u);
    EXPECT_EQ(report.opportunities[0].id, "quiet_feet");
    EXPECT_EQ(report.opportunities[0].text,
              "Working on foot precision removes 6 extra moves per route, saving 12% energy.");
    EXPECT_EQ(report.opportunities[1].id, "hip_position");
    EXPECT_EQ(report.opportunities[1].text,
              "Bring hip position up to 60% and your arms will tire 20% less.");
}

TEST_F(SwotSynthesizerTest, OpportunityWithMissingInputIsOmitted) {
    addLevel(Category::QuietFeet, 30.0, "poor", 3, {{"repositions", 3.5}, {"norm", 2.0}});
    addLevel(Category::HipPosition, 40.0, "poor", 3, {{"angle", 30.0}, {"overload", 38.0}});

    const auto report = swot_.synthesize(profile_, {}, std::nullopt);
    EXPECT_EQ(ids(report.opportunities), (std::vector<std::string>{"hip_position"}));
    // The weakness itself is still reported
    EXPECT_EQ(ids(report.weaknesses), (std::vector<std::string>{"quiet_feet", "hip_position"}));
}

TEST_F(SwotSynthesizerTest, OpportunityWithUnknownPlaceholderIsOmitted) {
    const auto templates = TemplateResolver::loadFromString(
        "opportunities:\n  rhythm: \"Save {saved}% via {missing}\"\n");
    SwotSynthesizer swot(templates);
    add(Category::Rhythm, 10.0, {{"variance", 400.0}});
    addLevel(Category::HipPosition, 40.0, "poor", 3, {{"angle", 30.0}, {"overload", 38.0}});

    const auto report = swot.synthesize(profile_, {}, std::nullopt);
    EXPECT_EQ(ids(report.weaknesses), (std::vector<std::string>{"rhythm", "hip_position"}));
    ASSERT_EQ(ids(report.opportunities), (std::vector<std::string>{"hip_position"}));
    EXPECT_TRUE(report.opportunities[0].rendered);
    EXPECT_EQ(report.opportunities[0].text,
              "Bring hip position up to 60% and your arms will tire 20% less.");
}

TEST_F(SwotSynthesizerTest, OpportunitiesAreCapped) {
    add(Category::Rhythm, 10.0, {{"variance", 400.0}});
    add(Category::GripRelease, 15.0);
    add(Category::DynamicControl, 20.0, {{"time", 1.5}});
    addLevel(Category::HipPosition, 25.0, "poor", 3, {{"angle", 40.0}, {"overload", 50.0}});

    const auto report = swot_.synthesize(profile_, {}, std::nullopt);
    ASSERT_EQ(report.opportunities.size(), MAX_OPPORTUNITIES);
    EXPECT_EQ(ids(report.opportunities),
              (std::vector<std::string>{"rhythm", "grip_release", "dynamic_control"}));
    EXPECT_EQ(report.opportunities[0].text,
              "An even rhythm cuts energy use by 25% and removes panic on hard sections.");
    EXPECT_EQ(report.opportunities[2].text,
              "Stabilize after throws in 0.5s instead of 1.5s to save 1s per move.");
}

TEST(SwotOpportunity, Calculations) {
    SwotConfig config;
    MetricResult hip;
    hip.score = 72.4;
    const auto h = opportunity::hipPosition(hip, config);
    ASSERT_TRUE(h.has_value());
    EXPECT_DOUBLE_EQ(h->at("target"), 85.0);
    EXPECT_DOUBLE_EQ(h->at("reduction"), 13.0);

    MetricResult legs;
    EXPECT_FALSE(opportunity::legEfficiency(legs, config).has_value());
    legs.raw["leg_load"] = 31.6;
    EXPECT_DOUBLE_EQ(opportunity::legEfficiency(legs, config)->at("current"), 32.0);

    MetricResult feet;
    feet.raw = {{"repositions", 9.0}, {"norm", 1.0}, {"holds", 10.0}};
    EXPECT_DOUBLE_EQ(opportunity::quietFeet(feet, config)->at("energy"), config.energyCap);
}

// ═══════════════════════════════════════════════════════════
// Threats
// ═══════════════════════════════════════════════════════════

TEST_F(SwotSynthesizerTest, ThreatSideFollowsDominantCount) {
    const std::vector<TensionEvent> events = {
        tension(TensionJoint::Elbow, Side::Left, 4, 60.0),
        tension(TensionJoint::Elbow, Side::Right, 6, 55.0),
    };

    const auto report = swot_.synthesize(profile_, events, std::nullopt);
    ASSERT_EQ(report.threats.size(), 1u);
    EXPECT_EQ(report.threats[0].id, "elbow");
    EXPECT_DOUBLE_EQ(report.threats[0].value, 6.0);
    EXPECT_EQ(report.threats[0].text.rfind("Right elbow", 0), 0u);
    EXPECT_NE(report.threats[0].text.find("6 times"), std::string::npos);
}

TEST_F(SwotSynthesizerTest, ThreatSideTieUsesNeutralLabel) {
    const std::vector<TensionEvent> events = {
        tension(TensionJoint::Shoulder, Side::Left, 3, 140.0),
        tension(TensionJoint::Shoulder, Side::Right, 3, 150.0),
    };

    const auto report = swot_.synthesize(profile_, events, std::nullopt);
    ASSERT_EQ(report.threats.size(), 1u);
    EXPECT_EQ(report.threats[0].text.rfind("Each shoulder locked at 3 points", 0), 0u);
}

TEST_F(SwotSynthesizerTest, ThreatsBelowMinimumAreIgnored) {
    const std::vector<TensionEvent> events = {
        tension(TensionJoint::Shoulder, Side::Left, 2),
        tension(TensionJoint::Elbow, Side::Left, 4),
        tension(TensionJoint::Knee, Side::Right, 1, 0.1),
        tension(TensionJoint::LowerBack, Side::None, 5, 29.0),
    };
    add(Category::Stability, 40.0);

    const auto report = swot_.synthesize(profile_, events, 69.0);
    EXPECT_TRUE(report.threats.empty());
}

TEST_F(SwotSynthesizerTest, ThreatsRankedBySeverityAndCapped) {
    const std::vector<TensionEvent> events = {
        tension(TensionJoint::Shoulder, Side::Left, 4, 150.0),
        tension(TensionJoint::LowerBack, Side::None, 2, 40.0),
    };
    add(Category::Stability, 30.0);

    const auto report = swot_.synthesize(profile_, events, 75.0);
    ASSERT_EQ(report.threats.size(), MAX_THREATS);
    EXPECT_EQ(ids(report.threats),
              (std::vector<std::string>{"exhaustion_critical", "instability", "lower_back"}));
    EXPECT_DOUBLE_EQ(report.threats[0].value, 75.0);
    EXPECT_DOUBLE_EQ(report.threats[1].value, 70.0);
    EXPECT_NE(report.threats[2].text.find("40 deg"), std::string::npos);
}

TEST_F(SwotSynthesizerTest, ExhaustionReadFromProfile) {
    addLevel(Category::Exhaustion, 20.0, "critical", 3, {{"percent", 80.0}});

    const auto report = swot_.synthesize(profile_, {});
    const auto threatIds = ids(report.threats);
    ASSERT_EQ(threatIds.size(), 1u);
    EXPECT_EQ(threatIds[0], "exhaustion_critical");
    EXPECT_NE(report.threats[0].text.find("80%"), std::string::npos);
}

TEST_F(SwotSynthesizerTest, FallRanksAboveOtherThreats) {
    const std::vector<TensionEvent> events = {tension(TensionJoint::Shoulder, Side::Left, 4, 150.0)};

    analysis::FallSummary falls;
    analysis::DescentEvent drop;
    drop.kind = analysis::DescentKind::Controlled;
    drop.startTime = 3.0;
    analysis::DescentEvent fall;
    fall.kind = analysis::DescentKind::Fall;
    fall.startTime = 12.34;
    falls.descents = {drop, fall};
    falls.controlled = 1;
    falls.falls = 1;

    const auto report = swot_.synthesize(profile_, events, 75.0, falls);
    ASSERT_EQ(ids(report.threats), (std::vector<std::string>{"fall", "exhaustion_critical", "shoulder"}));
    EXPECT_DOUBLE_EQ(report.threats[0].value, SwotConfig{}.fallSeverity);
    EXPECT_EQ(report.threats[0].text,
              "Uncontrolled fall at 12.3s (1 this attempt). Practice falling: feet down first, hands off the wall.");
}

TEST_F(SwotSynthesizerTest, ControlledDescentIsNoThreat) {
    analysis::FallSummary falls;
    analysis::DescentEvent drop;
    drop.kind = analysis::DescentKind::Controlled;
    falls.descents = {drop};
    falls.controlled = 1;

    const auto report = swot_.synthesize(profile_, {}, falls);
    EXPECT_TRUE(report.threats.empty());
}

// ═══════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════

TEST_F(SwotSynthesizerTest, CustomTemplatesAndCaps) {
    const auto templates = TemplateResolver::loadFromString(R"(
threats:
  shoulder:
    text: "{side} shoulder x{count}"
    side_none: "Both"
)");
    SwotConfig config;
    config.maxThreats = 1;
    SwotSynthesizer swot(templates, config);

    const std::vector<TensionEvent> events = {
        tension(TensionJoint::Shoulder, Side::Left, 5),
        tension(TensionJoint::Shoulder, Side::Right, 5),
        tension(TensionJoint::Knee, Side::Left, 2, 0.1),
    };
    const auto report = swot.synthesize(profile_, events, std::nullopt);
    ASSERT_EQ(report.threats.size(), 1u);
    EXPECT_EQ(report.threats[0].text, "Both shoulder x5");
}

TEST_F(SwotSynthesizerTest, SynthesisIsDeterministic) {
    add(Category::Rhythm, 99.0);
    add(Category::Diagonal, 99.0);
    add(Category::GripRelease, 20.0);
    const std::vector<TensionEvent> events = {tension(TensionJoint::Knee, Side::Left, 3, 0.12)};

    const auto a = swot_.synthesize(profile_, events, 50.0);
    const auto b = SwotSynthesizer().synthesize(profile_, events, 50.0);
    EXPECT_EQ(a, b);
    // Equal scores keep category order
    EXPECT_EQ(ids(a.strengths), (std::vector<std::string>{"diagonal", "rhythm"}));
}

TEST(SwotSynthesizer, RejectsNullTemplates) {
    EXPECT_THROW(SwotSynthesizer(nullptr), std::invalid_argument);
}
