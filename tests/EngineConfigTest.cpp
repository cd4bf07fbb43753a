// Tests for core::EngineConfig loading -- overrides, fallbacks, validation.

#include "core/EngineConfig.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace core;
using analysis::Category;

namespace {

class EngineConfigTest : public ::testing::Test {
protected:
    testutil::QuietLogs quiet_;
};

} // namespace

TEST_F(EngineConfigTest, MissingFileGivesDefaults) {
    const auto config = loadEngineConfig("/nonexistent/engine.yml");
    EXPECT_EQ(config.buffer.capacity, BUFFER_CAPACITY);
    EXPECT_DOUBLE_EQ(config.buffer.motion.pauseMinSeconds, PAUSE_MIN_S);
    EXPECT_EQ(config.extractor.bracket, analysis::GradeBracket::Intermediate);
    EXPECT_EQ(config.scoring.grades.size(), scoring::ScoringConfig::defaultGrades().size());
    EXPECT_EQ(config.swot.maxThreats, report::MAX_THREATS);
    EXPECT_TRUE(config.templatesPath.empty());
    EXPECT_FALSE(config.logLevel.has_value());
}

TEST_F(EngineConfigTest, OverridesOnlyWhatIsGiven) {
    const auto config = loadEngineConfigFromString(R"(
templates: "custom.yml"
buffer:
  capacity: 100
  min_confidence: { left_ankle: 0.8 }
motion:
  pause_min_s: 2
extractor:
  grade_bracket: "7b+"
tension:
  debounce_frames: 5
scoring:
  weights: { quiet_feet: 1.0 }
swot:
  max_threats: 2
)");

    EXPECT_EQ(config.templatesPath, "custom.yml");
    EXPECT_EQ(config.buffer.capacity, 100u);
    EXPECT_FLOAT_EQ(config.buffer.minConfidence[jointIndex(Joint::LeftAnkle)], 0.8f);
    EXPECT_FLOAT_EQ(config.buffer.minConfidence[jointIndex(Joint::RightAnkle)], MIN_CONFIDENCE);
    EXPECT_DOUBLE_EQ(config.buffer.motion.pauseMinSeconds, 2.0);
    EXPECT_DOUBLE_EQ(config.buffer.motion.moveVelocityEnter, MOVE_VELOCITY_ENTER);
    EXPECT_EQ(config.extractor.bracket, analysis::GradeBracket::Expert);
    EXPECT_EQ(config.tension.debounceFrames, 5);

    ASSERT_EQ(config.scoring.weights.size(), 1u);
    EXPECT_DOUBLE_EQ(config.scoring.weights.at(Category::QuietFeet), 1.0);
    EXPECT_EQ(config.scoring.grades.size(), scoring::ScoringConfig::defaultGrades().size());

    EXPECT_EQ(config.swot.maxThreats, 2u);
    EXPECT_EQ(config.swot.maxStrengths, report::MAX_STRENGTHS);
}

TEST_F(EngineConfigTest, FallSection) {
    const auto config = loadEngineConfigFromString(R"(
fall:
  min_drop: 0.2
  hand_reach_frames: 4
swot:
  fall_severity: 50
)");
    EXPECT_DOUBLE_EQ(config.fall.minDrop, 0.2);
    EXPECT_EQ(config.fall.handReachFrames, 4);
    EXPECT_DOUBLE_EQ(config.fall.fallPeakSpeed, analysis::FALL_PEAK_SPEED);
    EXPECT_DOUBLE_EQ(config.swot.fallSeverity, 50.0);
}

TEST_F(EngineConfigTest, UniformConfidenceCutoff) {
    const auto config = loadEngineConfigFromString("buffer: { min_confidence: 0.3 }\n");
    for (float c : config.buffer.minConfidence) EXPECT_FLOAT_EQ(c, 0.3f);
}

TEST_F(EngineConfigTest, CustomGradeTable) {
    const auto config = loadEngineConfigFromString(R"(
scoring:
  grades:
    - { min: 70, label: "strong" }
    - { min: 0, label: "building" }
)");
    ASSERT_EQ(config.scoring.grades.size(), 2u);
    EXPECT_EQ(config.scoring.grades[0].label, "strong");
    EXPECT_EQ(scoring::Aggregator(config.scoring).estimateGrade(50.0), "building");
}

TEST_F(EngineConfigTest, InvalidGradeTableKeepsDefaults) {
    const auto config = loadEngineConfigFromString(R"(
scoring:
  weights: { rhythm: 2.0 }
  grades:
    - { min: 40, label: "low" }
    - { min: 80, label: "high" }
)");
    // The whole section is rejected, weights included
    EXPECT_EQ(config.scoring.grades.size(), scoring::ScoringConfig::defaultGrades().size());
    EXPECT_EQ(config.scoring.weights, scoring::ScoringConfig::defaultWeights());
}

TEST_F(EngineConfigTest, WrongTypesKeepDefaults) {
    const auto config = loadEngineConfigFromString(R"(
buffer:
  capacity: "lots"
swot:
  max_threats: -3
extractor:
  grade_bracket: "9z"
)");
    EXPECT_EQ(config.buffer.capacity, BUFFER_CAPACITY);
    EXPECT_EQ(config.swot.maxThreats, report::MAX_THREATS);
    EXPECT_EQ(config.extractor.bracket, analysis::GradeBracket::Intermediate);
}

TEST_F(EngineConfigTest, ParseErrorGivesDefaults) {
    const auto config = loadEngineConfigFromString("buffer: { capacity: 10\nmotion: [\n");
    EXPECT_EQ(config.buffer.capacity, BUFFER_CAPACITY);
    EXPECT_FALSE(config.logLevel.has_value());
}

TEST_F(EngineConfigTest, LogLevelIsParsedNotApplied) {
    const LogLevel before = Logger::level();
    const auto config = loadEngineConfigFromString("log_level: \"debug\"\n");
    ASSERT_TRUE(config.logLevel.has_value());
    EXPECT_EQ(*config.logLevel, LogLevel::DEBUG);
    // Loading one session's config leaves the process-wide level alone
    EXPECT_EQ(Logger::level(), before);

    const auto unknown = loadEngineConfigFromString("log_level: \"chatty\"\n");
    EXPECT_FALSE(unknown.logLevel.has_value());
}
