#pragma once

#include "Categories.hpp"
#include "core/LandmarkBuffer.hpp"
#include <array>
#include <vector>

namespace analysis {

// ============================================================
// Extractor defaults
// ============================================================

constexpr size_t MIN_VALID_SAMPLES = 15;       // Per category, below this: insufficient data
constexpr size_t MIN_EVENTS = 3;               // Holds / intervals / releases needed

constexpr double HOLD_RADIUS = 0.04;           // Re-settle within this radius = same hold
constexpr double PIVOT_ANGLE_DEG = 15.0;       // Heel->toe rotation that counts as a pivot
constexpr double COM_ADVANCE = 0.03;           // Upward COM travel that leaves a hold behind
constexpr double HIP_DEPTH_TOLERANCE = 0.05;   // z gap between hips and shoulders before penalty
constexpr double HIP_DEPTH_PENALTY = 100.0;    // degrees per unit of z gap
constexpr double SWAY_WINDOW_S = 0.5;
constexpr double MAX_SETTLE_S = 2.0;           // Dynamic moves without a settle are capped here
constexpr size_t JERK_HALF_WINDOW = 2;         // Frames around a release scanned for acceleration peak
constexpr size_t STABILITY_WINDOW = 30;
constexpr size_t EXHAUSTION_MIN_SAMPLES = 20;
constexpr double EXHAUSTION_JERK_REFERENCE = 5.0;

/**
 * Coarse climber grade brackets for the repositioning norm table.
 */
enum class GradeBracket : uint8_t {
    Beginner = 0,    // 5a-5c
    Intermediate,    // 6a-6b
    Advanced,        // 6c-7a
    Expert           // 7b+
};

[[nodiscard]] const char* gradeBracketLabel(GradeBracket bracket);
[[nodiscard]] std::optional<GradeBracket> gradeBracketFromLabel(const std::string& label);

struct ExtractorConfig {
    size_t minValidSamples = MIN_VALID_SAMPLES;
    size_t minEvents = MIN_EVENTS;

    // Quiet feet
    double holdRadius = HOLD_RADIUS;
    double pivotAngleDeg = PIVOT_ANGLE_DEG;
    double comAdvance = COM_ADVANCE;
    GradeBracket bracket = GradeBracket::Intermediate;
    std::array<double, 4> repositionNorms = {2.5, 2.0, 1.5, 1.0};  // per bracket, repositions per hold

    // Hip position
    double hipDepthTolerance = HIP_DEPTH_TOLERANCE;
    double hipDepthPenalty = HIP_DEPTH_PENALTY;

    // Diagonal coordination
    double swayWindowSeconds = SWAY_WINDOW_S;

    // Dynamic control
    double maxSettleSeconds = MAX_SETTLE_S;

    // Grip release
    size_t jerkHalfWindow = JERK_HALF_WINDOW;

    // Additional metrics
    size_t stabilityWindow = STABILITY_WINDOW;
    size_t exhaustionMinSamples = EXHAUSTION_MIN_SAMPLES;
    double exhaustionJerkReference = EXHAUSTION_JERK_REFERENCE;

    [[nodiscard]] double repositionNorm() const {
        return repositionNorms[static_cast<size_t>(bracket)];
    }
};

/**
 * Session-level statistics carried on the TechniqueProfile.
 */
struct SessionStats {
    size_t handMoves = 0;
    size_t dynamicMoves = 0;
    size_t pauses = 0;
    double maxReachRatio = 0.0;     // wrist span / body height
    double durationSeconds = 0.0;
    size_t acceptedFrames = 0;
    size_t droppedFrames = 0;
};

// ═══════════════════════════════════════════════════════════
// Technique categories
// Each extractor reads the whole session from the buffer, skips lost
// intervals, and reports InsufficientData instead of guessing.
// ═══════════════════════════════════════════════════════════

/**
 * Foot precision: repositions per distinct foothold compared with the
 * grade-bracket norm. Re-settles that only rotate the foot are pivots.
 * value = (repositions/hold - norm) / norm
 */
[[nodiscard]] ExtractionResult extractQuietFeet(const core::LandmarkBuffer& buffer, const ExtractorConfig& config);

/**
 * Torso deviation from the wall plane in degrees, averaged over climbing
 * (non-pause) frames.
 */
[[nodiscard]] ExtractionResult extractHipPosition(const core::LandmarkBuffer& buffer, const ExtractorConfig& config);

/**
 * Fraction of hand moves made with the loaded foot on the opposite side,
 * plus centre-of-mass sway after each move.
 */
[[nodiscard]] ExtractionResult extractDiagonal(const core::LandmarkBuffer& buffer, const ExtractorConfig& config);

/**
 * Pre-climb static duration and number of mid-climb pauses.
 */
[[nodiscard]] ExtractionResult extractRouteReading(const core::LandmarkBuffer& buffer, const ExtractorConfig& config);

/**
 * Standard deviation of hand move intervals (ms), intervals spanning a pause excluded.
 */
[[nodiscard]] ExtractionResult extractRhythm(const core::LandmarkBuffer& buffer, const ExtractorConfig& config);

/**
 * Mean time from a dynamic hand move until the hand settles again.
 */
[[nodiscard]] ExtractionResult extractDynamicControl(const core::LandmarkBuffer& buffer, const ExtractorConfig& config);

/**
 * Mean peak acceleration of the hand around hold-release instants.
 */
[[nodiscard]] ExtractionResult extractGripRelease(const core::LandmarkBuffer& buffer, const ExtractorConfig& config);

// ═══════════════════════════════════════════════════════════
// Additional metrics
// ═══════════════════════════════════════════════════════════

[[nodiscard]] ExtractionResult extractStability(const core::LandmarkBuffer& buffer, const ExtractorConfig& config);
[[nodiscard]] ExtractionResult extractExhaustion(const core::LandmarkBuffer& buffer, const ExtractorConfig& config);

/**
 * Arm/leg share of the load, returned as {arm_efficiency, leg_efficiency}.
 */
[[nodiscard]] std::pair<ExtractionResult, ExtractionResult> extractLoadDistribution(
    const core::LandmarkBuffer& buffer, const ExtractorConfig& config);

[[nodiscard]] SessionStats extractSessionStats(const core::LandmarkBuffer& buffer);

/**
 * Runs every extractor; one result per category in allCategories() order.
 */
[[nodiscard]] std::vector<ExtractionResult> extractAll(const core::LandmarkBuffer& buffer, const ExtractorConfig& config);

} // namespace analysis
