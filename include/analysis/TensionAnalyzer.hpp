#pragma once

#include "core/LandmarkBuffer.hpp"
#include "core/Types.hpp"
#include <array>
#include <map>
#include <string>
#include <vector>

namespace analysis {

// ============================================================
// Tension defaults
// ============================================================

constexpr double ACUTE_ELBOW_DEG = 70.0;        // Elbow closed under load
constexpr int SHOULDER_LOCK_FRAMES = 15;        // Elevated arm held this long = lock (~0.5 s @ 30 fps)
constexpr double KNEE_LATERAL_OFFSET = 0.08;    // Knee off the hip-ankle line (normalized units)
constexpr double KNEE_LOADED_MAX_DEG = 120.0;   // Only a bent knee is loaded
constexpr double TWIST_THRESHOLD_DEG = 30.0;    // Shoulder line vs hip line
constexpr int TENSION_DEBOUNCE_FRAMES = 3;

enum class TensionJoint : uint8_t {
    Shoulder = 0,
    Elbow,
    Knee,
    LowerBack
};

enum class TensionKind : uint8_t {
    AngleLock = 0,
    Rotation,
    Twist
};

[[nodiscard]] const char* tensionJointName(TensionJoint joint);
[[nodiscard]] const char* tensionKindName(TensionKind kind);

/**
 * Threshold crossings of one joint on one side over the whole session.
 * `extremum` is the most extreme value seen while the condition held
 * (min angle for elbows, max otherwise).
 */
struct TensionEvent {
    TensionJoint joint = TensionJoint::Shoulder;
    TensionKind kind = TensionKind::AngleLock;
    size_t count = 0;
    double extremum = 0.0;
    core::Side side = core::Side::None;
};

/**
 * Per-zone share of frames in HIGH tension and the weighted tension index.
 */
struct TensionSummary {
    std::map<std::string, double> zoneHighPercent;   // forearms, shoulders, lumbar, knees
    double index = 0.0;
    std::string risk = "LOW";
    size_t frames = 0;
};

struct TensionConfig {
    double acuteElbowDeg = ACUTE_ELBOW_DEG;
    int shoulderLockFrames = SHOULDER_LOCK_FRAMES;
    double kneeLateralOffset = KNEE_LATERAL_OFFSET;
    double kneeLoadedMaxDeg = KNEE_LOADED_MAX_DEG;
    double twistThresholdDeg = TWIST_THRESHOLD_DEG;
    int debounceFrames = TENSION_DEBOUNCE_FRAMES;

    // Zone classification for the summary
    double forearmLowDeg = 40.0;
    double forearmHighDeg = 150.0;
    int shoulderHighFrames = 35;
    double lumbarHighDeg = 45.0;
    double kneeHighMinDeg = 30.0;
    double kneeHighMaxDeg = 50.0;

    double forearmWeight = 0.30;
    double shoulderWeight = 0.30;
    double lumbarWeight = 0.25;
    double kneeWeight = 0.15;

    double riskHigh = 60.0;
    double riskModerate = 35.0;
};

/**
 * Tension/Risk Analyzer
 *
 * Fed one sample set per accepted frame for the whole session. Keeps,
 * per joint and side, a debounced count of threshold crossings and the
 * extreme value. Sides are attributed per crossing, never merged per frame.
 */
class TensionAnalyzer {
public:
    explicit TensionAnalyzer(TensionConfig config = {});

    /**
     * Evaluate one frame: one sample per joint, indexed by core::Joint
     */
    void update(const std::array<core::JointSample, core::JOINT_COUNT>& row);

    /**
     * Evaluate the most recent frame of a buffer
     */
    void update(const core::LandmarkBuffer& buffer);

    /**
     * Crossing events with count > 0, ordered by joint then side
     */
    [[nodiscard]] std::vector<TensionEvent> events() const;

    [[nodiscard]] TensionSummary summary() const;

    [[nodiscard]] size_t frames() const { return frames_; }
    [[nodiscard]] const TensionConfig& config() const { return config_; }

    void reset();

private:
    struct Detector {
        int run = 0;
        size_t count = 0;
        bool hasExtremum = false;
        double extremum = 0.0;

        void step(bool condition, double value, bool lowerIsExtreme, int debounce);
        void interrupt() { run = 0; }
    };

    struct ZoneCounter {
        size_t evaluated = 0;
        size_t high = 0;

        [[nodiscard]] double percent() const {
            return evaluated ? 100.0 * static_cast<double>(high) / static_cast<double>(evaluated) : 0.0;
        }
    };

    TensionConfig config_;
    size_t frames_ = 0;

    // [side] with 0 = left, 1 = right
    std::array<Detector, 2> shoulder_;
    std::array<Detector, 2> elbow_;
    std::array<Detector, 2> knee_;
    Detector lowerBack_;
    std::array<int, 2> elevatedRun_{};

    ZoneCounter forearms_;
    ZoneCounter shoulders_;
    ZoneCounter lumbar_;
    ZoneCounter knees_;
};

} // namespace analysis
