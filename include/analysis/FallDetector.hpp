#pragma once

#include "core/LandmarkBuffer.hpp"
#include "core/Types.hpp"
#include <array>
#include <optional>
#include <vector>

namespace analysis {

// ============================================================
// Descent defaults (normalized image units, y grows downwards)
// ============================================================

constexpr double DESCENT_OPEN_SPEED = 0.6;      // COM downward speed that opens a descent
constexpr double DESCENT_CLOSE_FRACTION = 0.5;  // Descent ends below this share of the open speed
constexpr double DESCENT_MIN_DROP = 0.15;       // Shorter drops are ordinary moves
constexpr double FALL_PEAK_SPEED = 1.5;         // Peak COM speed of a sudden drop
constexpr double HAND_REACH_SPEED = 0.5;        // Wrist moving up while the body drops
constexpr int HAND_REACH_FRAMES = 2;
constexpr double FEET_LEAD_S = 0.5;             // Feet dropping this long before the body leads it

enum class DescentKind : uint8_t {
    Controlled = 0,   // drop-off or lower-down
    Fall
};

[[nodiscard]] const char* descentKindName(DescentKind kind);

/**
 * One downward run of the centre of mass longer than the minimum drop.
 */
struct DescentEvent {
    DescentKind kind = DescentKind::Controlled;
    int64_t startFrame = 0;
    double startTime = 0.0;
    double endTime = 0.0;
    double drop = 0.0;          // COM travel, normalized units
    double peakSpeed = 0.0;     // units/s
    bool feetFirst = false;     // an ankle was already dropping before the body
    bool handsReaching = false; // a wrist moved up during the drop
};

struct FallSummary {
    std::vector<DescentEvent> descents;
    size_t falls = 0;
    size_t controlled = 0;

    [[nodiscard]] const DescentEvent* firstFall() const {
        for (const auto& d : descents) {
            if (d.kind == DescentKind::Fall) return &d;
        }
        return nullptr;
    }
};

struct FallConfig {
    double openSpeed = DESCENT_OPEN_SPEED;
    double closeFraction = DESCENT_CLOSE_FRACTION;
    double minDrop = DESCENT_MIN_DROP;
    double fallPeakSpeed = FALL_PEAK_SPEED;
    double handReachSpeed = HAND_REACH_SPEED;
    int handReachFrames = HAND_REACH_FRAMES;
    double feetLeadSeconds = FEET_LEAD_S;
};

/**
 * Fall / Drop-off Detector
 *
 * Fed one sample set per accepted frame. Tracks runs where the centre of
 * mass drops faster than the open speed and classifies each one when it
 * ends: a sudden drop (peak speed at or above fallPeakSpeed) is a fall
 * when the hands reach up during it or the feet did not lead it. Every
 * other qualifying drop is controlled.
 */
class FallDetector {
public:
    explicit FallDetector(FallConfig config = {});

    /**
     * Evaluate one frame: one sample per joint, indexed by core::Joint
     */
    void update(const std::array<core::JointSample, core::JOINT_COUNT>& row);

    /**
     * Evaluate the most recent frame of a buffer
     */
    void update(const core::LandmarkBuffer& buffer);

    /**
     * End of stream: a descent still running is classified as it stands
     */
    void finish();

    [[nodiscard]] FallSummary summary() const;
    [[nodiscard]] bool descending() const { return open_.has_value(); }
    [[nodiscard]] const FallConfig& config() const { return config_; }

    void reset();

private:
    struct Track {
        bool valid = false;
        double y = 0.0;
    };

    struct OpenDescent {
        int64_t startFrame = 0;
        double startTime = 0.0;
        double startY = 0.0;
        double lastY = 0.0;
        double lastTime = 0.0;
        double peakSpeed = 0.0;
        bool feetFirst = false;
        int reachFrames = 0;
    };

    FallConfig config_;
    bool hasPrev_ = false;
    double prevTime_ = 0.0;
    Track com_;
    std::array<Track, 2> wrists_;
    std::array<Track, 2> ankles_;
    std::optional<double> lastFeetDrop_;
    std::optional<OpenDescent> open_;
    std::vector<DescentEvent> descents_;

    void close();
};

} // namespace analysis
