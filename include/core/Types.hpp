#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <opencv2/core.hpp>

namespace core {

// ============================================================
// Compiled defaults - Landmark Buffer
// ============================================================

constexpr size_t BUFFER_CAPACITY = 3600;       // Rolling window, 2 min @ 30 fps
constexpr double MAX_HOLD_S = 0.5;             // Hold-last-value limit before "lost"
constexpr float MIN_CONFIDENCE = 0.5f;         // Pose provider visibility cutoff
constexpr float COORD_MIN = -0.5f;             // Normalized image coords may overshoot a bit
constexpr float COORD_MAX = 1.5f;

// One Euro smoothing of joint positions
constexpr double SMOOTHING_MIN_CUTOFF = 1.0;
constexpr double SMOOTHING_BETA = 0.007;

// ============================================================
// Compiled defaults - Motion detection (normalized units / s)
// ============================================================

constexpr double MOVE_VELOCITY_ENTER = 0.25;   // Still -> Moving
constexpr double SETTLE_VELOCITY_EXIT = 0.10;  // Moving -> Still (hysteresis gap)
constexpr double SETTLE_DWELL_S = 0.2;         // Time below exit velocity before "settled"
constexpr double DYNAMIC_VELOCITY = 1.2;       // Velocity spike that counts as a dynamic move
constexpr double DYNAMIC_REFRACTORY_S = 0.5;
constexpr double PAUSE_MIN_S = 1.0;            // Centre-of-mass stillness that counts as a pause
constexpr int LOST_TOLERANCE_FRAMES = 5;       // Dropouts before a joint FSM resets

// ============================================================
// Data Structures
// ============================================================

/**
 * Tracked body points.
 * Order and MediaPipe Pose indices match the pose provider; CenterOfMass is
 * derived by the buffer from shoulders, hips, knees and ankles.
 */
enum class Joint : uint8_t {
    Nose = 0,
    LeftShoulder,
    RightShoulder,
    LeftElbow,
    RightElbow,
    LeftWrist,
    RightWrist,
    LeftHip,
    RightHip,
    LeftKnee,
    RightKnee,
    LeftAnkle,
    RightAnkle,
    LeftHeel,
    RightHeel,
    LeftFootIndex,
    RightFootIndex,
    CenterOfMass,
    Count
};

constexpr size_t JOINT_COUNT = static_cast<size_t>(Joint::Count);

constexpr size_t jointIndex(Joint joint) { return static_cast<size_t>(joint); }

enum class Side : uint8_t {
    None = 0,
    Left,
    Right
};

[[nodiscard]] const char* jointName(Joint joint);
[[nodiscard]] std::optional<Joint> jointFromName(const std::string& name);
[[nodiscard]] std::optional<Joint> jointFromMediaPipeIndex(int index);
[[nodiscard]] Side sideOf(Joint joint);
[[nodiscard]] const char* sideName(Side side);

/**
 * Single observation from the pose provider.
 * x/y are normalized image coordinates (y grows downwards), z is optional depth.
 */
struct Landmark {
    float x = 0.0f;
    float y = 0.0f;
    std::optional<float> z;
    float confidence = 0.0f;
};

struct PoseFrame {
    int64_t frameIndex = 0;
    double timestamp = 0.0;    // seconds
    std::map<Joint, Landmark> landmarks;
};

enum class SampleState : uint8_t {
    Observed = 0,   // Accepted from the provider this frame
    Held,           // Rejected, previous position carried forward
    Lost            // Rejected for longer than the hold limit
};

/**
 * Per-joint, per-frame entry of the Landmark Buffer.
 * Every tracked joint receives exactly one sample per accepted frame, so the
 * i-th sample of two joints always belongs to the same frame.
 */
struct JointSample {
    int64_t frameIndex = 0;
    double timestamp = 0.0;
    cv::Point3d position;      // raw (or carried) position
    cv::Point3d smoothed;      // One Euro filtered position
    float confidence = 0.0f;
    SampleState state = SampleState::Lost;
    bool hasDepth = false;

    [[nodiscard]] bool valid() const { return state != SampleState::Lost; }
    [[nodiscard]] bool observed() const { return state == SampleState::Observed; }
};

enum class MotionEventKind : uint8_t {
    MoveStart = 0,   // Limb left its hold
    Settle,          // Limb came to rest after the dwell time
    DynamicMove,     // Velocity spike above the dynamic threshold
    Pause            // Centre-of-mass stillness longer than the pause minimum
};

[[nodiscard]] const char* motionEventName(MotionEventKind kind);

struct MotionEvent {
    uint64_t sequence = 0;
    MotionEventKind kind = MotionEventKind::MoveStart;
    Joint joint = Joint::CenterOfMass;
    int64_t frameIndex = 0;
    double timestamp = 0.0;      // event instant; pause start for Pause
    double duration = 0.0;       // Pause length
    double magnitude = 0.0;      // Peak speed for DynamicMove
    cv::Point3d position;        // Smoothed joint position at the event
    std::optional<double> orientation;  // Heel->toe angle (deg) for foot Settle
};

} // namespace core
