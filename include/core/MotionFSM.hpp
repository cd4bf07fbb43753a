#pragma once

#include "Types.hpp"
#include <functional>

namespace core {

struct MotionConfig {
    double moveVelocityEnter = MOVE_VELOCITY_ENTER;
    double settleVelocityExit = SETTLE_VELOCITY_EXIT;
    double settleDwellSeconds = SETTLE_DWELL_S;
    double dynamicVelocity = DYNAMIC_VELOCITY;
    double dynamicRefractorySeconds = DYNAMIC_REFRACTORY_S;
    double pauseMinSeconds = PAUSE_MIN_S;
    int lostToleranceFrames = LOST_TOLERANCE_FRAMES;
};

enum class MotionState : uint8_t {
    Unknown = 0,   // No valid history yet / joint lost
    Still,
    Moving
};

/**
 * MotionFSM: per-joint movement state machine
 *
 * States: Unknown → Still ⇄ Moving
 *
 * Features:
 * - Hysteresis thresholds (move enter velocity > settle exit velocity)
 * - Dwell: a joint must stay below the exit velocity for settleDwellSeconds
 * - Dynamic move detection with a refractory period
 * - Pause tracking (optional, used for the centre of mass)
 * - Dropout tolerance: resets to Unknown after lostToleranceFrames
 */
class MotionFSM {
public:
    using EventCallback = std::function<void(const MotionEvent& event)>;

    MotionFSM(Joint joint, const MotionConfig& config, bool trackPauses = false);

    /**
     * Update FSM with a new observed sample
     * @param sample Observed joint sample (smoothed position is used)
     * @return Current state
     */
    MotionState update(const JointSample& sample);

    /**
     * Handle a frame without an observed sample (held or lost)
     */
    void handleLost();

    /**
     * Flush state at the end of the session (closes an open pause)
     */
    void finish();

    [[nodiscard]] MotionState getState() const { return state_; }
    [[nodiscard]] static const char* getStateName(MotionState state);
    [[nodiscard]] double lastSpeed() const { return lastSpeed_; }
    [[nodiscard]] Joint joint() const { return joint_; }

    void setEventCallback(EventCallback callback) { eventCallback_ = std::move(callback); }

    void reset();

private:
    Joint joint_;
    MotionConfig config_;
    bool trackPauses_;

    MotionState state_ = MotionState::Unknown;
    bool hasPrev_ = false;
    JointSample prev_;
    double stillSeconds_ = 0.0;
    double stillStart_ = 0.0;
    int64_t stillStartFrame_ = 0;
    double lastDynamic_ = -1e9;
    double lastSpeed_ = 0.0;
    int lostFrames_ = 0;

    EventCallback eventCallback_;

    void transitionTo(MotionState newState, const JointSample& sample);
    void closePause(double endTimestamp);
    void emit(MotionEvent event);
};

} // namespace core
