#include "core/MotionFSM.hpp"
#include "core/Logger.hpp"
#include "math/Geometry.hpp"

namespace core {

MotionFSM::MotionFSM(Joint joint, const MotionConfig& config, bool trackPauses)
    : joint_(joint), config_(config), trackPauses_(trackPauses) {
    reset();
}

void MotionFSM::reset() {
    state_ = MotionState::Unknown;
    hasPrev_ = false;
    prev_ = JointSample{};
    stillSeconds_ = 0.0;
    stillStart_ = 0.0;
    stillStartFrame_ = 0;
    lastDynamic_ = -1e9;
    lastSpeed_ = 0.0;
    lostFrames_ = 0;
}

const char* MotionFSM::getStateName(MotionState state) {
    switch (state) {
        case MotionState::Unknown: return "UNKNOWN";
        case MotionState::Still:   return "STILL";
        case MotionState::Moving:  return "MOVING";
        default: return "UNKNOWN";
    }
}

MotionState MotionFSM::update(const JointSample& sample) {
    lostFrames_ = 0;

    if (!hasPrev_) {
        prev_ = sample;
        hasPrev_ = true;
        stillSeconds_ = 0.0;
        return state_;
    }

    const double dt = sample.timestamp - prev_.timestamp;
    if (dt <= 0.0) return state_;

    const double speed = math::distance2D(sample.smoothed, prev_.smoothed) / dt;
    lastSpeed_ = speed;

    // Velocity spike, independent of the Still/Moving state
    if (speed >= config_.dynamicVelocity &&
        sample.timestamp - lastDynamic_ >= config_.dynamicRefractorySeconds) {
        lastDynamic_ = sample.timestamp;
        MotionEvent ev;
        ev.kind = MotionEventKind::DynamicMove;
        ev.joint = joint_;
        ev.frameIndex = sample.frameIndex;
        ev.timestamp = sample.timestamp;
        ev.magnitude = speed;
        ev.position = sample.smoothed;
        emit(ev);
    }

    // Apply hysteresis: enter Moving above the high threshold,
    // settle only after dwelling below the low threshold
    if (state_ != MotionState::Moving && speed > config_.moveVelocityEnter) {
        if (state_ == MotionState::Still && trackPauses_) {
            closePause(prev_.timestamp);
        }
        stillSeconds_ = 0.0;
        transitionTo(MotionState::Moving, sample);
    } else if (state_ != MotionState::Still) {
        if (speed < config_.settleVelocityExit) {
            if (stillSeconds_ == 0.0) {
                stillStart_ = prev_.timestamp;
                stillStartFrame_ = prev_.frameIndex;
            }
            stillSeconds_ += dt;
            if (stillSeconds_ >= config_.settleDwellSeconds) {
                transitionTo(MotionState::Still, sample);
            }
        } else {
            stillSeconds_ = 0.0;
        }
    }

    prev_ = sample;
    return state_;
}

void MotionFSM::handleLost() {
    lostFrames_++;

    // Forget history after N frames without an observation
    if (lostFrames_ >= config_.lostToleranceFrames && hasPrev_) {
        if (state_ == MotionState::Still && trackPauses_) {
            closePause(prev_.timestamp);
        }
        if (state_ != MotionState::Unknown) {
            Logger::debug("MotionFSM[", jointName(joint_), "]: ", getStateName(state_), " → UNKNOWN (lost)");
        }
        state_ = MotionState::Unknown;
        hasPrev_ = false;
        stillSeconds_ = 0.0;
    }
}

void MotionFSM::finish() {
    if (hasPrev_ && state_ == MotionState::Still && trackPauses_) {
        closePause(prev_.timestamp);
    }
    hasPrev_ = false;
    state_ = MotionState::Unknown;
}

void MotionFSM::transitionTo(MotionState newState, const JointSample& sample) {
    MotionState oldState = state_;
    state_ = newState;

    Logger::debug("MotionFSM[", jointName(joint_), "]: ", getStateName(oldState), " → ", getStateName(newState),
                  " @", sample.timestamp, "s");

    MotionEvent ev;
    ev.kind = (newState == MotionState::Moving) ? MotionEventKind::MoveStart : MotionEventKind::Settle;
    ev.joint = joint_;
    ev.frameIndex = sample.frameIndex;
    ev.timestamp = sample.timestamp;
    ev.position = sample.smoothed;
    emit(ev);
}

void MotionFSM::closePause(double endTimestamp) {
    const double duration = endTimestamp - stillStart_;
    if (duration < config_.pauseMinSeconds) return;

    MotionEvent ev;
    ev.kind = MotionEventKind::Pause;
    ev.joint = joint_;
    ev.frameIndex = stillStartFrame_;
    ev.timestamp = stillStart_;
    ev.duration = duration;
    ev.position = prev_.smoothed;
    emit(ev);
}

void MotionFSM::emit(MotionEvent event) {
    if (eventCallback_) {
        eventCallback_(event);
    }
}

} // namespace core
