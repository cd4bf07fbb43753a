#include "analysis/FallDetector.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace analysis {

using core::Joint;
using core::JointSample;

namespace {

constexpr std::array<Joint, 2> WRISTS = {Joint::LeftWrist, Joint::RightWrist};
constexpr std::array<Joint, 2> ANKLES = {Joint::LeftAnkle, Joint::RightAnkle};

} // namespace

const char* descentKindName(DescentKind kind) {
    switch (kind) {
        case DescentKind::Controlled: return "controlled";
        case DescentKind::Fall:       return "fall";
        default: return "unknown";
    }
}

FallDetector::FallDetector(FallConfig config) : config_(std::move(config)) {
    reset();
}

void FallDetector::reset() {
    hasPrev_ = false;
    prevTime_ = 0.0;
    com_ = {};
    wrists_ = {};
    ankles_ = {};
    lastFeetDrop_.reset();
    open_.reset();
    descents_.clear();
}

void FallDetector::update(const core::LandmarkBuffer& buffer) {
    std::array<JointSample, core::JOINT_COUNT> row;
    for (size_t i = 0; i < core::JOINT_COUNT; ++i) {
        const JointSample* s = buffer.latest(static_cast<Joint>(i));
        if (!s) return;
        row[i] = *s;
    }
    update(row);
}

void FallDetector::update(const std::array<JointSample, core::JOINT_COUNT>& row) {
    const JointSample& com = row[core::jointIndex(Joint::CenterOfMass)];
    const double t = com.timestamp;
    const double dt = hasPrev_ ? t - prevTime_ : 0.0;
    const bool timed = hasPrev_ && dt > 0.0;

    // Only earlier frames count as the feet leading
    const bool feetLed = lastFeetDrop_ && t - *lastFeetDrop_ <= config_.feetLeadSeconds;

    bool reaching = false;
    bool feetDropping = false;
    for (size_t side = 0; side < 2; ++side) {
        const JointSample& w = row[core::jointIndex(WRISTS[side])];
        if (timed && w.observed() && wrists_[side].valid &&
            (wrists_[side].y - w.smoothed.y) / dt >= config_.handReachSpeed) {
            reaching = true;
        }
        wrists_[side] = {w.observed(), w.smoothed.y};

        const JointSample& a = row[core::jointIndex(ANKLES[side])];
        if (timed && a.observed() && ankles_[side].valid &&
            (a.smoothed.y - ankles_[side].y) / dt >= config_.openSpeed) {
            feetDropping = true;
        }
        ankles_[side] = {a.observed(), a.smoothed.y};
    }

    if (!com.observed()) {
        if (open_) {
            core::Logger::debug("FallDetector: centre of mass lost during descent @", t, "s");
            close();
        }
        com_ = {};
    } else {
        const double y = com.smoothed.y;
        if (timed && com_.valid) {
            const double speed = (y - com_.y) / dt;
            if (!open_) {
                if (speed >= config_.openSpeed) {
                    open_ = OpenDescent{com.frameIndex, t, com_.y, y, t, speed, feetLed, reaching ? 1 : 0};
                }
            } else if (speed < config_.openSpeed * config_.closeFraction) {
                close();
            } else {
                open_->lastY = y;
                open_->lastTime = t;
                open_->peakSpeed = std::max(open_->peakSpeed, speed);
                if (reaching) open_->reachFrames++;
            }
        }
        com_ = {true, y};
    }

    if (feetDropping) lastFeetDrop_ = t;
    hasPrev_ = true;
    prevTime_ = t;
}

void FallDetector::finish() {
    if (open_) close();
}

void FallDetector::close() {
    const OpenDescent d = *open_;
    open_.reset();

    const double drop = d.lastY - d.startY;
    if (drop < config_.minDrop) {
        core::Logger::debug("FallDetector: drop of ", drop, " @", d.startTime, "s too short, ignored");
        return;
    }

    DescentEvent e;
    e.startFrame = d.startFrame;
    e.startTime = d.startTime;
    e.endTime = d.lastTime;
    e.drop = drop;
    e.peakSpeed = d.peakSpeed;
    e.feetFirst = d.feetFirst;
    e.handsReaching = d.reachFrames >= config_.handReachFrames;

    const bool sudden = e.peakSpeed >= config_.fallPeakSpeed;
    e.kind = sudden && (e.handsReaching || !e.feetFirst) ? DescentKind::Fall : DescentKind::Controlled;

    if (e.kind == DescentKind::Fall) {
        core::Logger::warn("FallDetector: fall @", e.startTime, "s (drop ", e.drop, ", peak ", e.peakSpeed,
                           "/s, feet first ", (e.feetFirst ? "yes" : "no"), ", hands reaching ",
                           (e.handsReaching ? "yes" : "no"), ")");
    } else {
        core::Logger::info("FallDetector: controlled descent @", e.startTime, "s (drop ", e.drop,
                           ", peak ", e.peakSpeed, "/s)");
    }
    descents_.push_back(e);
}

FallSummary FallDetector::summary() const {
    FallSummary s;
    s.descents = descents_;
    for (const auto& d : descents_) {
        if (d.kind == DescentKind::Fall) {
            s.falls++;
        } else {
            s.controlled++;
        }
    }
    return s;
}

} // namespace analysis
