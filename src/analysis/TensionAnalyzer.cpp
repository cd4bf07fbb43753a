#include "analysis/TensionAnalyzer.hpp"
#include "core/Logger.hpp"
#include "math/Geometry.hpp"
#include <algorithm>

namespace analysis {

using core::Joint;
using core::JointSample;
using core::Side;

namespace {

struct Limb {
    Joint shoulder, elbow, wrist, hip, knee, ankle;
};

constexpr std::array<Limb, 2> LIMBS = {{
    {Joint::LeftShoulder, Joint::LeftElbow, Joint::LeftWrist, Joint::LeftHip, Joint::LeftKnee, Joint::LeftAnkle},
    {Joint::RightShoulder, Joint::RightElbow, Joint::RightWrist, Joint::RightHip, Joint::RightKnee, Joint::RightAnkle},
}};

constexpr std::array<Side, 2> SIDES = {Side::Left, Side::Right};

} // namespace

const char* tensionJointName(TensionJoint joint) {
    switch (joint) {
        case TensionJoint::Shoulder:  return "shoulder";
        case TensionJoint::Elbow:     return "elbow";
        case TensionJoint::Knee:      return "knee";
        case TensionJoint::LowerBack: return "lower_back";
        default: return "unknown";
    }
}

const char* tensionKindName(TensionKind kind) {
    switch (kind) {
        case TensionKind::AngleLock: return "angle_lock";
        case TensionKind::Rotation:  return "rotation";
        case TensionKind::Twist:     return "twist";
        default: return "unknown";
    }
}

void TensionAnalyzer::Detector::step(bool condition, double value, bool lowerIsExtreme, int debounce) {
    if (!condition) {
        run = 0;
        return;
    }

    run++;
    const int needed = std::max(1, debounce);
    if (run == needed) count++;   // one event per crossing
    if (run < needed) return;

    if (!hasExtremum) {
        extremum = value;
        hasExtremum = true;
    } else {
        extremum = lowerIsExtreme ? std::min(extremum, value) : std::max(extremum, value);
    }
}

TensionAnalyzer::TensionAnalyzer(TensionConfig config) : config_(std::move(config)) {
    reset();
}

void TensionAnalyzer::reset() {
    frames_ = 0;
    shoulder_ = {};
    elbow_ = {};
    knee_ = {};
    lowerBack_ = {};
    elevatedRun_ = {};
    forearms_ = {};
    shoulders_ = {};
    lumbar_ = {};
    knees_ = {};
}

void TensionAnalyzer::update(const core::LandmarkBuffer& buffer) {
    std::array<JointSample, core::JOINT_COUNT> row;
    for (size_t i = 0; i < core::JOINT_COUNT; ++i) {
        const JointSample* s = buffer.latest(static_cast<Joint>(i));
        if (!s) return;
        row[i] = *s;
    }
    update(row);
}

void TensionAnalyzer::update(const std::array<JointSample, core::JOINT_COUNT>& row) {
    frames_++;
    auto at = [&row](Joint j) -> const JointSample& { return row[core::jointIndex(j)]; };

    bool forearmEval = false, forearmHigh = false;
    bool shoulderEval = false, shoulderHigh = false;
    bool kneeEval = false, kneeHigh = false;

    for (size_t i = 0; i < LIMBS.size(); ++i) {
        const Limb& limb = LIMBS[i];
        const JointSample& shoulder = at(limb.shoulder);
        const JointSample& elbow = at(limb.elbow);
        const JointSample& wrist = at(limb.wrist);
        const JointSample& hip = at(limb.hip);
        const JointSample& knee = at(limb.knee);
        const JointSample& ankle = at(limb.ankle);

        // Elbow: acute angle
        if (shoulder.valid() && elbow.valid() && wrist.valid()) {
            const double angle = math::jointAngleDeg(shoulder.position, elbow.position, wrist.position);
            elbow_[i].step(angle < config_.acuteElbowDeg, angle, true, config_.debounceFrames);
            forearmEval = true;
            forearmHigh = forearmHigh || angle < config_.forearmLowDeg || angle > config_.forearmHighDeg;
        } else {
            elbow_[i].interrupt();
        }

        // Shoulder: elbow held above the shoulder
        if (hip.valid() && shoulder.valid() && elbow.valid()) {
            const bool elevated = elbow.position.y < shoulder.position.y;
            const double angle = math::jointAngleDeg(hip.position, shoulder.position, elbow.position);
            shoulder_[i].step(elevated, angle, false, config_.shoulderLockFrames);
            elevatedRun_[i] = elevated ? elevatedRun_[i] + 1 : 0;
            shoulderEval = true;
            shoulderHigh = shoulderHigh || elevatedRun_[i] >= config_.shoulderHighFrames;
        } else {
            shoulder_[i].interrupt();
            elevatedRun_[i] = 0;
        }

        // Knee: bent knee drifting off the hip-ankle line
        if (hip.valid() && knee.valid() && ankle.valid()) {
            const double angle = math::jointAngleDeg(hip.position, knee.position, ankle.position);
            const double offset = std::abs(knee.position.x - (hip.position.x + ankle.position.x) * 0.5);
            const bool rotated = offset > config_.kneeLateralOffset && angle < config_.kneeLoadedMaxDeg;
            knee_[i].step(rotated, offset, false, config_.debounceFrames);
            kneeEval = true;
            kneeHigh = kneeHigh || (angle >= config_.kneeHighMinDeg && angle <= config_.kneeHighMaxDeg);
        } else {
            knee_[i].interrupt();
        }
    }

    // Lower back: twist between shoulder line and hip line, plus torso tilt
    const JointSample& ls = at(Joint::LeftShoulder);
    const JointSample& rs = at(Joint::RightShoulder);
    const JointSample& lh = at(Joint::LeftHip);
    const JointSample& rh = at(Joint::RightHip);
    if (ls.valid() && rs.valid() && lh.valid() && rh.valid()) {
        double twist = math::angularDifferenceDeg(math::orientationDeg(ls.position, rs.position),
                                                  math::orientationDeg(lh.position, rh.position));
        if (twist > 90.0) twist = 180.0 - twist;
        lowerBack_.step(twist > config_.twistThresholdDeg, twist, false, config_.debounceFrames);

        const cv::Point3d hipCenter = math::midpoint(lh.position, rh.position);
        const cv::Point3d shoulderCenter = math::midpoint(ls.position, rs.position);
        const double tilt = math::angleBetweenDeg(
            cv::Point3d(shoulderCenter.x - hipCenter.x, shoulderCenter.y - hipCenter.y, 0.0),
            cv::Point3d(0.0, -1.0, 0.0));

        lumbar_.evaluated++;
        if (tilt > config_.lumbarHighDeg || twist > config_.lumbarHighDeg) lumbar_.high++;
    } else {
        lowerBack_.interrupt();
    }

    if (forearmEval) { forearms_.evaluated++; if (forearmHigh) forearms_.high++; }
    if (shoulderEval) { shoulders_.evaluated++; if (shoulderHigh) shoulders_.high++; }
    if (kneeEval) { knees_.evaluated++; if (kneeHigh) knees_.high++; }
}

std::vector<TensionEvent> TensionAnalyzer::events() const {
    std::vector<TensionEvent> out;

    auto add = [&out](TensionJoint joint, TensionKind kind, const Detector& d, Side side) {
        if (d.count == 0) return;
        TensionEvent ev;
        ev.joint = joint;
        ev.kind = kind;
        ev.count = d.count;
        ev.extremum = d.extremum;
        ev.side = side;
        out.push_back(ev);
    };

    for (size_t i = 0; i < SIDES.size(); ++i) add(TensionJoint::Shoulder, TensionKind::AngleLock, shoulder_[i], SIDES[i]);
    for (size_t i = 0; i < SIDES.size(); ++i) add(TensionJoint::Elbow, TensionKind::AngleLock, elbow_[i], SIDES[i]);
    for (size_t i = 0; i < SIDES.size(); ++i) add(TensionJoint::Knee, TensionKind::Rotation, knee_[i], SIDES[i]);
    add(TensionJoint::LowerBack, TensionKind::Twist, lowerBack_, Side::None);

    return out;
}

TensionSummary TensionAnalyzer::summary() const {
    TensionSummary s;
    s.frames = frames_;
    s.zoneHighPercent = {
        {"forearms", forearms_.percent()},
        {"shoulders", shoulders_.percent()},
        {"lumbar", lumbar_.percent()},
        {"knees", knees_.percent()},
    };

    s.index = config_.forearmWeight * forearms_.percent() +
              config_.shoulderWeight * shoulders_.percent() +
              config_.lumbarWeight * lumbar_.percent() +
              config_.kneeWeight * knees_.percent();

    if (s.index > config_.riskHigh) {
        s.risk = "HIGH";
    } else if (s.index > config_.riskModerate) {
        s.risk = "MODERATE";
    } else {
        s.risk = "LOW";
    }

    core::Logger::debug("TensionAnalyzer: ", frames_, " frames, index=", s.index, " risk=", s.risk);
    return s;
}

} // namespace analysis
