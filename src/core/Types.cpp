#include "core/Types.hpp"

namespace core {

namespace {

constexpr std::array<const char*, JOINT_COUNT> JOINT_NAMES = {
    "nose",
    "left_shoulder", "right_shoulder",
    "left_elbow", "right_elbow",
    "left_wrist", "right_wrist",
    "left_hip", "right_hip",
    "left_knee", "right_knee",
    "left_ankle", "right_ankle",
    "left_heel", "right_heel",
    "left_foot_index", "right_foot_index",
    "center_of_mass"
};

// MediaPipe Pose (33 landmarks); hands and face detail are not tracked.
constexpr std::array<std::pair<int, Joint>, 17> MEDIAPIPE_INDICES = {{
    {0, Joint::Nose},
    {11, Joint::LeftShoulder}, {12, Joint::RightShoulder},
    {13, Joint::LeftElbow}, {14, Joint::RightElbow},
    {15, Joint::LeftWrist}, {16, Joint::RightWrist},
    {23, Joint::LeftHip}, {24, Joint::RightHip},
    {25, Joint::LeftKnee}, {26, Joint::RightKnee},
    {27, Joint::LeftAnkle}, {28, Joint::RightAnkle},
    {29, Joint::LeftHeel}, {30, Joint::RightHeel},
    {31, Joint::LeftFootIndex}, {32, Joint::RightFootIndex},
}};

} // namespace

const char* jointName(Joint joint) {
    const size_t idx = jointIndex(joint);
    return idx < JOINT_COUNT ? JOINT_NAMES[idx] : "unknown";
}

std::optional<Joint> jointFromName(const std::string& name) {
    for (size_t i = 0; i < JOINT_COUNT; ++i) {
        if (name == JOINT_NAMES[i]) return static_cast<Joint>(i);
    }
    return std::nullopt;
}

std::optional<Joint> jointFromMediaPipeIndex(int index) {
    for (const auto& [mpIndex, joint] : MEDIAPIPE_INDICES) {
        if (mpIndex == index) return joint;
    }
    return std::nullopt;
}

Side sideOf(Joint joint) {
    switch (joint) {
        case Joint::Nose:
        case Joint::CenterOfMass:
        case Joint::Count:
            return Side::None;
        default:
            // Left/right joints alternate starting at LeftShoulder = 1
            return (jointIndex(joint) % 2 == 1) ? Side::Left : Side::Right;
    }
}

const char* sideName(Side side) {
    switch (side) {
        case Side::Left:  return "left";
        case Side::Right: return "right";
        default:          return "none";
    }
}

const char* motionEventName(MotionEventKind kind) {
    switch (kind) {
        case MotionEventKind::MoveStart:   return "MOVE_START";
        case MotionEventKind::Settle:      return "SETTLE";
        case MotionEventKind::DynamicMove: return "DYNAMIC_MOVE";
        case MotionEventKind::Pause:       return "PAUSE";
        default: return "UNKNOWN";
    }
}

} // namespace core
