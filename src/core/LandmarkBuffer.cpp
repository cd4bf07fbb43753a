#include "core/LandmarkBuffer.hpp"
#include "math/Geometry.hpp"
#include <cmath>
#include <utility>

namespace core {

namespace {

template<size_t... I>
std::array<RingBuffer<JointSample>, JOINT_COUNT> makeHistoryImpl(size_t capacity, std::index_sequence<I...>) {
    return {{ ((void)I, RingBuffer<JointSample>(capacity))... }};
}

// Segment-mass approximation of the body centre
struct ComWeight {
    Joint joint;
    double weight;
};

constexpr std::array<ComWeight, 8> COM_WEIGHTS = {{
    {Joint::LeftShoulder, 0.10}, {Joint::RightShoulder, 0.10},
    {Joint::LeftHip, 0.20}, {Joint::RightHip, 0.20},
    {Joint::LeftKnee, 0.10}, {Joint::RightKnee, 0.10},
    {Joint::LeftAnkle, 0.10}, {Joint::RightAnkle, 0.10},
}};

bool isFoot(Joint joint) {
    return joint == Joint::LeftAnkle || joint == Joint::RightAnkle;
}

} // namespace

std::array<RingBuffer<JointSample>, JOINT_COUNT> LandmarkBuffer::makeHistory(size_t capacity) {
    return makeHistoryImpl(capacity, std::make_index_sequence<JOINT_COUNT>{});
}

LandmarkBuffer::LandmarkBuffer(BufferConfig config)
    : config_(std::move(config)), history_(makeHistory(config_.capacity)) {
    filters_.fill(math::PointFilter(config_.smoothingMinCutoff, config_.smoothingBeta));

    for (Joint joint : MOTION_JOINTS) {
        auto fsm = std::make_unique<MotionFSM>(joint, config_.motion, joint == Joint::CenterOfMass);
        fsm->setEventCallback([this](const MotionEvent& event) { onMotionEvent(event); });
        fsms_[jointIndex(joint)] = std::move(fsm);
    }
}

AppendStatus LandmarkBuffer::append(const PoseFrame& frame) {
    if (closed_) {
        logOnce_.warn("closed", "LandmarkBuffer: append after session close ignored (frame ", frame.frameIndex, ")");
        return AppendStatus::Closed;
    }

    const bool outOfOrder = !std::isfinite(frame.timestamp) ||
                            (hasLast_ && (frame.frameIndex <= lastIndex_ || frame.timestamp <= lastTimestamp_));
    if (outOfOrder) {
        stats_.droppedFrames++;
        logOnce_.warn("order", "LandmarkBuffer: dropping out-of-order frame ", frame.frameIndex,
                      " (t=", frame.timestamp, "s, last ", lastIndex_, " t=", lastTimestamp_, "s)");
        return AppendStatus::OutOfOrder;
    }

    if (!hasLast_) stats_.firstTimestamp = frame.timestamp;
    hasLast_ = true;
    lastIndex_ = frame.frameIndex;
    lastTimestamp_ = frame.timestamp;
    stats_.lastTimestamp = frame.timestamp;
    stats_.acceptedFrames++;
    if (!frame.landmarks.empty()) stats_.framesWithLandmarks++;

    std::array<JointSample, JOINT_COUNT> row;

    for (size_t i = 0; i < JOINT_COUNT; ++i) {
        const auto joint = static_cast<Joint>(i);
        if (joint == Joint::CenterOfMass) continue;

        auto it = frame.landmarks.find(joint);
        if (it != frame.landmarks.end() && isAcceptable(joint, it->second)) {
            const Landmark& lm = it->second;
            cv::Point3d pos(lm.x, lm.y, lm.z.value_or(0.0f));
            row[i] = makeObserved(joint, pos, lm.confidence, lm.z.has_value(), frame);
        } else {
            row[i] = makeRejected(joint, frame);
        }
    }

    bool comDepth = false;
    if (auto com = centerOfMass(row, comDepth)) {
        row[jointIndex(Joint::CenterOfMass)] =
            makeObserved(Joint::CenterOfMass, com->first, com->second, comDepth, frame);
    } else {
        row[jointIndex(Joint::CenterOfMass)] = makeRejected(Joint::CenterOfMass, frame);
    }

    for (size_t i = 0; i < JOINT_COUNT; ++i) {
        history_[i].push(row[i]);
        session_[i].push_back(row[i]);
        switch (row[i].state) {
            case SampleState::Observed: stats_.observed[i]++; break;
            case SampleState::Held:     stats_.held[i]++; break;
            case SampleState::Lost:     stats_.lost[i]++; break;
        }
    }

    currentRow_ = &row;
    for (Joint joint : MOTION_JOINTS) {
        const size_t i = jointIndex(joint);
        if (row[i].observed()) {
            fsms_[i]->update(row[i]);
        } else {
            fsms_[i]->handleLost();
        }
    }
    currentRow_ = nullptr;

    return AppendStatus::Accepted;
}

bool LandmarkBuffer::isAcceptable(Joint joint, const Landmark& lm) {
    const size_t i = jointIndex(joint);

    const bool finite = std::isfinite(lm.x) && std::isfinite(lm.y) &&
                        (!lm.z || std::isfinite(*lm.z)) && std::isfinite(lm.confidence);
    const bool inRange = finite &&
                         lm.x >= config_.coordMin && lm.x <= config_.coordMax &&
                         lm.y >= config_.coordMin && lm.y <= config_.coordMax;
    if (!inRange) {
        stats_.malformed[i]++;
        logOnce_.warn(std::string("malformed:") + jointName(joint),
                      "LandmarkBuffer: impossible coordinates for ", jointName(joint),
                      " (", lm.x, ", ", lm.y, "), holding last value");
        return false;
    }

    if (lm.confidence < config_.minConfidence[i]) {
        stats_.lowConfidence[i]++;
        logOnce_.warn(std::string("confidence:") + jointName(joint),
                      "LandmarkBuffer: ", jointName(joint), " below confidence minimum (",
                      lm.confidence, " < ", config_.minConfidence[i], "), holding last value");
        return false;
    }
    return true;
}

JointSample LandmarkBuffer::makeObserved(Joint joint, const cv::Point3d& position, float confidence,
                                         bool hasDepth, const PoseFrame& frame) {
    const size_t i = jointIndex(joint);
    JointTrack& track = tracks_[i];

    JointSample sample;
    sample.frameIndex = frame.frameIndex;
    sample.timestamp = frame.timestamp;
    sample.position = position;
    sample.smoothed = config_.smoothing ? filters_[i].filter(position, frame.timestamp) : position;
    sample.confidence = confidence;
    sample.state = SampleState::Observed;
    sample.hasDepth = hasDepth;

    if (track.lost && track.hasObserved) {
        Logger::debug("LandmarkBuffer: ", jointName(joint), " reacquired @", frame.timestamp, "s");
    }
    track.hasObserved = true;
    track.lost = false;
    track.lastObservedTime = frame.timestamp;
    track.lastPosition = sample.position;
    track.lastSmoothed = sample.smoothed;
    track.lastConfidence = confidence;
    track.lastHasDepth = hasDepth;
    return sample;
}

JointSample LandmarkBuffer::makeRejected(Joint joint, const PoseFrame& frame) {
    const size_t i = jointIndex(joint);
    JointTrack& track = tracks_[i];

    JointSample sample;
    sample.frameIndex = frame.frameIndex;
    sample.timestamp = frame.timestamp;
    sample.position = track.lastPosition;
    sample.smoothed = track.lastSmoothed;
    sample.hasDepth = track.lastHasDepth;

    if (track.hasObserved && frame.timestamp - track.lastObservedTime <= config_.maxHoldSeconds) {
        sample.state = SampleState::Held;
        sample.confidence = track.lastConfidence;
        return sample;
    }

    sample.state = SampleState::Lost;
    sample.confidence = 0.0f;
    if (!track.lost) {
        Logger::debug("LandmarkBuffer: ", jointName(joint), " lost @", frame.timestamp, "s");
        track.lost = true;
        filters_[i].reset();
    }
    return sample;
}

std::optional<std::pair<cv::Point3d, float>> LandmarkBuffer::centerOfMass(
        const std::array<JointSample, JOINT_COUNT>& row, bool& hasDepth) {
    const auto& lh = row[jointIndex(Joint::LeftHip)];
    const auto& rh = row[jointIndex(Joint::RightHip)];
    if (!lh.observed() && !rh.observed()) return std::nullopt;

    cv::Point3d sum(0, 0, 0);
    double weight = 0.0;
    double confidence = 0.0;
    hasDepth = true;

    for (const auto& cw : COM_WEIGHTS) {
        const auto& s = row[jointIndex(cw.joint)];
        if (!s.observed()) continue;
        sum += s.position * cw.weight;
        confidence += s.confidence * cw.weight;
        weight += cw.weight;
        hasDepth = hasDepth && s.hasDepth;
    }

    return std::make_pair(sum * (1.0 / weight), static_cast<float>(confidence / weight));
}

void LandmarkBuffer::onMotionEvent(MotionEvent event) {
    event.sequence = nextSequence_++;

    // Foot orientation at settle feeds the pivot filter
    if (event.kind == MotionEventKind::Settle && isFoot(event.joint) && currentRow_) {
        const Side side = sideOf(event.joint);
        const auto& heel = (*currentRow_)[jointIndex(side == Side::Left ? Joint::LeftHeel : Joint::RightHeel)];
        const auto& toe = (*currentRow_)[jointIndex(side == Side::Left ? Joint::LeftFootIndex : Joint::RightFootIndex)];
        if (heel.valid() && toe.valid()) {
            event.orientation = math::orientationDeg(heel.position, toe.position);
        }
    }

    Logger::debug("LandmarkBuffer: event #", event.sequence, " ", motionEventName(event.kind),
                  " ", jointName(event.joint), " @", event.timestamp, "s");
    events_.push_back(event);
}

std::vector<JointSample> LandmarkBuffer::window(Joint joint, double duration) const {
    const auto& h = history_[jointIndex(joint)];
    if (h.empty()) return {};

    const double tEnd = h.back().timestamp;
    size_t start = h.size() - 1;
    while (start > 0 && tEnd - h[start].timestamp < duration) {
        --start;
    }

    std::vector<JointSample> out;
    out.reserve(h.size() - start);
    for (size_t i = start; i < h.size(); ++i) out.push_back(h[i]);
    return out;
}

const std::vector<JointSample>& LandmarkBuffer::samples(Joint joint) const {
    return session_[jointIndex(joint)];
}

std::vector<MotionEvent> LandmarkBuffer::events(MotionEventKind kind) const {
    std::vector<MotionEvent> out;
    for (const auto& ev : events_) {
        if (ev.kind == kind) out.push_back(ev);
    }
    return out;
}

const JointSample* LandmarkBuffer::latest(Joint joint) const {
    const auto& h = history_[jointIndex(joint)];
    return h.empty() ? nullptr : &h.back();
}

MotionState LandmarkBuffer::motionState(Joint joint) const {
    const auto& fsm = fsms_[jointIndex(joint)];
    return fsm ? fsm->getState() : MotionState::Unknown;
}

void LandmarkBuffer::close() {
    if (closed_) return;
    for (auto& fsm : fsms_) {
        if (fsm) fsm->finish();
    }
    closed_ = true;

    Logger::info("LandmarkBuffer: closed after ", stats_.acceptedFrames, " frames (",
                 stats_.droppedFrames, " dropped, ", events_.size(), " events, ",
                 stats_.duration(), "s)");
}

} // namespace core
