#pragma once

#include "Types.hpp"
#include "Logger.hpp"
#include "RingBuffer.hpp"
#include "MotionFSM.hpp"
#include "math/Filters.hpp"
#include <array>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace core {

struct BufferConfig {
    size_t capacity = BUFFER_CAPACITY;
    double maxHoldSeconds = MAX_HOLD_S;
    std::array<float, JOINT_COUNT> minConfidence = defaultMinConfidence();
    float coordMin = COORD_MIN;
    float coordMax = COORD_MAX;
    bool smoothing = true;
    double smoothingMinCutoff = SMOOTHING_MIN_CUTOFF;
    double smoothingBeta = SMOOTHING_BETA;
    MotionConfig motion;

    static std::array<float, JOINT_COUNT> defaultMinConfidence() {
        std::array<float, JOINT_COUNT> values{};
        values.fill(MIN_CONFIDENCE);
        return values;
    }
};

enum class AppendStatus : uint8_t {
    Accepted = 0,
    OutOfOrder,     // frame_index or timestamp not strictly increasing
    Closed          // session already completed
};

struct BufferStats {
    size_t acceptedFrames = 0;
    size_t droppedFrames = 0;
    size_t framesWithLandmarks = 0;
    std::array<size_t, JOINT_COUNT> observed{};
    std::array<size_t, JOINT_COUNT> held{};
    std::array<size_t, JOINT_COUNT> lost{};
    std::array<size_t, JOINT_COUNT> lowConfidence{};
    std::array<size_t, JOINT_COUNT> malformed{};
    double firstTimestamp = 0.0;
    double lastTimestamp = 0.0;

    [[nodiscard]] double duration() const {
        return acceptedFrames > 1 ? lastTimestamp - firstTimestamp : 0.0;
    }
};

/**
 * Rolling per-joint history of one climbing session.
 *
 * - Frames must arrive with strictly increasing index and timestamp;
 *   anything else is dropped (logged once per session).
 * - A joint below its confidence minimum, or with non-finite / out-of-range
 *   coordinates, carries its last position forward for up to maxHoldSeconds,
 *   then is marked Lost until the next accepted observation.
 * - Each tracked joint gets exactly one sample per accepted frame. The
 *   session history keeps every sample for the extractors; the rolling
 *   window keeps the latest `capacity` samples and overwrites the oldest.
 * - Wrists, ankles and the centre of mass drive MotionFSMs whose events form
 *   an append-only log that is never evicted.
 */
class LandmarkBuffer {
public:
    explicit LandmarkBuffer(BufferConfig config = {});

    // Non-copyable (owns per-session filter and FSM state)
    LandmarkBuffer(const LandmarkBuffer&) = delete;
    LandmarkBuffer& operator=(const LandmarkBuffer&) = delete;

    AppendStatus append(const PoseFrame& frame);

    /**
     * Most recent samples of a joint covering at least `duration` seconds,
     * oldest first. Shorter sessions return everything retained (no padding).
     */
    [[nodiscard]] std::vector<JointSample> window(Joint joint, double duration) const;

    /**
     * Every sample of a joint since the session started, oldest first.
     * Not bounded by the rolling window capacity.
     */
    [[nodiscard]] const std::vector<JointSample>& samples(Joint joint) const;

    [[nodiscard]] const std::vector<MotionEvent>& events() const { return events_; }
    [[nodiscard]] std::vector<MotionEvent> events(MotionEventKind kind) const;

    [[nodiscard]] const JointSample* latest(Joint joint) const;
    [[nodiscard]] MotionState motionState(Joint joint) const;

    /**
     * Session complete: flushes open pauses. Later appends return Closed.
     */
    void close();
    [[nodiscard]] bool closed() const { return closed_; }

    [[nodiscard]] const BufferStats& stats() const { return stats_; }
    [[nodiscard]] const BufferConfig& config() const { return config_; }
    [[nodiscard]] size_t size() const { return history_[0].size(); }

    static constexpr std::array<Joint, 5> MOTION_JOINTS = {
        Joint::LeftWrist, Joint::RightWrist, Joint::LeftAnkle, Joint::RightAnkle, Joint::CenterOfMass
    };

private:
    struct JointTrack {
        bool hasObserved = false;
        double lastObservedTime = 0.0;
        cv::Point3d lastPosition;
        cv::Point3d lastSmoothed;
        float lastConfidence = 0.0f;
        bool lastHasDepth = false;
        bool lost = true;
    };

    BufferConfig config_;
    std::array<RingBuffer<JointSample>, JOINT_COUNT> history_;
    std::array<std::vector<JointSample>, JOINT_COUNT> session_;
    std::array<JointTrack, JOINT_COUNT> tracks_;
    std::array<math::PointFilter, JOINT_COUNT> filters_;
    std::array<std::unique_ptr<MotionFSM>, JOINT_COUNT> fsms_;
    std::vector<MotionEvent> events_;
    uint64_t nextSequence_ = 0;

    bool hasLast_ = false;
    int64_t lastIndex_ = 0;
    double lastTimestamp_ = 0.0;
    const std::array<JointSample, JOINT_COUNT>* currentRow_ = nullptr;

    bool closed_ = false;
    BufferStats stats_;
    LogOnce logOnce_;

    static std::array<RingBuffer<JointSample>, JOINT_COUNT> makeHistory(size_t capacity);

    [[nodiscard]] bool isAcceptable(Joint joint, const Landmark& lm);
    JointSample makeObserved(Joint joint, const cv::Point3d& position, float confidence, bool hasDepth,
                             const PoseFrame& frame);
    JointSample makeRejected(Joint joint, const PoseFrame& frame);
    [[nodiscard]] static std::optional<std::pair<cv::Point3d, float>> centerOfMass(
        const std::array<JointSample, JOINT_COUNT>& row, bool& hasDepth);
    void onMotionEvent(MotionEvent event);
};

} // namespace core
