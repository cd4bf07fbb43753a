#include "analysis/FeatureExtractors.hpp"
#include "core/Logger.hpp"
#include "math/Geometry.hpp"
#include <algorithm>
#include <cmath>

namespace analysis {

using core::Joint;
using core::JointSample;
using core::MotionEvent;
using core::MotionEventKind;
using core::Side;

namespace {

struct Interval {
    double start = 0.0;
    double end = 0.0;
};

bool isHand(Joint joint) {
    return joint == Joint::LeftWrist || joint == Joint::RightWrist;
}

double round1(double v) {
    return std::round(v * 10.0) / 10.0;
}

cv::Point2d planar(const cv::Point3d& p) {
    return {p.x, p.y};
}

// Samples are ordered by frame index, so a binary search finds a frame
std::optional<size_t> indexOfFrame(const std::vector<JointSample>& samples, int64_t frameIndex) {
    auto it = std::lower_bound(samples.begin(), samples.end(), frameIndex,
                               [](const JointSample& s, int64_t idx) { return s.frameIndex < idx; });
    if (it == samples.end() || it->frameIndex != frameIndex) return std::nullopt;
    return static_cast<size_t>(it - samples.begin());
}

const JointSample* sampleAt(const std::vector<JointSample>& samples, int64_t frameIndex) {
    auto idx = indexOfFrame(samples, frameIndex);
    return idx ? &samples[*idx] : nullptr;
}

size_t countObserved(const std::vector<JointSample>& samples) {
    return static_cast<size_t>(std::count_if(samples.begin(), samples.end(),
                                             [](const JointSample& s) { return s.observed(); }));
}

std::vector<MotionEvent> handEvents(const core::LandmarkBuffer& buffer, MotionEventKind kind) {
    std::vector<MotionEvent> out;
    for (const auto& ev : buffer.events()) {
        if (ev.kind == kind && isHand(ev.joint)) out.push_back(ev);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const MotionEvent& a, const MotionEvent& b) { return a.timestamp < b.timestamp; });
    return out;
}

std::vector<Interval> pauseIntervals(const core::LandmarkBuffer& buffer) {
    std::vector<Interval> out;
    for (const auto& ev : buffer.events()) {
        if (ev.kind == MotionEventKind::Pause) out.push_back({ev.timestamp, ev.timestamp + ev.duration});
    }
    return out;
}

bool insideAny(const std::vector<Interval>& intervals, double t) {
    return std::any_of(intervals.begin(), intervals.end(),
                       [t](const Interval& iv) { return t >= iv.start && t <= iv.end; });
}

bool overlapsAny(const std::vector<Interval>& intervals, double a, double b) {
    return std::any_of(intervals.begin(), intervals.end(),
                       [a, b](const Interval& iv) { return iv.start < b && iv.end > a; });
}

/**
 * Acceleration magnitude (image plane) at sample k from its neighbours.
 * Empty when a neighbour is not observed.
 */
std::optional<double> accelerationAt(const std::vector<JointSample>& s, size_t k, double minSpeed = -1.0) {
    if (k == 0 || k + 1 >= s.size()) return std::nullopt;
    if (!s[k - 1].observed() || !s[k].observed() || !s[k + 1].observed()) return std::nullopt;

    const double dt1 = s[k].timestamp - s[k - 1].timestamp;
    const double dt2 = s[k + 1].timestamp - s[k].timestamp;
    if (dt1 <= 0.0 || dt2 <= 0.0) return std::nullopt;

    const cv::Point2d v1 = (planar(s[k].position) - planar(s[k - 1].position)) * (1.0 / dt1);
    const cv::Point2d v2 = (planar(s[k + 1].position) - planar(s[k].position)) * (1.0 / dt2);
    if (minSpeed >= 0.0 && cv::norm(v2) < minSpeed) return std::nullopt;

    return cv::norm(v2 - v1) / ((dt1 + dt2) * 0.5);
}

} // namespace

const char* gradeBracketLabel(GradeBracket bracket) {
    switch (bracket) {
        case GradeBracket::Beginner:     return "5a-5c";
        case GradeBracket::Intermediate: return "6a-6b";
        case GradeBracket::Advanced:     return "6c-7a";
        case GradeBracket::Expert:       return "7b+";
        default: return "unknown";
    }
}

std::optional<GradeBracket> gradeBracketFromLabel(const std::string& label) {
    for (auto b : {GradeBracket::Beginner, GradeBracket::Intermediate, GradeBracket::Advanced, GradeBracket::Expert}) {
        if (label == gradeBracketLabel(b)) return b;
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════
// QUIET FEET
// A foot settle starts a hold. Settling again within the hold radius,
// before the COM has climbed past it, is a reposition, unless only the
// heel->toe direction changed (pivot). Nearby settles without a known
// COM are skipped.
// ═══════════════════════════════════════════════════════════

ExtractionResult extractQuietFeet(const core::LandmarkBuffer& buffer, const ExtractorConfig& config) {
    const auto& com = buffer.samples(Joint::CenterOfMass);
    const size_t valid = countObserved(buffer.samples(Joint::LeftAnkle)) +
                         countObserved(buffer.samples(Joint::RightAnkle));
    if (valid < config.minValidSamples) {
        return ExtractionResult::insufficient(Category::QuietFeet, "too few valid foot samples", valid);
    }

    struct Hold {
        cv::Point3d position;
        std::optional<double> orientation;
        std::optional<double> comY;
    };

    size_t holds = 0;
    size_t repositions = 0;
    size_t pivots = 0;

    for (Joint foot : {Joint::LeftAnkle, Joint::RightAnkle}) {
        std::optional<Hold> current;
        for (const auto& ev : buffer.events()) {
            if (ev.joint != foot || ev.kind != MotionEventKind::Settle) continue;

            std::optional<double> comY;
            if (const JointSample* c = sampleAt(com, ev.frameIndex); c && c->valid()) {
                comY = c->smoothed.y;
            }

            bool sameHold = false;
            if (current && math::distance2D(ev.position, current->position) <= config.holdRadius) {
                if (!comY || !current->comY) {
                    // COM unknown at one of the settles: neither a new hold nor a reposition
                    core::Logger::debug("QuietFeet: ", core::jointName(foot), " settle @", ev.timestamp,
                                        "s without centre of mass, not counted");
                    current = Hold{ev.position, ev.orientation, comY};
                    continue;
                }
                // y grows downwards: climbing means comY decreases
                sameHold = (*current->comY - *comY) <= config.comAdvance;
            }

            if (!sameHold) {
                holds++;
                current = Hold{ev.position, ev.orientation, comY};
                continue;
            }

            const bool pivot = ev.orientation && current->orientation &&
                               math::angularDifferenceDeg(*ev.orientation, *current->orientation) >= config.pivotAngleDeg;
            if (pivot) {
                pivots++;
            } else {
                repositions++;
            }
            current->position = ev.position;
            current->orientation = ev.orientation;
        }
    }

    if (holds < config.minEvents) {
        return ExtractionResult::insufficient(Category::QuietFeet,
                                              core::Logger::format("only ", holds, " footholds detected"), valid);
    }

    const double perHold = static_cast<double>(repositions) / static_cast<double>(holds);
    const double norm = config.repositionNorm();
    const double deviation = (perHold - norm) / norm;

    core::Logger::debug("QuietFeet: holds=", holds, " repositions=", repositions, " pivots=", pivots,
                        " norm=", norm, " (", gradeBracketLabel(config.bracket), ")");

    RawSignal signal;
    signal.category = Category::QuietFeet;
    signal.value = deviation;
    signal.validSamples = valid;
    signal.fields = {
        {"repositions", round1(perHold)},
        {"norm", norm},
        {"holds", static_cast<double>(holds)},
        {"pivots", static_cast<double>(pivots)},
        {"deviation", deviation},
    };
    return ExtractionResult::success(std::move(signal));
}

// ═══════════════════════════════════════════════════════════
// HIP POSITION
// Angle of the hip-centre -> shoulder-centre vector against the wall's
// up axis; depth separation between hips and shoulders (hips away from
// the wall) adds to the deviation.
// ═══════════════════════════════════════════════════════════

ExtractionResult extractHipPosition(const core::LandmarkBuffer& buffer, const ExtractorConfig& config) {
    const auto& ls = buffer.samples(Joint::LeftShoulder);
    const auto& rs = buffer.samples(Joint::RightShoulder);
    const auto& lh = buffer.samples(Joint::LeftHip);
    const auto& rh = buffer.samples(Joint::RightHip);
    const auto pauses = pauseIntervals(buffer);

    const cv::Point3d wallUp(0.0, -1.0, 0.0);
    std::vector<double> deviations;

    for (size_t i = 0; i < ls.size(); ++i) {
        if (!ls[i].observed() || !rs[i].observed() || !lh[i].observed() || !rh[i].observed()) continue;
        if (insideAny(pauses, ls[i].timestamp)) continue;

        const cv::Point3d hipCenter = math::midpoint(lh[i].position, rh[i].position);
        const cv::Point3d shoulderCenter = math::midpoint(ls[i].position, rs[i].position);
        const cv::Point3d torso(shoulderCenter.x - hipCenter.x, shoulderCenter.y - hipCenter.y, 0.0);

        double angle = math::angleBetweenDeg(torso, wallUp);

        const bool depth = ls[i].hasDepth && rs[i].hasDepth && lh[i].hasDepth && rh[i].hasDepth;
        if (depth) {
            const double gap = std::abs(hipCenter.z - shoulderCenter.z);
            if (gap > config.hipDepthTolerance) angle += gap * config.hipDepthPenalty;
        }
        deviations.push_back(angle);
    }

    if (deviations.size() < config.minValidSamples) {
        return ExtractionResult::insufficient(Category::HipPosition, "too few frames with hips and shoulders visible",
                                              deviations.size());
    }

    const double deviation = math::mean(deviations);
    // Extra share of body weight the arms carry when the hips leave the wall
    const double overload = std::clamp((deviation - 5.0) * 1.5, 0.0, 60.0);

    RawSignal signal;
    signal.category = Category::HipPosition;
    signal.value = deviation;
    signal.validSamples = deviations.size();
    signal.fields = {
        {"angle", round1(deviation)},
        {"overload", std::round(overload)},
    };
    return ExtractionResult::success(std::move(signal));
}

// ═══════════════════════════════════════════════════════════
// DIAGONAL COORDINATION
// ═══════════════════════════════════════════════════════════

ExtractionResult extractDiagonal(const core::LandmarkBuffer& buffer, const ExtractorConfig& config) {
    const auto& la = buffer.samples(Joint::LeftAnkle);
    const auto& ra = buffer.samples(Joint::RightAnkle);
    const auto& com = buffer.samples(Joint::CenterOfMass);

    size_t classified = 0;
    size_t diagonal = 0;
    std::vector<double> sways;

    for (const auto& ev : handEvents(buffer, MotionEventKind::MoveStart)) {
        const auto idx = indexOfFrame(com, ev.frameIndex);
        if (!idx) continue;
        const JointSample& l = la[*idx];
        const JointSample& r = ra[*idx];
        const JointSample& c = com[*idx];
        if (!l.valid() || !r.valid() || !c.valid()) continue;

        // Loaded foot: the one horizontally closest to the centre of mass
        const Side loaded = std::abs(l.position.x - c.position.x) <= std::abs(r.position.x - c.position.x)
                                ? Side::Left : Side::Right;
        classified++;
        if (loaded != core::sideOf(ev.joint)) diagonal++;

        double lo = c.position.x;
        double hi = c.position.x;
        for (size_t k = *idx; k < com.size() && com[k].timestamp <= ev.timestamp + config.swayWindowSeconds; ++k) {
            if (!com[k].observed()) continue;
            lo = std::min(lo, com[k].position.x);
            hi = std::max(hi, com[k].position.x);
        }
        sways.push_back(hi - lo);
    }

    if (classified < config.minEvents) {
        return ExtractionResult::insufficient(Category::Diagonal,
                                              core::Logger::format("only ", classified, " classifiable hand moves"),
                                              classified);
    }

    const double fraction = static_cast<double>(diagonal) / static_cast<double>(classified);

    RawSignal signal;
    signal.category = Category::Diagonal;
    signal.value = fraction;
    signal.validSamples = classified;
    signal.fields = {
        {"diagonal_pct", round1(fraction * 100.0)},
        {"events", static_cast<double>(classified)},
        {"sway", math::mean(sways)},
    };
    return ExtractionResult::success(std::move(signal));
}

// ═══════════════════════════════════════════════════════════
// ROUTE READING
// ═══════════════════════════════════════════════════════════

ExtractionResult extractRouteReading(const core::LandmarkBuffer& buffer, const ExtractorConfig& config) {
    const size_t valid = countObserved(buffer.samples(Joint::CenterOfMass));
    if (valid < config.minValidSamples) {
        return ExtractionResult::insufficient(Category::RouteReading, "too few valid body samples", valid);
    }

    const auto moves = handEvents(buffer, MotionEventKind::MoveStart);
    if (moves.empty()) {
        return ExtractionResult::insufficient(Category::RouteReading, "no hand movement detected", valid);
    }

    const double firstMove = moves.front().timestamp;
    const double preview = std::max(0.0, firstMove - buffer.stats().firstTimestamp);

    size_t pauses = 0;
    for (const auto& ev : buffer.events()) {
        if (ev.kind == MotionEventKind::Pause && ev.timestamp >= firstMove) pauses++;
    }

    RawSignal signal;
    signal.category = Category::RouteReading;
    signal.value = preview;
    signal.validSamples = valid;
    signal.fields = {
        {"preview_time", round1(preview)},
        {"pauses", static_cast<double>(pauses)},
    };
    return ExtractionResult::success(std::move(signal));
}

// ═══════════════════════════════════════════════════════════
// RHYTHM
// ═══════════════════════════════════════════════════════════

ExtractionResult extractRhythm(const core::LandmarkBuffer& buffer, const ExtractorConfig& config) {
    const auto moves = handEvents(buffer, MotionEventKind::MoveStart);
    const auto pauses = pauseIntervals(buffer);

    std::vector<double> intervalsMs;
    for (size_t i = 1; i < moves.size(); ++i) {
        const double a = moves[i - 1].timestamp;
        const double b = moves[i].timestamp;
        if (overlapsAny(pauses, a, b)) continue;
        intervalsMs.push_back((b - a) * 1000.0);
    }

    if (intervalsMs.size() < config.minEvents) {
        return ExtractionResult::insufficient(Category::Rhythm,
                                              core::Logger::format("only ", intervalsMs.size(), " move intervals"),
                                              intervalsMs.size());
    }

    const double spread = math::stddev(intervalsMs);

    RawSignal signal;
    signal.category = Category::Rhythm;
    signal.value = spread;
    signal.validSamples = intervalsMs.size();
    signal.fields = {
        {"variance", std::round(spread)},
        {"moves", static_cast<double>(intervalsMs.size())},
        {"mean_interval", std::round(math::mean(intervalsMs))},
    };
    return ExtractionResult::success(std::move(signal));
}

// ═══════════════════════════════════════════════════════════
// DYNAMIC CONTROL
// ═══════════════════════════════════════════════════════════

ExtractionResult extractDynamicControl(const core::LandmarkBuffer& buffer, const ExtractorConfig& config) {
    const auto dynamics = handEvents(buffer, MotionEventKind::DynamicMove);
    const auto settles = handEvents(buffer, MotionEventKind::Settle);

    std::vector<double> settleTimes;
    for (const auto& dyn : dynamics) {
        double settle = config.maxSettleSeconds;
        for (const auto& s : settles) {
            if (s.joint == dyn.joint && s.timestamp > dyn.timestamp) {
                settle = std::min(settle, s.timestamp - dyn.timestamp);
                break;
            }
        }
        settleTimes.push_back(settle);
    }

    if (settleTimes.empty()) {
        return ExtractionResult::insufficient(Category::DynamicControl, "no dynamic moves detected");
    }

    const double avg = math::mean(settleTimes);

    RawSignal signal;
    signal.category = Category::DynamicControl;
    signal.value = avg;
    signal.validSamples = settleTimes.size();
    signal.fields = {
        {"time", round1(avg)},
        {"moves", static_cast<double>(settleTimes.size())},
    };
    return ExtractionResult::success(std::move(signal));
}

// ═══════════════════════════════════════════════════════════
// GRIP RELEASE
// ═══════════════════════════════════════════════════════════

ExtractionResult extractGripRelease(const core::LandmarkBuffer& buffer, const ExtractorConfig& config) {
    const auto& left = buffer.samples(Joint::LeftWrist);
    const auto& right = buffer.samples(Joint::RightWrist);

    std::vector<double> peaks;
    for (const auto& ev : handEvents(buffer, MotionEventKind::MoveStart)) {
        const auto& s = (ev.joint == Joint::LeftWrist) ? left : right;
        const auto idx = indexOfFrame(s, ev.frameIndex);
        if (!idx) continue;

        const size_t from = *idx > config.jerkHalfWindow ? *idx - config.jerkHalfWindow : 0;
        const size_t to = *idx + config.jerkHalfWindow;
        std::optional<double> peak;
        for (size_t k = from; k <= to; ++k) {
            if (auto a = accelerationAt(s, k)) {
                peak = std::max(peak.value_or(0.0), *a);
            }
        }
        if (peak) peaks.push_back(*peak);
    }

    if (peaks.size() < config.minEvents) {
        return ExtractionResult::insufficient(Category::GripRelease,
                                              core::Logger::format("only ", peaks.size(), " measurable releases"),
                                              peaks.size());
    }

    const double jerk = math::mean(peaks);

    RawSignal signal;
    signal.category = Category::GripRelease;
    signal.value = jerk;
    signal.validSamples = peaks.size();
    signal.fields = {
        {"jerk", round1(jerk)},
        {"releases", static_cast<double>(peaks.size())},
    };
    return ExtractionResult::success(std::move(signal));
}

// ═══════════════════════════════════════════════════════════
// STABILITY: COM variance over sliding windows
// ═══════════════════════════════════════════════════════════

ExtractionResult extractStability(const core::LandmarkBuffer& buffer, const ExtractorConfig& config) {
    const auto& com = buffer.samples(Joint::CenterOfMass);
    const size_t w = std::max<size_t>(config.stabilityWindow, 2);

    std::vector<double> variances;
    std::vector<double> xs;
    std::vector<double> ys;
    size_t run = 0;   // consecutive observed samples ending at i

    for (size_t i = 0; i < com.size(); ++i) {
        run = com[i].observed() ? run + 1 : 0;
        if (run < w) continue;

        xs.clear();
        ys.clear();
        for (size_t k = i + 1 - w; k <= i; ++k) {
            xs.push_back(com[k].position.x);
            ys.push_back(com[k].position.y);
        }
        const double sx = math::stddev(xs);
        const double sy = math::stddev(ys);
        variances.push_back(sx * sx + sy * sy);
    }

    if (variances.empty()) {
        return ExtractionResult::insufficient(Category::Stability, "no continuous centre-of-mass window",
                                              countObserved(com));
    }

    const double avg = math::mean(variances);

    RawSignal signal;
    signal.category = Category::Stability;
    signal.value = avg;
    signal.validSamples = variances.size();
    signal.fields = {{"variance", avg}};
    return ExtractionResult::success(std::move(signal));
}

// ═══════════════════════════════════════════════════════════
// EXHAUSTION: hand smoothness, first vs last quarter of the moving frames
// ═══════════════════════════════════════════════════════════

ExtractionResult extractExhaustion(const core::LandmarkBuffer& buffer, const ExtractorConfig& config) {
    const auto& left = buffer.samples(Joint::LeftWrist);
    const auto& right = buffer.samples(Joint::RightWrist);
    const double minSpeed = buffer.config().motion.settleVelocityExit;

    std::vector<double> quality;
    for (size_t i = 1; i + 1 < left.size(); ++i) {
        double sum = 0.0;
        int n = 0;
        for (const auto* s : {&left, &right}) {
            if (auto a = accelerationAt(*s, i, minSpeed)) {
                sum += *a;
                n++;
            }
        }
        if (n > 0) quality.push_back(100.0 / (1.0 + (sum / n) / config.exhaustionJerkReference));
    }

    const size_t quarter = quality.size() / 4;
    if (quality.size() < config.exhaustionMinSamples || quarter < 5) {
        return ExtractionResult::insufficient(Category::Exhaustion, "too few moving hand samples", quality.size());
    }

    const double q1 = math::mean(std::vector<double>(quality.begin(), quality.begin() + quarter));
    const double q4 = math::mean(std::vector<double>(quality.begin() + 3 * quarter, quality.end()));
    const double percent = q1 > 0.0 ? std::clamp((q1 - q4) / q1 * 100.0, 0.0, 100.0) : 0.0;

    RawSignal signal;
    signal.category = Category::Exhaustion;
    signal.value = percent;
    signal.validSamples = quality.size();
    signal.fields = {{"percent", std::round(percent)}};
    return ExtractionResult::success(std::move(signal));
}

// ═══════════════════════════════════════════════════════════
// LOAD DISTRIBUTION
// Limb height relative to the hip centre approximates the load it
// carries; arms are weighted 1.5, legs 1.2, then normalized to 100 %.
// ═══════════════════════════════════════════════════════════

std::pair<ExtractionResult, ExtractionResult> extractLoadDistribution(const core::LandmarkBuffer& buffer,
                                                                      const ExtractorConfig& config) {
    const auto& lw = buffer.samples(Joint::LeftWrist);
    const auto& rw = buffer.samples(Joint::RightWrist);
    const auto& la = buffer.samples(Joint::LeftAnkle);
    const auto& ra = buffer.samples(Joint::RightAnkle);
    const auto& lh = buffer.samples(Joint::LeftHip);
    const auto& rh = buffer.samples(Joint::RightHip);

    std::vector<double> armLoads;
    std::vector<double> legLoads;

    for (size_t i = 0; i < lw.size(); ++i) {
        if (!lw[i].observed() || !rw[i].observed() || !la[i].observed() ||
            !ra[i].observed() || !lh[i].observed() || !rh[i].observed()) continue;

        const double hipY = (lh[i].position.y + rh[i].position.y) * 0.5;
        const double arms = (std::abs(hipY - lw[i].position.y) + std::abs(hipY - rw[i].position.y)) * 1.5;
        const double legs = (std::abs(la[i].position.y - hipY) + std::abs(ra[i].position.y - hipY)) * 1.2;
        const double total = arms + legs;
        if (total <= 0.0) continue;

        armLoads.push_back(arms / total * 100.0);
        legLoads.push_back(legs / total * 100.0);
    }

    if (armLoads.size() < config.minValidSamples) {
        return {
            ExtractionResult::insufficient(Category::ArmEfficiency, "too few frames with all limbs visible", armLoads.size()),
            ExtractionResult::insufficient(Category::LegEfficiency, "too few frames with all limbs visible", legLoads.size())
        };
    }

    const double arm = math::mean(armLoads);
    const double leg = math::mean(legLoads);

    RawSignal armSignal;
    armSignal.category = Category::ArmEfficiency;
    armSignal.value = arm;
    armSignal.validSamples = armLoads.size();
    armSignal.fields = {{"arm_load", std::round(arm)}};

    RawSignal legSignal;
    legSignal.category = Category::LegEfficiency;
    legSignal.value = leg;
    legSignal.validSamples = legLoads.size();
    legSignal.fields = {{"leg_load", std::round(leg)}};

    return {ExtractionResult::success(std::move(armSignal)), ExtractionResult::success(std::move(legSignal))};
}

SessionStats extractSessionStats(const core::LandmarkBuffer& buffer) {
    SessionStats stats;
    for (const auto& ev : buffer.events()) {
        if (ev.kind == MotionEventKind::MoveStart && isHand(ev.joint)) stats.handMoves++;
        if (ev.kind == MotionEventKind::DynamicMove && isHand(ev.joint)) stats.dynamicMoves++;
        if (ev.kind == MotionEventKind::Pause) stats.pauses++;
    }

    const auto& lw = buffer.samples(Joint::LeftWrist);
    const auto& rw = buffer.samples(Joint::RightWrist);
    const auto& ls = buffer.samples(Joint::LeftShoulder);
    const auto& rs = buffer.samples(Joint::RightShoulder);
    const auto& la = buffer.samples(Joint::LeftAnkle);
    const auto& ra = buffer.samples(Joint::RightAnkle);

    for (size_t i = 0; i < lw.size(); ++i) {
        if (!lw[i].observed() || !rw[i].observed() || !ls[i].observed() ||
            !rs[i].observed() || !la[i].observed() || !ra[i].observed()) continue;

        const double height = math::distance2D(math::midpoint(ls[i].position, rs[i].position),
                                               math::midpoint(la[i].position, ra[i].position));
        if (height < 1e-6) continue;
        stats.maxReachRatio = std::max(stats.maxReachRatio, math::distance2D(lw[i].position, rw[i].position) / height);
    }

    const auto& bs = buffer.stats();
    stats.durationSeconds = bs.duration();
    stats.acceptedFrames = bs.acceptedFrames;
    stats.droppedFrames = bs.droppedFrames;
    return stats;
}

std::vector<ExtractionResult> extractAll(const core::LandmarkBuffer& buffer, const ExtractorConfig& config) {
    std::vector<ExtractionResult> results;
    results.reserve(CATEGORY_COUNT);

    results.push_back(extractQuietFeet(buffer, config));
    results.push_back(extractHipPosition(buffer, config));
    results.push_back(extractDiagonal(buffer, config));
    results.push_back(extractRouteReading(buffer, config));
    results.push_back(extractRhythm(buffer, config));
    results.push_back(extractDynamicControl(buffer, config));
    results.push_back(extractGripRelease(buffer, config));
    results.push_back(extractStability(buffer, config));
    results.push_back(extractExhaustion(buffer, config));

    auto [arm, leg] = extractLoadDistribution(buffer, config);
    results.push_back(std::move(arm));
    results.push_back(std::move(leg));

    for (const auto& r : results) {
        if (!r.ok()) {
            core::Logger::info("Extractor: ", categoryName(r.category), " insufficient data (", r.reason, ")");
        }
    }
    return results;
}

} // namespace analysis
