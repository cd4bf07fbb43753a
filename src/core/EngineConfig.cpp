#include "core/EngineConfig.hpp"
#include <opencv2/core.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace core {

namespace {

bool present(const cv::FileNode& node) {
    return !node.empty() && !node.isNone();
}

template<typename T>
void read(const cv::FileNode& section, const char* key, T& target) {
    const cv::FileNode node = section[key];
    if (!present(node)) return;

    if (!node.isInt() && !node.isReal()) {
        Logger::warn("EngineConfig: ", section.name(), ".", key, " is not a number, keeping default");
        return;
    }
    const double value = node.real();
    if constexpr (std::is_unsigned_v<T>) {
        if (value < 0.0) {
            Logger::warn("EngineConfig: ", section.name(), ".", key, " must not be negative, keeping default");
            return;
        }
    }
    target = static_cast<T>(value);
}

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info")  return LogLevel::INFO;
    if (name == "warn")  return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return std::nullopt;
}

void readBuffer(const cv::FileNode& node, BufferConfig& config) {
    if (!node.isMap()) return;

    size_t capacity = config.capacity;
    read(node, "capacity", capacity);
    if (capacity == 0) {
        Logger::warn("EngineConfig: buffer.capacity must be positive, keeping ", config.capacity);
    } else {
        config.capacity = capacity;
    }

    read(node, "max_hold_s", config.maxHoldSeconds);
    read(node, "coord_min", config.coordMin);
    read(node, "coord_max", config.coordMax);
    read(node, "smoothing", config.smoothing);
    read(node, "smoothing_min_cutoff", config.smoothingMinCutoff);
    read(node, "smoothing_beta", config.smoothingBeta);

    // Either one value for every joint or a per-joint mapping
    const cv::FileNode confidence = node["min_confidence"];
    if (confidence.isInt() || confidence.isReal()) {
        config.minConfidence.fill(static_cast<float>(confidence.real()));
    } else if (confidence.isMap()) {
        for (cv::FileNodeIterator it = confidence.begin(); it != confidence.end(); ++it) {
            const cv::FileNode entry = *it;
            auto joint = jointFromName(entry.name());
            if (!joint || !(entry.isInt() || entry.isReal())) {
                Logger::warn("EngineConfig: ignoring buffer.min_confidence.", entry.name());
                continue;
            }
            config.minConfidence[jointIndex(*joint)] = static_cast<float>(entry.real());
        }
    }
}

void readMotion(const cv::FileNode& node, MotionConfig& config) {
    if (!node.isMap()) return;
    read(node, "move_velocity_enter", config.moveVelocityEnter);
    read(node, "settle_velocity_exit", config.settleVelocityExit);
    read(node, "settle_dwell_s", config.settleDwellSeconds);
    read(node, "dynamic_velocity", config.dynamicVelocity);
    read(node, "dynamic_refractory_s", config.dynamicRefractorySeconds);
    read(node, "pause_min_s", config.pauseMinSeconds);
    read(node, "lost_tolerance_frames", config.lostToleranceFrames);

    if (config.settleVelocityExit > config.moveVelocityEnter) {
        Logger::warn("EngineConfig: motion.settle_velocity_exit above move_velocity_enter, hysteresis disabled");
    }
}

void readExtractor(const cv::FileNode& node, analysis::ExtractorConfig& config) {
    if (!node.isMap()) return;
    read(node, "min_valid_samples", config.minValidSamples);
    read(node, "min_events", config.minEvents);
    read(node, "hold_radius", config.holdRadius);
    read(node, "pivot_angle_deg", config.pivotAngleDeg);
    read(node, "com_advance", config.comAdvance);
    read(node, "hip_depth_tolerance", config.hipDepthTolerance);
    read(node, "sway_window_s", config.swayWindowSeconds);
    read(node, "max_settle_s", config.maxSettleSeconds);
    read(node, "stability_window", config.stabilityWindow);

    const cv::FileNode bracket = node["grade_bracket"];
    if (bracket.isString()) {
        if (auto b = analysis::gradeBracketFromLabel(bracket.string())) {
            config.bracket = *b;
        } else {
            Logger::warn("EngineConfig: unknown grade bracket '", bracket.string(), "'");
        }
    }
}

void readTension(const cv::FileNode& node, analysis::TensionConfig& config) {
    if (!node.isMap()) return;
    read(node, "acute_elbow_deg", config.acuteElbowDeg);
    read(node, "shoulder_lock_frames", config.shoulderLockFrames);
    read(node, "knee_lateral_offset", config.kneeLateralOffset);
    read(node, "knee_loaded_max_deg", config.kneeLoadedMaxDeg);
    read(node, "twist_threshold_deg", config.twistThresholdDeg);
    read(node, "debounce_frames", config.debounceFrames);
}

void readFall(const cv::FileNode& node, analysis::FallConfig& config) {
    if (!node.isMap()) return;
    read(node, "open_speed", config.openSpeed);
    read(node, "close_fraction", config.closeFraction);
    read(node, "min_drop", config.minDrop);
    read(node, "fall_peak_speed", config.fallPeakSpeed);
    read(node, "hand_reach_speed", config.handReachSpeed);
    read(node, "hand_reach_frames", config.handReachFrames);
    read(node, "feet_lead_s", config.feetLeadSeconds);
}

void readScoring(const cv::FileNode& node, scoring::ScoringConfig& config) {
    if (!node.isMap()) return;

    scoring::ScoringConfig candidate = config;

    const cv::FileNode weights = node["weights"];
    if (weights.isMap()) {
        std::map<analysis::Category, double> parsed;
        for (cv::FileNodeIterator it = weights.begin(); it != weights.end(); ++it) {
            const cv::FileNode entry = *it;
            auto category = analysis::categoryFromName(entry.name());
            if (!category || !(entry.isInt() || entry.isReal())) {
                Logger::warn("EngineConfig: ignoring scoring.weights.", entry.name());
                continue;
            }
            parsed[*category] = entry.real();
        }
        if (!parsed.empty()) candidate.weights = std::move(parsed);
    }

    const cv::FileNode grades = node["grades"];
    if (grades.isSeq()) {
        std::vector<scoring::GradeEntry> parsed;
        for (cv::FileNodeIterator it = grades.begin(); it != grades.end(); ++it) {
            const cv::FileNode entry = *it;
            const cv::FileNode min = entry["min"];
            const cv::FileNode label = entry["label"];
            if (!(min.isInt() || min.isReal()) || !label.isString()) {
                Logger::warn("EngineConfig: malformed scoring.grades entry, keeping default grade table");
                parsed.clear();
                break;
            }
            parsed.push_back({min.real(), label.string()});
        }
        if (!parsed.empty()) candidate.grades = std::move(parsed);
    }

    // Accept the section only if an aggregator can be built from it
    try {
        scoring::Aggregator check(candidate);
        (void)check;
        config = std::move(candidate);
    } catch (const std::invalid_argument& e) {
        Logger::error("EngineConfig: scoring section rejected (", e.what(), "), keeping defaults");
    }
}

void readSwot(const cv::FileNode& node, report::SwotConfig& config) {
    if (!node.isMap()) return;
    read(node, "weakness_cutoff", config.weaknessCutoff);
    read(node, "max_strengths", config.maxStrengths);
    read(node, "max_weaknesses", config.maxWeaknesses);
    read(node, "max_opportunities", config.maxOpportunities);
    read(node, "max_threats", config.maxThreats);
    read(node, "fall_severity", config.fallSeverity);
}

} // namespace

EngineConfig loadEngineConfigFromString(const std::string& text) {
    EngineConfig config;

    std::string doc = text;
    if (doc.compare(0, 5, "%YAML") != 0) {
        doc = "%YAML:1.0\n" + doc;
    }

    try {
        cv::FileStorage fs(doc, cv::FileStorage::READ | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_YAML);
        if (!fs.isOpened()) {
            Logger::error("EngineConfig: configuration not readable, using defaults");
            return config;
        }

        const cv::FileNode level = fs["log_level"];
        if (level.isString()) {
            config.logLevel = parseLogLevel(level.string());
            if (!config.logLevel) Logger::warn("EngineConfig: unknown log_level '", level.string(), "'");
        }

        const cv::FileNode templates = fs["templates"];
        if (templates.isString()) config.templatesPath = templates.string();

        readBuffer(fs["buffer"], config.buffer);
        readMotion(fs["motion"], config.buffer.motion);
        readExtractor(fs["extractor"], config.extractor);
        readTension(fs["tension"], config.tension);
        readFall(fs["fall"], config.fall);
        readScoring(fs["scoring"], config.scoring);
        readSwot(fs["swot"], config.swot);
    } catch (const cv::Exception& e) {
        Logger::error("EngineConfig: parse error (", e.what(), "), using defaults");
        return EngineConfig{};
    }

    return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        Logger::warn("EngineConfig: ", path, " not found, using compiled defaults");
        return EngineConfig{};
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    Logger::info("EngineConfig: loading ", path);
    return loadEngineConfigFromString(buffer.str());
}

} // namespace core
