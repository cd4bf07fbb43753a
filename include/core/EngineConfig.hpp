#pragma once

#include "LandmarkBuffer.hpp"
#include "Logger.hpp"
#include "analysis/FallDetector.hpp"
#include "analysis/FeatureExtractors.hpp"
#include "analysis/TensionAnalyzer.hpp"
#include "report/SwotSynthesizer.hpp"
#include "scoring/Scorer.hpp"
#include <optional>
#include <string>

namespace core {

/**
 * Every threshold of one engine instance.
 * Passed by value into a Session; never mutated afterwards.
 */
struct EngineConfig {
    BufferConfig buffer;
    analysis::ExtractorConfig extractor;
    analysis::TensionConfig tension;
    analysis::FallConfig fall;
    scoring::ScoringConfig scoring;
    report::SwotConfig swot;

    std::string templatesPath;               // empty = compiled-in templates
    std::optional<LogLevel> logLevel;        // parsed only; the host applies it with Logger::setLevel
};

/**
 * Read overrides from a YAML file (cv::FileStorage).
 * Missing keys keep their compiled defaults. A missing or unparsable file,
 * or an invalid grade table, logs and yields the defaults for that part.
 *
 * Layout (all sections optional):
 *   log_level: "debug"
 *   templates: "templates/default_templates.yml"
 *   buffer:    { capacity, max_hold_s, min_confidence, coord_min, coord_max,
 *                smoothing, smoothing_min_cutoff, smoothing_beta }
 *   motion:    { move_velocity_enter, settle_velocity_exit, settle_dwell_s,
 *                dynamic_velocity, dynamic_refractory_s, pause_min_s, lost_tolerance_frames }
 *   extractor: { min_valid_samples, min_events, hold_radius, pivot_angle_deg,
 *                com_advance, grade_bracket, sway_window_s, max_settle_s }
 *   tension:   { acute_elbow_deg, shoulder_lock_frames, knee_lateral_offset,
 *                knee_loaded_max_deg, twist_threshold_deg, debounce_frames }
 *   fall:      { open_speed, close_fraction, min_drop, fall_peak_speed,
 *                hand_reach_speed, hand_reach_frames, feet_lead_s }
 *   scoring:   { weights: { quiet_feet: 0.2, ... }, grades: [ { min: 85, label: "7b+" }, ... ] }
 *   swot:      { weakness_cutoff, max_strengths, max_weaknesses, max_opportunities, max_threats,
 *                fall_severity }
 */
EngineConfig loadEngineConfig(const std::string& path);

EngineConfig loadEngineConfigFromString(const std::string& text);

} // namespace core
