#include "report/SwotSynthesizer.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace report {

using analysis::TensionEvent;
using analysis::TensionJoint;
using scoring::MetricResult;

// ============================================================
// Opportunity calculations
// ============================================================

namespace opportunity {

std::optional<RuleValues> hipPosition(const MetricResult& metric, const SwotConfig& config) {
    const double target = std::min(std::round(metric.score) + config.hipTargetGain, config.hipTargetCap);
    const double reduction = std::max(0.0, target - std::round(metric.score));
    return RuleValues{{"target", target}, {"reduction", reduction}};
}

std::optional<RuleValues> quietFeet(const MetricResult& metric, const SwotConfig& config) {
    auto repositions = metric.raw.find("repositions");
    auto norm = metric.raw.find("norm");
    auto holds = metric.raw.find("holds");
    if (repositions == metric.raw.end() || norm == metric.raw.end() || holds == metric.raw.end()) {
        return std::nullopt;
    }

    const double saved = std::max(0.0, std::round((repositions->second - norm->second) * holds->second));
    const double energy = std::min(saved * config.energyPerSavedMove, config.energyCap);
    return RuleValues{{"saved", saved}, {"energy", energy}};
}

std::optional<RuleValues> gripRelease(const MetricResult&, const SwotConfig&) {
    return RuleValues{};
}

std::optional<RuleValues> legEfficiency(const MetricResult& metric, const SwotConfig&) {
    auto load = metric.raw.find("leg_load");
    if (load == metric.raw.end()) return std::nullopt;
    return RuleValues{{"current", std::round(load->second)}};
}

std::optional<RuleValues> rhythm(const MetricResult& metric, const SwotConfig& config) {
    const double saved = std::min(config.rhythmSavedCap,
                                  std::round((100.0 - metric.score) / config.rhythmSavedDivisor));
    return RuleValues{{"saved", std::max(0.0, saved)}};
}

std::optional<RuleValues> dynamicControl(const MetricResult& metric, const SwotConfig& config) {
    auto time = metric.raw.find("time");
    if (time == metric.raw.end()) return std::nullopt;

    const double saved = std::max(0.0, time->second - config.dynamicTargetTime);
    return RuleValues{
        {"target_time", config.dynamicTargetTime},
        {"saved_time", std::round(saved * 10.0) / 10.0},
    };
}

} // namespace opportunity

namespace {

using Calculation = std::optional<RuleValues> (*)(const MetricResult&, const SwotConfig&);

Calculation calculationFor(Category category) {
    switch (category) {
        case Category::HipPosition:    return &opportunity::hipPosition;
        case Category::QuietFeet:      return &opportunity::quietFeet;
        case Category::GripRelease:    return &opportunity::gripRelease;
        case Category::LegEfficiency:  return &opportunity::legEfficiency;
        case Category::Rhythm:         return &opportunity::rhythm;
        case Category::DynamicControl: return &opportunity::dynamicControl;
        default:                       return nullptr;
    }
}

/**
 * Per-side crossing counts of one tension joint
 */
struct SideCounts {
    size_t left = 0;
    size_t right = 0;
    size_t none = 0;
    double extremum = 0.0;
    bool any = false;

    [[nodiscard]] core::Side side() const {
        if (left > right) return core::Side::Left;
        if (right > left) return core::Side::Right;
        return core::Side::None;
    }

    [[nodiscard]] size_t count() const { return std::max({left, right, none}); }
};

SideCounts collect(const std::vector<TensionEvent>& events, TensionJoint joint, bool lowerIsExtreme) {
    SideCounts counts;
    for (const auto& e : events) {
        if (e.joint != joint || e.count == 0) continue;
        switch (e.side) {
            case core::Side::Left:  counts.left += e.count; break;
            case core::Side::Right: counts.right += e.count; break;
            case core::Side::None:  counts.none += e.count; break;
        }
        if (!counts.any) {
            counts.extremum = e.extremum;
        } else {
            counts.extremum = lowerIsExtreme ? std::min(counts.extremum, e.extremum)
                                             : std::max(counts.extremum, e.extremum);
        }
        counts.any = true;
    }
    return counts;
}

void sortDescending(std::vector<SwotItem>& items) {
    std::stable_sort(items.begin(), items.end(),
                     [](const SwotItem& a, const SwotItem& b) { return a.value > b.value; });
}

void truncate(std::vector<SwotItem>& items, size_t cap) {
    if (items.size() > cap) items.resize(cap);
}

} // namespace

// ============================================================
// SwotSynthesizer
// ============================================================

SwotSynthesizer::SwotSynthesizer(std::shared_ptr<const TemplateSet> templates, SwotConfig config)
    : templates_(std::move(templates)), config_(config) {
    if (!templates_) {
        throw std::invalid_argument("SwotSynthesizer needs a template set");
    }
}

SwotReport SwotSynthesizer::synthesize(const scoring::TechniqueProfile& profile,
                                       const std::vector<TensionEvent>& tension,
                                       const analysis::FallSummary& falls) const {
    std::optional<double> exhaustion;
    if (const MetricResult* m = profile.metric(Category::Exhaustion)) {
        auto it = m->raw.find("percent");
        if (it != m->raw.end()) exhaustion = it->second;
    }
    return synthesize(profile, tension, exhaustion, falls);
}

SwotReport SwotSynthesizer::synthesize(const scoring::TechniqueProfile& profile,
                                       const std::vector<TensionEvent>& tension,
                                       std::optional<double> exhaustionPercent,
                                       const analysis::FallSummary& falls) const {
    SwotReport report;
    report.strengths = strengths(profile);
    report.weaknesses = weaknesses(profile);
    report.opportunities = opportunities(profile, report.weaknesses);
    report.threats = threats(profile, tension, exhaustionPercent, falls);

    core::Logger::info("SwotSynthesizer: ", report.strengths.size(), " strengths, ",
                       report.weaknesses.size(), " weaknesses, ", report.opportunities.size(),
                       " opportunities, ", report.threats.size(), " threats");
    return report;
}

std::vector<SwotItem> SwotSynthesizer::strengths(const scoring::TechniqueProfile& profile) const {
    std::vector<SwotItem> items;
    for (const auto& [category, metric] : profile.metrics) {
        if (metric.rank != 0) continue;

        auto outcome = TemplateResolver::render(*templates_, category, metric.level, TemplateSet::STRENGTH, metric.raw);
        if (!outcome) continue;
        items.push_back({metric.name, metric.score, outcome->text, outcome->complete});
    }

    sortDescending(items);
    truncate(items, config_.maxStrengths);
    return items;
}

std::vector<SwotItem> SwotSynthesizer::weaknesses(const scoring::TechniqueProfile& profile) const {
    std::vector<SwotItem> items;
    for (const auto& [category, metric] : profile.metrics) {
        if (!(metric.score < config_.weaknessCutoff)) continue;

        auto outcome = TemplateResolver::render(*templates_, category, metric.level, TemplateSet::WEAKNESS, metric.raw);
        if (!outcome) continue;
        items.push_back({metric.name, metric.score, outcome->text, outcome->complete});
    }

    // Worst first
    std::stable_sort(items.begin(), items.end(),
                     [](const SwotItem& a, const SwotItem& b) { return a.value < b.value; });
    truncate(items, config_.maxWeaknesses);
    return items;
}

std::vector<SwotItem> SwotSynthesizer::opportunities(const scoring::TechniqueProfile& profile,
                                                     const std::vector<SwotItem>& weaknesses) const {
    std::vector<SwotItem> items;
    for (const auto& weakness : weaknesses) {
        if (items.size() >= config_.maxOpportunities) break;

        auto category = analysis::categoryFromName(weakness.id);
        if (!category) continue;
        const MetricResult* metric = profile.metric(*category);
        const RuleTemplate* rule = templates_->opportunity(weakness.id);
        Calculation calculate = calculationFor(*category);
        if (!metric || !rule || !calculate) continue;

        auto computed = calculate(*metric, config_);
        if (!computed) {
            core::Logger::debug("SwotSynthesizer: opportunity ", weakness.id, " skipped, inputs missing");
            continue;
        }

        RuleValues values = metric->raw;
        for (const auto& [name, v] : *computed) {
            values[name] = v;
        }
        SwotItem item = renderRule(*rule, metric->score, values);
        if (!item.rendered) {
            core::Logger::debug("SwotSynthesizer: opportunity ", weakness.id, " omitted, text has unknown values");
            continue;
        }
        items.push_back(std::move(item));
    }
    return items;
}

std::vector<SwotItem> SwotSynthesizer::threats(const scoring::TechniqueProfile& profile,
                                               const std::vector<TensionEvent>& tension,
                                               std::optional<double> exhaustionPercent,
                                               const analysis::FallSummary& falls) const {
    std::vector<SwotItem> items;

    auto sideWords = [](const RuleTemplate& rule, core::Side side) {
        std::map<std::string, std::string> words;
        auto it = rule.sideLabels.find(side);
        if (it != rule.sideLabels.end()) words["side"] = it->second;
        return words;
    };

    // Joint crossings, side from the dominant count
    auto countRule = [&](const char* id, TensionJoint joint, size_t minimum, bool lowerIsExtreme) {
        const RuleTemplate* rule = templates_->threat(id);
        if (!rule) return;
        const SideCounts counts = collect(tension, joint, lowerIsExtreme);
        const size_t count = counts.count();
        if (!counts.any || count < minimum) return;

        const double severity = static_cast<double>(count);
        items.push_back(renderRule(*rule, severity, {{"count", severity}}, sideWords(*rule, counts.side())));
    };

    countRule("shoulder", TensionJoint::Shoulder, config_.shoulderLockMin, false);
    countRule("elbow", TensionJoint::Elbow, config_.acuteElbowMin, true);
    countRule("knee_rotation", TensionJoint::Knee, config_.kneeRotationMin, false);

    if (const RuleTemplate* rule = templates_->threat("lower_back")) {
        const SideCounts twist = collect(tension, TensionJoint::LowerBack, false);
        if (twist.any && twist.extremum >= config_.twistMinDeg) {
            const double angle = std::round(twist.extremum);
            items.push_back(renderRule(*rule, twist.extremum, {{"angle", angle}}));
        }
    }

    if (const RuleTemplate* rule = templates_->threat("exhaustion_critical")) {
        if (exhaustionPercent && *exhaustionPercent >= config_.exhaustionCriticalPercent) {
            items.push_back(renderRule(*rule, *exhaustionPercent, {{"percent", std::round(*exhaustionPercent)}}));
        }
    }

    if (const RuleTemplate* rule = templates_->threat("instability")) {
        const MetricResult* stability = profile.metric(Category::Stability);
        if (stability && stability->score < config_.instabilityBelow) {
            items.push_back(renderRule(*rule, 100.0 - stability->score, {{"score", std::round(stability->score)}}));
        }
    }

    if (const RuleTemplate* rule = templates_->threat("fall")) {
        if (const analysis::DescentEvent* first = falls.firstFall()) {
            const double time = std::round(first->startTime * 10.0) / 10.0;
            items.push_back(renderRule(*rule, config_.fallSeverity,
                                       {{"time", time}, {"count", static_cast<double>(falls.falls)}}));
        }
    }

    sortDescending(items);
    truncate(items, config_.maxThreats);
    return items;
}

SwotItem SwotSynthesizer::renderRule(const RuleTemplate& rule, double value, const RuleValues& values,
                                     const std::map<std::string, std::string>& words) const {
    RenderOutcome outcome = TemplateResolver::render(rule.text, values, words);
    return {rule.id, value, outcome.text, outcome.complete};
}

} // namespace report
