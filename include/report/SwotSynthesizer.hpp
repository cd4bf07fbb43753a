#pragma once

#include "TemplateResolver.hpp"
#include "TemplateSet.hpp"
#include "analysis/FallDetector.hpp"
#include "analysis/TensionAnalyzer.hpp"
#include "scoring/Scorer.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace report {

// ============================================================
// SWOT defaults
// ============================================================

constexpr double WEAKNESS_CUTOFF = 55.0;
constexpr size_t MAX_STRENGTHS = 4;
constexpr size_t MAX_WEAKNESSES = 4;
constexpr size_t MAX_OPPORTUNITIES = 3;
constexpr size_t MAX_THREATS = 3;

struct SwotConfig {
    double weaknessCutoff = WEAKNESS_CUTOFF;
    size_t maxStrengths = MAX_STRENGTHS;
    size_t maxWeaknesses = MAX_WEAKNESSES;
    size_t maxOpportunities = MAX_OPPORTUNITIES;
    size_t maxThreats = MAX_THREATS;

    // Threat predicates
    size_t shoulderLockMin = 3;
    size_t acuteElbowMin = 5;
    size_t kneeRotationMin = 2;
    double twistMinDeg = 30.0;
    double exhaustionCriticalPercent = 70.0;
    double instabilityBelow = 40.0;
    double fallSeverity = 100.0;           // falls rank above every other threat

    // Opportunity calculations
    double hipTargetGain = 20.0;
    double hipTargetCap = 85.0;
    double energyPerSavedMove = 2.0;
    double energyCap = 30.0;
    double rhythmSavedDivisor = 3.0;
    double rhythmSavedCap = 25.0;
    double dynamicTargetTime = 0.5;
};

/**
 * One rendered line. `value` is the score for strengths, weaknesses and
 * opportunities, the severity for threats. `rendered` is false when the
 * template had to be returned literally.
 */
struct SwotItem {
    std::string id;
    double value = 0.0;
    std::string text;
    bool rendered = true;

    bool operator==(const SwotItem& other) const {
        return id == other.id && value == other.value && text == other.text && rendered == other.rendered;
    }
};

struct SwotReport {
    std::vector<SwotItem> strengths;
    std::vector<SwotItem> weaknesses;
    std::vector<SwotItem> opportunities;
    std::vector<SwotItem> threats;

    bool operator==(const SwotReport& other) const {
        return strengths == other.strengths && weaknesses == other.weaknesses &&
               opportunities == other.opportunities && threats == other.threats;
    }
};

// ============================================================
// Opportunity calculations
// ============================================================
// Each returns the placeholder values of its rule, or nothing when a
// required input is absent from the metric's raw values.

using RuleValues = std::map<std::string, double>;

namespace opportunity {
[[nodiscard]] std::optional<RuleValues> hipPosition(const scoring::MetricResult& metric, const SwotConfig& config);
[[nodiscard]] std::optional<RuleValues> quietFeet(const scoring::MetricResult& metric, const SwotConfig& config);
[[nodiscard]] std::optional<RuleValues> gripRelease(const scoring::MetricResult& metric, const SwotConfig& config);
[[nodiscard]] std::optional<RuleValues> legEfficiency(const scoring::MetricResult& metric, const SwotConfig& config);
[[nodiscard]] std::optional<RuleValues> rhythm(const scoring::MetricResult& metric, const SwotConfig& config);
[[nodiscard]] std::optional<RuleValues> dynamicControl(const scoring::MetricResult& metric, const SwotConfig& config);
} // namespace opportunity

/**
 * SWOT Synthesizer
 *
 * Deterministic rule application over a finished TechniqueProfile:
 * strengths, then weaknesses, then one opportunity per weakness that has
 * a rule, then threats from tension events, falls and the exhaustion signal.
 * Every list is capped.
 */
class SwotSynthesizer {
public:
    explicit SwotSynthesizer(std::shared_ptr<const TemplateSet> templates = TemplateResolver::defaults(),
                             SwotConfig config = {});

    /**
     * @param exhaustionPercent movement degradation; empty when not measured
     */
    [[nodiscard]] SwotReport synthesize(const scoring::TechniqueProfile& profile,
                                        const std::vector<analysis::TensionEvent>& tension,
                                        std::optional<double> exhaustionPercent,
                                        const analysis::FallSummary& falls = {}) const;

    /**
     * Exhaustion taken from the profile's exhaustion metric
     */
    [[nodiscard]] SwotReport synthesize(const scoring::TechniqueProfile& profile,
                                        const std::vector<analysis::TensionEvent>& tension,
                                        const analysis::FallSummary& falls = {}) const;

    [[nodiscard]] const SwotConfig& config() const { return config_; }
    [[nodiscard]] const TemplateSet& templates() const { return *templates_; }

private:
    std::shared_ptr<const TemplateSet> templates_;
    SwotConfig config_;

    [[nodiscard]] std::vector<SwotItem> strengths(const scoring::TechniqueProfile& profile) const;
    [[nodiscard]] std::vector<SwotItem> weaknesses(const scoring::TechniqueProfile& profile) const;
    [[nodiscard]] std::vector<SwotItem> opportunities(const scoring::TechniqueProfile& profile,
                                                      const std::vector<SwotItem>& weaknesses) const;
    [[nodiscard]] std::vector<SwotItem> threats(const scoring::TechniqueProfile& profile,
                                                const std::vector<analysis::TensionEvent>& tension,
                                                std::optional<double> exhaustionPercent,
                                                const analysis::FallSummary& falls) const;

    [[nodiscard]] SwotItem renderRule(const RuleTemplate& rule, double value, const RuleValues& values,
                                      const std::map<std::string, std::string>& words = {}) const;
};

} // namespace report
