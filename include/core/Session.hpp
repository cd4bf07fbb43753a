#pragma once

#include "EngineConfig.hpp"
#include "LandmarkBuffer.hpp"
#include "analysis/FallDetector.hpp"
#include "analysis/TensionAnalyzer.hpp"
#include "report/SwotSynthesizer.hpp"
#include "report/TemplateResolver.hpp"
#include "scoring/Scorer.hpp"
#include <memory>
#include <stdexcept>
#include <vector>

namespace core {

/**
 * The whole session held no usable frame.
 * The only hard failure of the engine.
 */
class EmptySessionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SessionResult {
    scoring::TechniqueProfile profile;
    std::vector<analysis::TensionEvent> tension;
    analysis::TensionSummary tensionSummary;
    analysis::FallSummary fall;
    report::SwotReport swot;
    BufferStats bufferStats;
};

/**
 * One climbing attempt, landmark stream in, assessment out.
 *
 * Owns its buffer, tension and fall analyzers and intermediate results; only the
 * template set is shared (read-only). Frames may arrive incrementally,
 * scoring runs once on complete(). Not thread-safe: one session, one thread.
 */
class Session {
public:
    /**
     * Templates come from config.templatesPath, or the compiled-in set when it is empty
     */
    explicit Session(EngineConfig config = {});

    /**
     * Explicit template set; config.templatesPath is ignored.
     * @throws std::invalid_argument if templates is null
     */
    Session(EngineConfig config, std::shared_ptr<const report::TemplateSet> templates);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * Feed one frame. Frames after complete() return AppendStatus::Closed.
     */
    AppendStatus append(const PoseFrame& frame);

    /**
     * Close the stream and build the assessment.
     * @throws EmptySessionError if no frame with landmarks was accepted
     * @throws std::logic_error on a second call
     */
    SessionResult complete();

    [[nodiscard]] bool completed() const { return completed_; }
    [[nodiscard]] const LandmarkBuffer& buffer() const { return *buffer_; }
    [[nodiscard]] const analysis::TensionAnalyzer& tension() const { return tension_; }
    [[nodiscard]] const analysis::FallDetector& falls() const { return fall_; }
    [[nodiscard]] const EngineConfig& config() const { return config_; }
    [[nodiscard]] const report::TemplateSet& templates() const { return swot_.templates(); }

private:
    EngineConfig config_;
    std::unique_ptr<LandmarkBuffer> buffer_;
    analysis::TensionAnalyzer tension_;
    analysis::FallDetector fall_;
    scoring::Scorer scorer_;
    scoring::Aggregator aggregator_;
    report::SwotSynthesizer swot_;
    bool completed_ = false;
};

/**
 * Template set named by config.templatesPath, loaded fresh.
 * The shared compiled-in set when the path is empty.
 */
std::shared_ptr<const report::TemplateSet> templatesFor(const EngineConfig& config);

/**
 * Convenience: run a finished stream through a fresh session
 */
SessionResult runSession(const std::vector<PoseFrame>& frames, const EngineConfig& config = {});
SessionResult runSession(const std::vector<PoseFrame>& frames, const EngineConfig& config,
                         std::shared_ptr<const report::TemplateSet> templates);

} // namespace core
