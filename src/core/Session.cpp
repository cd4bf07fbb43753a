#include "core/Session.hpp"
#include "analysis/FeatureExtractors.hpp"

namespace core {

std::shared_ptr<const report::TemplateSet> templatesFor(const EngineConfig& config) {
    if (config.templatesPath.empty()) return report::TemplateResolver::defaults();
    return report::TemplateResolver::load(config.templatesPath);
}

Session::Session(EngineConfig config)
    : Session(config, templatesFor(config)) {}

Session::Session(EngineConfig config, std::shared_ptr<const report::TemplateSet> templates)
    : config_(std::move(config)),
      buffer_(std::make_unique<LandmarkBuffer>(config_.buffer)),
      tension_(config_.tension),
      fall_(config_.fall),
      scorer_(config_.scoring),
      aggregator_(config_.scoring),
      swot_(std::move(templates), config_.swot) {
    Logger::debug("Session: started (capacity ", config_.buffer.capacity, ", templates ",
                  swot_.templates().source(), ")");
}

AppendStatus Session::append(const PoseFrame& frame) {
    if (completed_) return AppendStatus::Closed;

    const AppendStatus status = buffer_->append(frame);
    if (status == AppendStatus::Accepted) {
        tension_.update(*buffer_);
        fall_.update(*buffer_);
    }
    return status;
}

SessionResult Session::complete() {
    if (completed_) {
        throw std::logic_error("Session already completed");
    }
    completed_ = true;
    buffer_->close();
    fall_.finish();

    const BufferStats& stats = buffer_->stats();
    if (stats.acceptedFrames == 0 || stats.framesWithLandmarks == 0) {
        Logger::error("Session: no landmark frames received (", stats.droppedFrames, " dropped)");
        throw EmptySessionError("Session contains no landmark frames");
    }

    const auto results = analysis::extractAll(*buffer_, config_.extractor);
    const auto sessionStats = analysis::extractSessionStats(*buffer_);

    SessionResult result;
    result.profile = aggregator_.buildProfile(results, scorer_, sessionStats);
    result.tension = tension_.events();
    result.tensionSummary = tension_.summary();
    result.fall = fall_.summary();
    result.swot = swot_.synthesize(result.profile, result.tension, result.fall);
    result.bufferStats = stats;

    Logger::info("Session: complete, ", stats.acceptedFrames, " frames, ", result.profile.metrics.size(),
                 " scored categories, grade ", result.profile.grade, ", tension risk ",
                 result.tensionSummary.risk, ", falls ", result.fall.falls);
    return result;
}

namespace {

SessionResult drain(Session& session, const std::vector<PoseFrame>& frames) {
    // Rejected frames are counted in BufferStats
    for (const auto& frame : frames) {
        session.append(frame);
    }
    return session.complete();
}

} // namespace

SessionResult runSession(const std::vector<PoseFrame>& frames, const EngineConfig& config) {
    Session session(config);
    return drain(session, frames);
}

SessionResult runSession(const std::vector<PoseFrame>& frames, const EngineConfig& config,
                         std::shared_ptr<const report::TemplateSet> templates) {
    Session session(config, std::move(templates));
    return drain(session, frames);
}

} // namespace core
