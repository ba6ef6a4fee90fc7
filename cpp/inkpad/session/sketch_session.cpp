#include "inkpad/session/sketch_session.h"
#include "inkpad/core/logging.h"

#include <exception>
#include <utility>

namespace inkpad {

SketchSession::SketchSession(const SessionOptions& options)
    : SketchSession(std::make_unique<StrokeRenderBuffer>(options.strokeStyle), nullptr, options) {}

SketchSession::SketchSession(RenderSink& sink, const SessionOptions& options)
    : SketchSession(nullptr, &sink, options) {}

SketchSession::SketchSession(std::unique_ptr<StrokeRenderBuffer> ownedSink, RenderSink* externalSink, const SessionOptions& options)
    : options_(options),
      ownedSink_(std::move(ownedSink)),
      sink_(externalSink ? *externalSink : static_cast<RenderSink&>(*ownedSink_)),
      diagnostics_(std::make_shared<Diagnostics>()),
      capture_(strokes_, sink_, normalizer_),
      history_(strokes_, capture_, sink_),
      graph_(strokes_, options.candidateLimit)
{
    normalizer_.setZoom(options_.initialZoom);
    capture_.setCacheBounds(Bounds{0.0f, 0.0f, options_.canvasWidth, options_.canvasHeight});

    std::weak_ptr<Diagnostics> weak = diagnostics_;
    graph_.setErrorHandler([weak](SessionError error, const std::string& message) {
        if (auto diagnostics = weak.lock()) {
            recordError(*diagnostics, error, message);
        }
    });
}

SketchSession::~SketchSession() = default;

void SketchSession::layout(double outerWidth, double outerHeight, double innerWidth, double innerHeight) {
    normalizer_.setZoom(fitZoom(outerWidth, outerHeight, innerWidth, innerHeight));
}

void SketchSession::onContextChanged() {
    INKPAD_LOG_DEBUG("context changed, clearing %zu strokes", strokes_.size());
    history_.clear();
}

std::optional<Candidate> SketchSession::selectCandidate(std::uint32_t index) {
    const CandidateList& list = graph_.candidates();
    if (index >= list.size()) {
        INKPAD_LOG_WARN("candidate index %u out of range (%zu candidates)", index, list.size());
        recordError(*diagnostics_, SessionError::InvalidCandidate, "candidate index out of range");
        return std::nullopt;
    }

    const Candidate chosen = list[index];
    if (!recordingSink_) return chosen;

    SelectionRecord record{strokes_.strokes(), list, chosen};
    std::weak_ptr<Diagnostics> weak = diagnostics_;
    try {
        recordingSink_->record(record, [weak](const std::optional<std::string>& error) {
            auto diagnostics = weak.lock();
            if (error) {
                INKPAD_LOG_ERROR("recording selection failed: %s", error->c_str());
                if (diagnostics) recordError(*diagnostics, SessionError::RecordingFailed, *error);
                return;
            }
            if (diagnostics) diagnostics->recordingsCompleted++;
        });
    } catch (const std::exception& e) {
        INKPAD_LOG_ERROR("recording selection failed: %s", e.what());
        recordError(*diagnostics_, SessionError::RecordingFailed, e.what());
    }
    return chosen;
}

SketchSession::Stats SketchSession::stats() const noexcept {
    return Stats{
        static_cast<std::uint32_t>(strokes_.size()),
        static_cast<std::uint32_t>(capture_.inProgress().size()),
        strokes_.revision(),
        capture_.droppedPointCount(),
        graph_.computeCount(),
        graph_.lastComputeMs(),
        graph_.matcherState(),
        diagnostics_->recordingsCompleted,
        diagnostics_->recordingFailures,
        normalizer_.zoom()
    };
}

void SketchSession::clearLastError() noexcept {
    diagnostics_->lastError = SessionError::Ok;
    diagnostics_->lastErrorMessage.clear();
}

void SketchSession::recordError(Diagnostics& diagnostics, SessionError error, const std::string& message) {
    diagnostics.lastError = error;
    diagnostics.lastErrorMessage = message;
    if (error == SessionError::RecordingFailed) {
        diagnostics.recordingFailures++;
    }
}

} // namespace inkpad
