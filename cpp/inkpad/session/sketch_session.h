#pragma once

#include "inkpad/core/types.h"
#include "inkpad/capture/coordinate_normalizer.h"
#include "inkpad/capture/stroke_capture.h"
#include "inkpad/document/stroke_collection.h"
#include "inkpad/history/edit_history.h"
#include "inkpad/recompute/matcher.h"
#include "inkpad/recompute/recompute_graph.h"
#include "inkpad/recording/recording_sink.h"
#include "inkpad/render/render_sink.h"
#include "inkpad/render/stroke_render_buffer.h"
#include "inkpad/session/session_options.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class SketchSessionTestAccessor;

namespace inkpad {

// One mounted handwriting canvas. Owns the committed strokes, the capture
// machine, the edit history and the recompute graph; everything runs on the
// caller's thread. Sessions are independent of each other.
class SketchSession {
    friend class ::SketchSessionTestAccessor;
public:
    struct Stats {
        std::uint32_t strokeCount;
        std::uint32_t inProgressPointCount;
        std::uint32_t revision;
        std::uint64_t droppedPointCount;
        std::uint32_t computeCount;
        double lastComputeMs;
        MatcherState matcherState;
        std::uint32_t recordingsCompleted;
        std::uint32_t recordingFailures;
        double zoom;
    };

    // Draws into an internal StrokeRenderBuffer.
    explicit SketchSession(const SessionOptions& options = SessionOptions{});
    // Draws into a host-provided sink, which must outlive the session.
    SketchSession(RenderSink& sink, const SessionOptions& options = SessionOptions{});
    ~SketchSession();

    SketchSession(const SketchSession&) = delete;
    SketchSession& operator=(const SketchSession&) = delete;

    // ==============================================================================
    // Pointer input
    // ==============================================================================
    void pointerDown(const RawPoint& point) { capture_.pointerDown(point); }
    void pointerMove(const RawPoint& origin, const RawPoint& destination) { capture_.pointerMove(origin, destination); }
    void pointerUp() { capture_.pointerUp(); }

    // ==============================================================================
    // Layout
    // ==============================================================================
    // Throws std::invalid_argument for non-positive or non-finite values.
    void setZoom(double zoom) { normalizer_.setZoom(zoom); }
    double zoom() const noexcept { return normalizer_.zoom(); }
    // Recomputes the zoom from container and canvas sizes.
    void layout(double outerWidth, double outerHeight, double innerWidth, double innerHeight);

    // ==============================================================================
    // Editing
    // ==============================================================================
    void clear() { history_.clear(); }
    bool undo() { return history_.undo(); }

    // Navigation signal: a new search context starts with an empty canvas.
    void onContextChanged();

    // ==============================================================================
    // Matcher lifecycle
    // ==============================================================================
    MatcherState matcherState() const noexcept { return graph_.matcherState(); }
    void beginMatcherLoad() { graph_.beginMatcherLoad(); }
    void installMatcher(std::unique_ptr<Matcher> matcher) { graph_.installMatcher(std::move(matcher)); }
    void failMatcherLoad(const std::string& reason) { graph_.failMatcherLoad(reason); }
    bool runMatcherLoad(const MatcherLoader& loader) { return graph_.runMatcherLoad(loader); }

    // ==============================================================================
    // Results
    // ==============================================================================
    const std::vector<Stroke>& strokes() const noexcept { return strokes_.strokes(); }
    const Stroke& inProgress() const noexcept { return capture_.inProgress(); }
    CaptureState captureState() const noexcept { return capture_.state(); }
    const CandidateList& candidates() const noexcept { return graph_.candidates(); }

    // Hands (strokes, candidates, chosen) to the recording sink and returns
    // the chosen candidate; std::nullopt for an out-of-range index.
    std::optional<Candidate> selectCandidate(std::uint32_t index);
    void setRecordingSink(RecordingSink* sink) noexcept { recordingSink_ = sink; }

    // ==============================================================================
    // Diagnostics
    // ==============================================================================
    Stats stats() const noexcept;
    SessionError lastError() const noexcept { return diagnostics_->lastError; }
    const std::string& lastErrorMessage() const noexcept { return diagnostics_->lastErrorMessage; }
    void clearLastError() noexcept;

    const SessionOptions& options() const noexcept { return options_; }
    RenderSink& renderSink() noexcept { return sink_; }
    // Null when the session draws into a host-provided sink.
    StrokeRenderBuffer* renderBuffer() noexcept { return ownedSink_.get(); }

private:
    // Shared with in-flight recording callbacks, which may outlive the session.
    struct Diagnostics {
        SessionError lastError{SessionError::Ok};
        std::string lastErrorMessage;
        std::uint32_t recordingsCompleted{0};
        std::uint32_t recordingFailures{0};
    };

    SketchSession(std::unique_ptr<StrokeRenderBuffer> ownedSink, RenderSink* externalSink, const SessionOptions& options);

    static void recordError(Diagnostics& diagnostics, SessionError error, const std::string& message);

    SessionOptions options_;
    std::unique_ptr<StrokeRenderBuffer> ownedSink_;
    RenderSink& sink_;
    std::shared_ptr<Diagnostics> diagnostics_;

    CoordinateNormalizer normalizer_;
    StrokeCollection strokes_;
    StrokeCapture capture_;
    EditHistory history_;
    RecomputeGraph graph_;

    RecordingSink* recordingSink_{nullptr};
};

} // namespace inkpad
