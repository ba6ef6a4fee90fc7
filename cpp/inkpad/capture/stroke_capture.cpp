#include "inkpad/capture/stroke_capture.h"
#include "inkpad/document/stroke_collection.h"
#include "inkpad/render/render_sink.h"
#include "inkpad/core/logging.h"

#include <utility>

namespace inkpad {

StrokeCapture::StrokeCapture(StrokeCollection& strokes, RenderSink& sink, const CoordinateNormalizer& normalizer)
    : strokes_(strokes), sink_(sink), normalizer_(normalizer)
{
    current_.reserve(64);
}

void StrokeCapture::pointerDown(const RawPoint& point) {
    if (state_ != CaptureState::Idle) return;
    state_ = CaptureState::Drawing;
    current_.clear();
    pushPoint(point);
}

void StrokeCapture::pointerMove(const RawPoint& origin, const RawPoint& destination) {
    if (state_ != CaptureState::Drawing) return;
    // The down event may not have produced a point; start from the move origin.
    if (current_.empty()) {
        pushPoint(origin);
    }
    pushPoint(destination);
}

void StrokeCapture::pointerUp() {
    if (state_ != CaptureState::Drawing) return;

    // Leave Idle before committing so listeners observe a settled machine.
    state_ = CaptureState::Idle;
    Stroke finished = std::move(current_);
    const StrokeHandle visual = currentVisual_;
    resetCurrent();

    if (finished.size() >= minCommittedStrokePoints) {
        strokes_.append(std::move(finished));
    } else {
        INKPAD_LOG_DEBUG("discarding %zu-point stroke", finished.size());
    }

    if (visual != invalidStrokeHandle) {
        sink_.cacheStroke(visual, cacheBounds_);
    }
    sink_.refresh();
}

void StrokeCapture::abort() {
    const bool hadVisual = currentVisual_ != invalidStrokeHandle;
    state_ = CaptureState::Idle;
    resetCurrent();
    if (hadVisual) {
        sink_.removeLastStroke();
    }
}

void StrokeCapture::pushPoint(const RawPoint& point) {
    const std::optional<Point> p = normalizer_.normalize(point);
    if (!p) {
        droppedPoints_++;
        INKPAD_LOG_DEBUG("dropped point with missing coordinate (%llu total)",
                         static_cast<unsigned long long>(droppedPoints_));
        return;
    }
    current_.push_back(*p);
    drawLastSegment();
}

void StrokeCapture::drawLastSegment() {
    if (current_.size() < 2) return;
    if (currentVisual_ == invalidStrokeHandle) {
        currentVisual_ = sink_.addStroke();
    }
    const std::size_t i = current_.size() - 2;
    sink_.drawSegment(currentVisual_, current_[i], current_[i + 1]);
    sink_.refresh();
}

void StrokeCapture::resetCurrent() {
    current_ = Stroke{};
    current_.reserve(64);
    currentVisual_ = invalidStrokeHandle;
}

} // namespace inkpad
