#pragma once

#include "inkpad/core/types.h"
#include "inkpad/capture/coordinate_normalizer.h"
#include <cstdint>
#include <cstddef>

namespace inkpad {

class StrokeCollection;
class RenderSink;

// Turns pointer gestures into committed strokes.
//
//   Idle --pointerDown--> Drawing --pointerUp/abort--> Idle
//
// Only pointerUp() grows the StrokeCollection. The sink's visual element for
// a gesture is created lazily with the first drawable segment, so a visual
// exists exactly when the gesture holds at least two points.
class StrokeCapture {
public:
    StrokeCapture(StrokeCollection& strokes, RenderSink& sink, const CoordinateNormalizer& normalizer);

    CaptureState state() const noexcept { return state_; }
    bool isDrawing() const noexcept { return state_ == CaptureState::Drawing; }
    const Stroke& inProgress() const noexcept { return current_; }

    // Number of points dropped for missing coordinates since construction.
    std::uint64_t droppedPointCount() const noexcept { return droppedPoints_; }

    // Bounds used when freezing a finished stroke in the sink.
    void setCacheBounds(const Bounds& bounds) noexcept { cacheBounds_ = bounds; }
    const Bounds& cacheBounds() const noexcept { return cacheBounds_; }

    void pointerDown(const RawPoint& point);
    void pointerMove(const RawPoint& origin, const RawPoint& destination);
    void pointerUp();

    // Forces Idle and discards the in-progress gesture without committing it.
    void abort();

private:
    void pushPoint(const RawPoint& point);
    void drawLastSegment();
    void resetCurrent();

    StrokeCollection& strokes_;
    RenderSink& sink_;
    const CoordinateNormalizer& normalizer_;

    CaptureState state_{CaptureState::Idle};
    Stroke current_;
    StrokeHandle currentVisual_{invalidStrokeHandle};
    Bounds cacheBounds_{0.0f, 0.0f, 0.0f, 0.0f};
    std::uint64_t droppedPoints_{0};
};

} // namespace inkpad
