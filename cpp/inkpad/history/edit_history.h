#pragma once

#include <cstdint>

namespace inkpad {

class StrokeCollection;
class StrokeCapture;
class RenderSink;

// Side entry point that edits the committed strokes. Both operations drive
// the capture machine to Idle first, so an in-progress gesture is discarded
// and never committed.
class EditHistory {
public:
    EditHistory(StrokeCollection& strokes, StrokeCapture& capture, RenderSink& sink);

    // Removes every committed stroke and every visual element.
    void clear();

    // Removes the most recent stroke and its visual element. A no-op on an
    // empty collection; returns whether a stroke was removed.
    bool undo();

    std::uint32_t undoCount() const noexcept { return undoCount_; }
    std::uint32_t clearCount() const noexcept { return clearCount_; }

private:
    StrokeCollection& strokes_;
    StrokeCapture& capture_;
    RenderSink& sink_;

    std::uint32_t undoCount_{0};
    std::uint32_t clearCount_{0};
};

} // namespace inkpad
