#pragma once

#include "inkpad/core/types.h"

namespace inkpad {

// Display surface the capture pipeline draws into. All calls are
// fire-and-forget; the pipeline never inspects results beyond the handle
// returned by addStroke().
class RenderSink {
public:
    virtual ~RenderSink() = default;

    // Creates a new visual element on top of the existing ones.
    virtual StrokeHandle addStroke() = 0;
    virtual void removeLastStroke() = 0;
    virtual void clearAll() = 0;
    virtual void drawSegment(StrokeHandle stroke, const Point& p1, const Point& p2) = 0;
    // Freezes a finished element (rasterize/cache) over the given bounds.
    virtual void cacheStroke(StrokeHandle stroke, const Bounds& bounds) = 0;
    virtual void refresh() = 0;
};

} // namespace inkpad
