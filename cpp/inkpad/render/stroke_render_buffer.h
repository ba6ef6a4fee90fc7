#ifndef INKPAD_RENDER_STROKE_RENDER_BUFFER_H
#define INKPAD_RENDER_STROKE_RENDER_BUFFER_H

#include "inkpad/core/types.h"
#include "inkpad/render/render_sink.h"

#include <cstdint>
#include <cstddef>
#include <vector>

namespace inkpad {

struct StrokeStyle {
    float width{defaultStrokeWidth};
    float r{defaultStrokeR};
    float g{defaultStrokeG};
    float b{defaultStrokeB};
    float a{defaultStrokeA};
};

// Vertex layout: x, y, z, r, g, b, a
static constexpr std::size_t floatsPerVertex = 7;
// Segments per round cap (a half-disc fan at each segment end).
static constexpr int roundCapSegments = 8;

// RenderSink that tessellates every segment into triangles (a quad plus two
// round caps) for a GL host. Elements are kept in insertion order; refresh()
// flattens them into a single triangle buffer.
class StrokeRenderBuffer : public RenderSink {
public:
    struct BufferMeta {
        std::uint32_t generation;
        std::uint32_t vertexCount;
        std::uint32_t floatCount;
    };

    explicit StrokeRenderBuffer(const StrokeStyle& style = StrokeStyle{});

    StrokeHandle addStroke() override;
    void removeLastStroke() override;
    void clearAll() override;
    void drawSegment(StrokeHandle stroke, const Point& p1, const Point& p2) override;
    void cacheStroke(StrokeHandle stroke, const Bounds& bounds) override;
    void refresh() override;

    std::size_t elementCount() const noexcept { return elements_.size(); }
    bool isCached(StrokeHandle stroke) const;
    std::size_t segmentCount(StrokeHandle stroke) const;

    // Valid after the last refresh().
    const std::vector<float>& triangleVertices() const noexcept { return triangleVertices_; }
    BufferMeta bufferMeta() const noexcept;
    bool isDirty() const noexcept { return dirty_; }

    const StrokeStyle& style() const noexcept { return style_; }

private:
    struct Element {
        StrokeHandle handle;
        bool cached;
        Bounds cacheBounds;
        std::size_t segments;
        std::vector<float> vertices;
    };

    Element* find(StrokeHandle stroke);
    const Element* find(StrokeHandle stroke) const;

    StrokeStyle style_;
    std::vector<Element> elements_;
    StrokeHandle nextHandle_{1};
    std::vector<float> triangleVertices_;
    std::uint32_t generation_{0};
    bool dirty_{false};
};

// Appends triangles for one round-capped segment of the given style.
// Degenerate (zero-length) segments produce a single dot.
void tessellateSegment(const Point& p1, const Point& p2, const StrokeStyle& style, std::vector<float>& out);

} // namespace inkpad

#endif // INKPAD_RENDER_STROKE_RENDER_BUFFER_H
