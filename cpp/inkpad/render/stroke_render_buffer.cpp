#include "inkpad/render/stroke_render_buffer.h"
#include "inkpad/core/logging.h"

#include <algorithm>
#include <cmath>

namespace inkpad {

namespace {

constexpr float kPi = 3.14159265358979323846f;

void pushVertexColored(float x, float y, float z, const StrokeStyle& s, std::vector<float>& target) {
    target.push_back(x); target.push_back(y); target.push_back(z);
    target.push_back(s.r); target.push_back(s.g); target.push_back(s.b); target.push_back(s.a);
}

float clampMin(float v, float minV) {
    if (!std::isfinite(v)) return minV;
    return v < minV ? minV : v;
}

// Half-disc fan centred on (cx, cy), bulging towards (dx, dy).
void addRoundCap(float cx, float cy, float dx, float dy, float hw, const StrokeStyle& s, std::vector<float>& out) {
    const float nx = -dy;
    const float ny = dx;
    constexpr float z = 0.0f;
    for (int i = 0; i < roundCapSegments; i++) {
        const float t0 = -0.5f * kPi + kPi * static_cast<float>(i) / roundCapSegments;
        const float t1 = -0.5f * kPi + kPi * static_cast<float>(i + 1) / roundCapSegments;
        const float x0 = cx + (dx * std::cos(t0) + nx * std::sin(t0)) * hw;
        const float y0 = cy + (dy * std::cos(t0) + ny * std::sin(t0)) * hw;
        const float x1 = cx + (dx * std::cos(t1) + nx * std::sin(t1)) * hw;
        const float y1 = cy + (dy * std::cos(t1) + ny * std::sin(t1)) * hw;
        pushVertexColored(cx, cy, z, s, out);
        pushVertexColored(x0, y0, z, s, out);
        pushVertexColored(x1, y1, z, s, out);
    }
}

} // namespace

void tessellateSegment(const Point& p1, const Point& p2, const StrokeStyle& style, std::vector<float>& out) {
    const float w = clampMin(style.width, 0.0f);
    if (w <= 0.0f) return;
    const float hw = w * 0.5f;

    const float x0 = static_cast<float>(p1.x);
    const float y0 = static_cast<float>(p1.y);
    const float x1 = static_cast<float>(p2.x);
    const float y1 = static_cast<float>(p2.y);
    const float dx = x1 - x0;
    const float dy = y1 - y0;
    const float len = std::sqrt(dx * dx + dy * dy);

    if (!(len > 1e-6f)) {
        // Two opposite caps make a full dot.
        addRoundCap(x0, y0, 1.0f, 0.0f, hw, style, out);
        addRoundCap(x0, y0, -1.0f, 0.0f, hw, style, out);
        return;
    }

    const float inv = 1.0f / len;
    const float ux = dx * inv;
    const float uy = dy * inv;
    const float px = -uy;
    const float py = ux;

    const float ax0 = x0 + px * hw;
    const float ay0 = y0 + py * hw;
    const float bx0 = x0 - px * hw;
    const float by0 = y0 - py * hw;
    const float ax1 = x1 + px * hw;
    const float ay1 = y1 + py * hw;
    const float bx1 = x1 - px * hw;
    const float by1 = y1 - py * hw;

    constexpr float z = 0.0f;
    // (ax0,ay0) (bx0,by0) (ax1,ay1)
    pushVertexColored(ax0, ay0, z, style, out);
    pushVertexColored(bx0, by0, z, style, out);
    pushVertexColored(ax1, ay1, z, style, out);
    // (bx0,by0) (bx1,by1) (ax1,ay1)
    pushVertexColored(bx0, by0, z, style, out);
    pushVertexColored(bx1, by1, z, style, out);
    pushVertexColored(ax1, ay1, z, style, out);

    addRoundCap(x0, y0, -ux, -uy, hw, style, out);
    addRoundCap(x1, y1, ux, uy, hw, style, out);
}

StrokeRenderBuffer::StrokeRenderBuffer(const StrokeStyle& style)
    : style_(style) {}

StrokeRenderBuffer::Element* StrokeRenderBuffer::find(StrokeHandle stroke) {
    for (auto& e : elements_) {
        if (e.handle == stroke) return &e;
    }
    return nullptr;
}

const StrokeRenderBuffer::Element* StrokeRenderBuffer::find(StrokeHandle stroke) const {
    for (const auto& e : elements_) {
        if (e.handle == stroke) return &e;
    }
    return nullptr;
}

StrokeHandle StrokeRenderBuffer::addStroke() {
    Element e{};
    e.handle = nextHandle_++;
    e.cached = false;
    e.cacheBounds = Bounds{0.0f, 0.0f, 0.0f, 0.0f};
    e.segments = 0;
    elements_.push_back(std::move(e));
    dirty_ = true;
    return elements_.back().handle;
}

void StrokeRenderBuffer::removeLastStroke() {
    if (elements_.empty()) return;
    elements_.pop_back();
    dirty_ = true;
}

void StrokeRenderBuffer::clearAll() {
    if (elements_.empty()) return;
    elements_.clear();
    dirty_ = true;
}

void StrokeRenderBuffer::drawSegment(StrokeHandle stroke, const Point& p1, const Point& p2) {
    Element* e = find(stroke);
    if (!e) {
        INKPAD_LOG_DEBUG("drawSegment: unknown stroke handle %u", stroke);
        return;
    }
    if (e->cached) return;
    tessellateSegment(p1, p2, style_, e->vertices);
    e->segments++;
    dirty_ = true;
}

void StrokeRenderBuffer::cacheStroke(StrokeHandle stroke, const Bounds& bounds) {
    Element* e = find(stroke);
    if (!e) return;
    e->cached = true;
    e->cacheBounds = bounds;
    e->vertices.shrink_to_fit();
}

void StrokeRenderBuffer::refresh() {
    if (!dirty_) return;
    std::size_t total = 0;
    for (const auto& e : elements_) total += e.vertices.size();
    triangleVertices_.clear();
    triangleVertices_.reserve(total);
    for (const auto& e : elements_) {
        triangleVertices_.insert(triangleVertices_.end(), e.vertices.begin(), e.vertices.end());
    }
    generation_++;
    dirty_ = false;
}

bool StrokeRenderBuffer::isCached(StrokeHandle stroke) const {
    const Element* e = find(stroke);
    return e && e->cached;
}

std::size_t StrokeRenderBuffer::segmentCount(StrokeHandle stroke) const {
    const Element* e = find(stroke);
    return e ? e->segments : 0;
}

StrokeRenderBuffer::BufferMeta StrokeRenderBuffer::bufferMeta() const noexcept {
    const std::uint32_t floatCount = static_cast<std::uint32_t>(triangleVertices_.size());
    return BufferMeta{
        generation_,
        static_cast<std::uint32_t>(floatCount / floatsPerVertex),
        floatCount
    };
}

} // namespace inkpad
