#include <gtest/gtest.h>
#include "inkpad/render/stroke_render_buffer.h"

#include <cmath>
#include <vector>

using namespace inkpad;

namespace {
constexpr std::size_t kCapVertices = static_cast<std::size_t>(roundCapSegments) * 3;
constexpr std::size_t kSegmentVertices = 6 + 2 * kCapVertices;
} // namespace

TEST(RenderTest, SegmentTessellation) {
    std::vector<float> tri;
    StrokeStyle style;
    style.width = 8.0f;
    tessellateSegment(Point{0, 0}, Point{10, 0}, style, tri);

    ASSERT_EQ(tri.size(), kSegmentVertices * floatsPerVertex);
    // First quad vertex sits half a stroke width off the segment start.
    EXPECT_FLOAT_EQ(tri[0], 0.0f);
    EXPECT_FLOAT_EQ(std::fabs(tri[1]), 4.0f);
    // Colour channels follow the style.
    EXPECT_FLOAT_EQ(tri[3], style.r);
    EXPECT_FLOAT_EQ(tri[6], style.a);

    // Every vertex stays within the capsule around the segment.
    for (std::size_t i = 0; i < tri.size(); i += floatsPerVertex) {
        const float x = tri[i];
        const float y = tri[i + 1];
        EXPECT_GE(x, -4.0f - 1e-4f);
        EXPECT_LE(x, 14.0f + 1e-4f);
        EXPECT_LE(std::fabs(y), 4.0f + 1e-4f);
    }
}

TEST(RenderTest, DegenerateSegmentDrawsDot) {
    std::vector<float> tri;
    tessellateSegment(Point{3, 3}, Point{3, 3}, StrokeStyle{}, tri);
    EXPECT_EQ(tri.size(), 2 * kCapVertices * floatsPerVertex);
}

TEST(RenderTest, ZeroWidthDrawsNothing) {
    std::vector<float> tri;
    StrokeStyle style;
    style.width = 0.0f;
    tessellateSegment(Point{0, 0}, Point{10, 0}, style, tri);
    EXPECT_TRUE(tri.empty());
}

TEST(RenderTest, RefreshFlattensElementsInOrder) {
    StrokeRenderBuffer buffer;
    const StrokeHandle a = buffer.addStroke();
    buffer.drawSegment(a, Point{0, 0}, Point{10, 0});
    const StrokeHandle b = buffer.addStroke();
    buffer.drawSegment(b, Point{0, 20}, Point{10, 20});
    buffer.drawSegment(b, Point{10, 20}, Point{10, 30});
    EXPECT_TRUE(buffer.isDirty());

    buffer.refresh();
    EXPECT_FALSE(buffer.isDirty());
    const auto meta = buffer.bufferMeta();
    EXPECT_EQ(meta.generation, 1u);
    EXPECT_EQ(meta.vertexCount, 3 * kSegmentVertices);
    EXPECT_EQ(meta.floatCount, meta.vertexCount * floatsPerVertex);
    EXPECT_EQ(buffer.segmentCount(a), 1u);
    EXPECT_EQ(buffer.segmentCount(b), 2u);

    // Element a comes first: its first vertex is near y = 0.
    EXPECT_LE(std::fabs(buffer.triangleVertices()[1]), 4.0f + 1e-4f);
}

TEST(RenderTest, RefreshWithoutChangesKeepsGeneration) {
    StrokeRenderBuffer buffer;
    buffer.refresh();
    EXPECT_EQ(buffer.bufferMeta().generation, 0u);
    buffer.addStroke();
    buffer.refresh();
    buffer.refresh();
    EXPECT_EQ(buffer.bufferMeta().generation, 1u);
}

TEST(RenderTest, CachedElementIgnoresFurtherSegments) {
    StrokeRenderBuffer buffer;
    const StrokeHandle h = buffer.addStroke();
    buffer.drawSegment(h, Point{0, 0}, Point{5, 5});
    buffer.cacheStroke(h, Bounds{0.0f, 0.0f, 100.0f, 100.0f});
    EXPECT_TRUE(buffer.isCached(h));

    buffer.drawSegment(h, Point{5, 5}, Point{9, 9});
    EXPECT_EQ(buffer.segmentCount(h), 1u);
}

TEST(RenderTest, RemoveAndClearElements) {
    StrokeRenderBuffer buffer;
    const StrokeHandle a = buffer.addStroke();
    const StrokeHandle b = buffer.addStroke();
    buffer.drawSegment(a, Point{0, 0}, Point{1, 0});
    buffer.drawSegment(b, Point{0, 0}, Point{1, 0});

    buffer.removeLastStroke();
    buffer.refresh();
    EXPECT_EQ(buffer.elementCount(), 1u);
    EXPECT_EQ(buffer.segmentCount(b), 0u);
    EXPECT_EQ(buffer.bufferMeta().vertexCount, kSegmentVertices);

    buffer.clearAll();
    buffer.refresh();
    EXPECT_EQ(buffer.elementCount(), 0u);
    EXPECT_TRUE(buffer.triangleVertices().empty());

    // Removing from an empty buffer is harmless.
    buffer.removeLastStroke();
    buffer.clearAll();
    EXPECT_EQ(buffer.elementCount(), 0u);
}

TEST(RenderTest, UnknownHandleIsIgnored) {
    StrokeRenderBuffer buffer;
    buffer.drawSegment(42, Point{0, 0}, Point{1, 1});
    buffer.cacheStroke(42, Bounds{0.0f, 0.0f, 1.0f, 1.0f});
    EXPECT_EQ(buffer.elementCount(), 0u);
    EXPECT_FALSE(buffer.isCached(42));
}
