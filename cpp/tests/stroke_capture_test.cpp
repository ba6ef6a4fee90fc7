#include <gtest/gtest.h>
#include "inkpad/capture/stroke_capture.h"
#include "inkpad/document/stroke_collection.h"
#include "tests/test_fakes.h"

using namespace inkpad;
using namespace inkpad_test;
using Op = RecordingRenderSink::Op;

class StrokeCaptureTest : public ::testing::Test {
protected:
    StrokeCollection strokes;
    RecordingRenderSink sink;
    CoordinateNormalizer normalizer;
    StrokeCapture capture{strokes, sink, normalizer};

    void SetUp() override {
        capture.setCacheBounds(Bounds{0.0f, 0.0f, 320.0f, 240.0f});
    }
};

TEST_F(StrokeCaptureTest, InitialStateIsIdle) {
    EXPECT_EQ(capture.state(), CaptureState::Idle);
    EXPECT_TRUE(capture.inProgress().empty());
    EXPECT_EQ(capture.droppedPointCount(), 0u);
}

TEST_F(StrokeCaptureTest, GestureCommitsStroke) {
    capture.pointerDown(raw(0, 0));
    EXPECT_EQ(capture.state(), CaptureState::Drawing);
    capture.pointerMove(raw(0, 0), raw(10, 0));
    capture.pointerMove(raw(10, 0), raw(10, 10));
    capture.pointerUp();

    EXPECT_EQ(capture.state(), CaptureState::Idle);
    EXPECT_TRUE(capture.inProgress().empty());
    ASSERT_EQ(strokes.size(), 1u);
    const Stroke expected{{0, 0}, {10, 0}, {10, 10}};
    EXPECT_EQ(strokes.strokes()[0], expected);

    EXPECT_EQ(sink.count(Op::Add), 1u);
    EXPECT_EQ(sink.count(Op::Segment), 2u);
    ASSERT_EQ(sink.count(Op::Cache), 1u);
    for (const auto& c : sink.calls) {
        if (c.op != Op::Cache) continue;
        EXPECT_EQ(c.handle, 1u);
        EXPECT_FLOAT_EQ(c.bounds.w, 320.0f);
        EXPECT_FLOAT_EQ(c.bounds.h, 240.0f);
    }
    EXPECT_EQ(sink.calls.back().op, Op::Refresh);
}

TEST_F(StrokeCaptureTest, SegmentsJoinLastTwoPoints) {
    capture.pointerDown(raw(1, 1));
    capture.pointerMove(raw(1, 1), raw(4, 5));
    capture.pointerMove(raw(4, 5), raw(9, 9));

    std::vector<RecordingRenderSink::Call> segments;
    for (const auto& c : sink.calls) {
        if (c.op == Op::Segment) segments.push_back(c);
    }
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].p1, (Point{1, 1}));
    EXPECT_EQ(segments[0].p2, (Point{4, 5}));
    EXPECT_EQ(segments[1].p1, (Point{4, 5}));
    EXPECT_EQ(segments[1].p2, (Point{9, 9}));
}

TEST_F(StrokeCaptureTest, SingleClickIsDiscarded) {
    capture.pointerDown(raw(7, 7));
    capture.pointerUp();

    EXPECT_TRUE(strokes.empty());
    EXPECT_EQ(strokes.revision(), 0u);
    EXPECT_EQ(sink.count(Op::Add), 0u);
    EXPECT_EQ(sink.count(Op::Segment), 0u);
    EXPECT_EQ(sink.count(Op::Cache), 0u);
    EXPECT_EQ(capture.state(), CaptureState::Idle);
}

TEST_F(StrokeCaptureTest, MoveWhileIdleIsIgnored) {
    capture.pointerMove(raw(0, 0), raw(5, 5));
    capture.pointerUp();

    EXPECT_TRUE(strokes.empty());
    EXPECT_TRUE(sink.calls.empty());
}

TEST_F(StrokeCaptureTest, SecondDownWhileDrawingIsIgnored) {
    capture.pointerDown(raw(0, 0));
    capture.pointerDown(raw(50, 50));
    capture.pointerMove(raw(0, 0), raw(3, 0));
    capture.pointerUp();

    ASSERT_EQ(strokes.size(), 1u);
    const Stroke expected{{0, 0}, {3, 0}};
    EXPECT_EQ(strokes.strokes()[0], expected);
}

TEST_F(StrokeCaptureTest, DroppedDownPointUsesMoveOrigin) {
    capture.pointerDown(rawMissingX(4));
    EXPECT_EQ(capture.droppedPointCount(), 1u);
    EXPECT_TRUE(capture.inProgress().empty());

    capture.pointerMove(raw(3, 4), raw(6, 8));
    const Stroke expected{{3, 4}, {6, 8}};
    EXPECT_EQ(capture.inProgress(), expected);

    // Origin is only synthesized for the first accepted point.
    capture.pointerMove(raw(100, 100), raw(7, 9));
    EXPECT_EQ(capture.inProgress().size(), 3u);
}

TEST_F(StrokeCaptureTest, MalformedMovePointsNeverEnterStroke) {
    capture.pointerDown(raw(0, 0));
    capture.pointerMove(raw(0, 0), RawPoint{});
    capture.pointerMove(raw(0, 0), rawMissingX(3));
    EXPECT_EQ(capture.inProgress().size(), 1u);
    EXPECT_EQ(capture.droppedPointCount(), 2u);

    capture.pointerUp();
    EXPECT_TRUE(strokes.empty());
}

TEST_F(StrokeCaptureTest, CommittedPointCountIsBounded) {
    for (int moves = 0; moves <= 6; moves++) {
        StrokeCollection local;
        RecordingRenderSink localSink;
        StrokeCapture c(local, localSink, normalizer);

        // Every third gesture starts with a malformed down event.
        const bool dropDown = moves % 3 == 0;
        c.pointerDown(dropDown ? RawPoint{} : raw(0, 0));
        for (int i = 0; i < moves; i++) {
            c.pointerMove(raw(i, i), raw(i + 1, i + 1));
        }
        c.pointerUp();

        const std::size_t committed = local.empty() ? 0 : local.strokes()[0].size();
        EXPECT_LE(committed, static_cast<std::size_t>(moves + 2)) << "moves=" << moves;
        if (!local.empty()) {
            EXPECT_GE(committed, minCommittedStrokePoints);
        }
    }
}

TEST_F(StrokeCaptureTest, ZoomIsReadForEveryPoint) {
    normalizer.setZoom(2.0);
    capture.pointerDown(raw(40, 20));
    normalizer.setZoom(4.0);
    capture.pointerMove(raw(40, 20), raw(40, 20));
    capture.pointerUp();

    ASSERT_EQ(strokes.size(), 1u);
    const Stroke expected{{20, 10}, {10, 5}};
    EXPECT_EQ(strokes.strokes()[0], expected);
}

TEST_F(StrokeCaptureTest, AbortDiscardsGestureAndVisual) {
    capture.pointerDown(raw(0, 0));
    capture.pointerMove(raw(0, 0), raw(5, 0));
    ASSERT_EQ(sink.live, 1u);

    capture.abort();
    EXPECT_EQ(capture.state(), CaptureState::Idle);
    EXPECT_TRUE(capture.inProgress().empty());
    EXPECT_EQ(sink.count(Op::RemoveLast), 1u);
    EXPECT_EQ(sink.live, 0u);

    // The aborted gesture is gone; the next up does nothing.
    capture.pointerUp();
    EXPECT_TRUE(strokes.empty());
}

TEST_F(StrokeCaptureTest, AbortWithoutVisualLeavesSinkAlone) {
    capture.abort();
    capture.pointerDown(raw(0, 0));
    capture.abort();
    EXPECT_EQ(sink.count(Op::RemoveLast), 0u);
    EXPECT_EQ(capture.state(), CaptureState::Idle);
}
