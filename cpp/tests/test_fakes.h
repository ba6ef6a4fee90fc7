#pragma once

#include "inkpad/core/types.h"
#include "inkpad/recompute/matcher.h"
#include "inkpad/recording/recording_sink.h"
#include "inkpad/render/render_sink.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace inkpad_test {

using inkpad::Bounds;
using inkpad::Candidate;
using inkpad::CandidateList;
using inkpad::Point;
using inkpad::RawPoint;
using inkpad::Stroke;
using inkpad::StrokeHandle;

inline RawPoint raw(double x, double y) {
    return RawPoint{x, y};
}

inline RawPoint rawMissingX(double y) {
    return RawPoint{std::nullopt, y};
}

// Deterministic matcher: candidate i encodes the stroke and point counts it
// was called with, so tests can tell which input produced a list.
class CountingMatcher : public inkpad::Matcher {
public:
    CandidateList match(const std::vector<Stroke>& strokes, std::uint32_t limit) const override {
        calls++;
        lastLimit = limit;
        lastStrokes = strokes;
        std::size_t points = 0;
        for (const auto& s : strokes) points += s.size();
        CandidateList out;
        const std::uint32_t n = limit < 3 ? limit : 3;
        for (std::uint32_t i = 0; i < n; i++) {
            out.push_back("s" + std::to_string(strokes.size()) + "p" + std::to_string(points) + "#" + std::to_string(i));
        }
        return out;
    }

    static Candidate expectedFirst(std::size_t strokeCount, std::size_t pointCount) {
        return "s" + std::to_string(strokeCount) + "p" + std::to_string(pointCount) + "#0";
    }

    mutable std::uint32_t calls = 0;
    mutable std::uint32_t lastLimit = 0;
    mutable std::vector<Stroke> lastStrokes;
};

class ThrowingMatcher : public inkpad::Matcher {
public:
    CandidateList match(const std::vector<Stroke>&, std::uint32_t) const override {
        throw std::runtime_error("median table corrupted");
    }
};

// Behaves like CountingMatcher until `failing` is set, then throws the way a
// host matcher does when its call fails.
class FlakyMatcher : public CountingMatcher {
public:
    CandidateList match(const std::vector<Stroke>& strokes, std::uint32_t limit) const override {
        if (failing) throw std::runtime_error("match: host call failed");
        return CountingMatcher::match(strokes, limit);
    }

    bool failing = false;
};

// Records every sink call in order.
class RecordingRenderSink : public inkpad::RenderSink {
public:
    enum class Op { Add, RemoveLast, ClearAll, Segment, Cache, Refresh };

    struct Call {
        Op op;
        StrokeHandle handle;
        Point p1;
        Point p2;
        Bounds bounds;
    };

    StrokeHandle addStroke() override {
        const StrokeHandle h = nextHandle++;
        calls.push_back(Call{Op::Add, h, {}, {}, {}});
        live++;
        return h;
    }
    void removeLastStroke() override {
        calls.push_back(Call{Op::RemoveLast, 0, {}, {}, {}});
        if (live > 0) live--;
    }
    void clearAll() override {
        calls.push_back(Call{Op::ClearAll, 0, {}, {}, {}});
        live = 0;
    }
    void drawSegment(StrokeHandle stroke, const Point& p1, const Point& p2) override {
        calls.push_back(Call{Op::Segment, stroke, p1, p2, {}});
    }
    void cacheStroke(StrokeHandle stroke, const Bounds& bounds) override {
        calls.push_back(Call{Op::Cache, stroke, {}, {}, bounds});
    }
    void refresh() override {
        calls.push_back(Call{Op::Refresh, 0, {}, {}, {}});
    }

    std::size_t count(Op op) const {
        std::size_t n = 0;
        for (const auto& c : calls) {
            if (c.op == op) n++;
        }
        return n;
    }

    std::vector<Call> calls;
    std::size_t live = 0;
    StrokeHandle nextHandle = 1;
};

// Keeps the completion callbacks so tests decide when and how calls finish.
class FakeRecordingSink : public inkpad::RecordingSink {
public:
    void record(const inkpad::SelectionRecord& record, inkpad::RecordingCallback done) override {
        if (throwOnRecord) throw std::runtime_error("network unreachable");
        records.push_back(record);
        pending.push_back(std::move(done));
    }

    void completeAll(const std::optional<std::string>& error = std::nullopt) {
        auto callbacks = std::move(pending);
        pending.clear();
        for (auto& cb : callbacks) cb(error);
    }

    bool throwOnRecord = false;
    std::vector<inkpad::SelectionRecord> records;
    std::vector<inkpad::RecordingCallback> pending;
};

} // namespace inkpad_test
