#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the session public API header for bindings.
#include "inkpad/session/sketch_session.h"
#include "inkpad/recording/pending_recordings.h"

#ifdef EMSCRIPTEN
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using emscripten::val;
using namespace inkpad;

std::optional<double> toCoordinate(const val& v) {
    if (v.isNumber()) return v.as<double>();
    return std::nullopt;
}

val pointToJs(const Point& p) {
    val out = val::array();
    out.call<void>("push", p.x);
    out.call<void>("push", p.y);
    return out;
}

val strokesToJs(const std::vector<Stroke>& strokes) {
    val out = val::array();
    for (const auto& stroke : strokes) {
        val points = val::array();
        for (const auto& p : stroke) {
            points.call<void>("push", pointToJs(p));
        }
        out.call<void>("push", points);
    }
    return out;
}

val candidatesToJs(const CandidateList& candidates) {
    val out = val::array();
    for (const auto& c : candidates) {
        out.call<void>("push", c);
    }
    return out;
}

// A JS exception thrown through val::call is not a std::exception, so host
// methods whose failures must be contained are invoked through this wrapper.
// It reports { ok, value } or { ok: false, error } and never throws.
const val& guardedCaller() {
    static const val caller = val::global("Function").new_(
        val("target"), val("method"), val("args"),
        val("try { return { ok: true, value: target[method].apply(target, args) }; }"
            " catch (e) { return { ok: false, error: String(e && e.message !== undefined ? e.message : e) }; }"));
    return caller;
}

// Calls target[method](...args); a JS failure becomes std::runtime_error.
val guardedCall(const val& target, const char* method, const val& args) {
    const val outcome = guardedCaller()(target, val(method), args);
    if (!outcome["ok"].as<bool>()) {
        throw std::runtime_error(std::string(method) + ": " + outcome["error"].as<std::string>());
    }
    return outcome["value"];
}

// JS object with a match(strokes, limit) -> string[] method.
class JsMatcher : public Matcher {
public:
    explicit JsMatcher(val impl) : impl_(std::move(impl)) {}

    CandidateList match(const std::vector<Stroke>& strokes, std::uint32_t limit) const override {
        val args = val::array();
        args.call<void>("push", strokesToJs(strokes));
        args.call<void>("push", limit);
        const val result = guardedCall(impl_, "match", args);
        if (!val::global("Array").call<bool>("isArray", result)) {
            throw std::runtime_error("match: result is not an array");
        }
        return emscripten::vecFromJSArray<std::string>(result);
    }

private:
    val impl_;
};

// Forwards render calls to a JS drawing layer. Handles are allocated here so
// that the host never has to return anything.
class JsRenderSink : public RenderSink {
public:
    explicit JsRenderSink(val impl) : impl_(std::move(impl)) {}

    StrokeHandle addStroke() override {
        const StrokeHandle handle = nextHandle_++;
        impl_.call<void>("addStroke", handle);
        return handle;
    }
    void removeLastStroke() override { impl_.call<void>("removeLastStroke"); }
    void clearAll() override { impl_.call<void>("clearAll"); }
    void drawSegment(StrokeHandle stroke, const Point& p1, const Point& p2) override {
        impl_.call<void>("drawSegment", stroke, pointToJs(p1), pointToJs(p2));
    }
    void cacheStroke(StrokeHandle stroke, const Bounds& bounds) override {
        impl_.call<void>("cacheStroke", stroke, bounds.x, bounds.y, bounds.w, bounds.h);
    }
    void refresh() override { impl_.call<void>("refresh"); }

private:
    val impl_;
    StrokeHandle nextHandle_{1};
};

// JS object with a record(strokes, candidates, chosen, ticket) method. The
// host settles each call with SketchSession.completeRecording(ticket, error);
// tickets are plain numbers, so nothing needs to be deleted on the JS side.
class JsRecordingSink : public RecordingSink {
public:
    explicit JsRecordingSink(val impl) : impl_(std::move(impl)) {}

    void record(const SelectionRecord& record, RecordingCallback done) override {
        const PendingRecordings::Ticket ticket = pending_.add(std::move(done));

        val args = val::array();
        args.call<void>("push", strokesToJs(record.strokes));
        args.call<void>("push", candidatesToJs(record.candidates));
        args.call<void>("push", record.chosen);
        args.call<void>("push", ticket);
        try {
            guardedCall(impl_, "record", args);
        } catch (const std::exception&) {
            pending_.drop(ticket);
            throw;
        }
    }

    bool complete(PendingRecordings::Ticket ticket, const std::optional<std::string>& error) {
        return pending_.settle(ticket, error);
    }

private:
    val impl_;
    PendingRecordings pending_;
};

struct SessionStatsView {
    std::uint32_t strokeCount;
    std::uint32_t inProgressPointCount;
    std::uint32_t revision;
    double droppedPointCount;
    std::uint32_t computeCount;
    double lastComputeMs;
    std::uint32_t matcherState;
    std::uint32_t recordingsCompleted;
    std::uint32_t recordingFailures;
    double zoom;
};

// Session plus the JS adapters it draws and records through.
class WasmSketchSession {
public:
    WasmSketchSession(val renderSink, float canvasWidth, float canvasHeight)
        : renderSink_(std::move(renderSink)),
          session_(renderSink_, makeOptions(canvasWidth, canvasHeight)) {}

    void pointerDown(val x, val y) {
        session_.pointerDown(RawPoint{toCoordinate(x), toCoordinate(y)});
    }
    void pointerMove(val ox, val oy, val x, val y) {
        session_.pointerMove(RawPoint{toCoordinate(ox), toCoordinate(oy)}, RawPoint{toCoordinate(x), toCoordinate(y)});
    }
    void pointerUp() { session_.pointerUp(); }

    void setZoom(double zoom) { session_.setZoom(zoom); }
    double getZoom() const { return session_.zoom(); }
    void layout(double outerWidth, double outerHeight, double innerWidth, double innerHeight) {
        session_.layout(outerWidth, outerHeight, innerWidth, innerHeight);
    }

    void clear() { session_.clear(); }
    bool undo() { return session_.undo(); }
    void onContextChanged() { session_.onContextChanged(); }

    void beginMatcherLoad() { session_.beginMatcherLoad(); }
    void installMatcher(val matcher) { session_.installMatcher(std::make_unique<JsMatcher>(std::move(matcher))); }
    void failMatcherLoad(const std::string& reason) { session_.failMatcherLoad(reason); }

    void setRecordingSink(val sink) {
        if (sink.isNull() || sink.isUndefined()) {
            recordingSink_.reset();
            session_.setRecordingSink(nullptr);
            return;
        }
        recordingSink_ = std::make_unique<JsRecordingSink>(std::move(sink));
        session_.setRecordingSink(recordingSink_.get());
    }

    // error: null/undefined on success, otherwise the failure message.
    bool completeRecording(std::uint32_t ticket, val error) {
        if (!recordingSink_) return false;
        std::optional<std::string> message;
        if (!error.isNull() && !error.isUndefined()) {
            message = error.isString() ? error.as<std::string>() : val::global("String")(error).as<std::string>();
        }
        return recordingSink_->complete(ticket, message);
    }

    val getStrokes() const { return strokesToJs(session_.strokes()); }
    val getCandidates() const { return candidatesToJs(session_.candidates()); }

    val selectCandidate(std::uint32_t index) {
        const std::optional<Candidate> chosen = session_.selectCandidate(index);
        return chosen ? val(*chosen) : val::null();
    }

    SessionStatsView getStats() const {
        const auto s = session_.stats();
        return SessionStatsView{
            s.strokeCount,
            s.inProgressPointCount,
            s.revision,
            static_cast<double>(s.droppedPointCount),
            s.computeCount,
            s.lastComputeMs,
            static_cast<std::uint32_t>(s.matcherState),
            s.recordingsCompleted,
            s.recordingFailures,
            s.zoom
        };
    }

    std::uint32_t getLastError() const { return static_cast<std::uint32_t>(session_.lastError()); }
    std::string getLastErrorMessage() const { return session_.lastErrorMessage(); }

private:
    static SessionOptions makeOptions(float canvasWidth, float canvasHeight) {
        SessionOptions options;
        options.canvasWidth = canvasWidth;
        options.canvasHeight = canvasHeight;
        return options;
    }

    JsRenderSink renderSink_;
    std::unique_ptr<JsRecordingSink> recordingSink_;
    SketchSession session_;
};

} // namespace

EMSCRIPTEN_BINDINGS(inkpad_module) {
    emscripten::enum_<MatcherState>("MatcherState")
        .value("NotReady", MatcherState::NotReady)
        .value("Loading", MatcherState::Loading)
        .value("Ready", MatcherState::Ready)
        .value("Failed", MatcherState::Failed);

    emscripten::enum_<SessionError>("SessionError")
        .value("Ok", SessionError::Ok)
        .value("MatcherLoadFailed", SessionError::MatcherLoadFailed)
        .value("MatcherFailed", SessionError::MatcherFailed)
        .value("RecordingFailed", SessionError::RecordingFailed)
        .value("InvalidCandidate", SessionError::InvalidCandidate);

    emscripten::value_object<SessionStatsView>("SessionStats")
        .field("strokeCount", &SessionStatsView::strokeCount)
        .field("inProgressPointCount", &SessionStatsView::inProgressPointCount)
        .field("revision", &SessionStatsView::revision)
        .field("droppedPointCount", &SessionStatsView::droppedPointCount)
        .field("computeCount", &SessionStatsView::computeCount)
        .field("lastComputeMs", &SessionStatsView::lastComputeMs)
        .field("matcherState", &SessionStatsView::matcherState)
        .field("recordingsCompleted", &SessionStatsView::recordingsCompleted)
        .field("recordingFailures", &SessionStatsView::recordingFailures)
        .field("zoom", &SessionStatsView::zoom);

    emscripten::class_<WasmSketchSession>("SketchSession")
        .constructor<val, float, float>()
        // Pointer input
        .function("pointerDown", &WasmSketchSession::pointerDown)
        .function("pointerMove", &WasmSketchSession::pointerMove)
        .function("pointerUp", &WasmSketchSession::pointerUp)
        // Layout
        .function("setZoom", &WasmSketchSession::setZoom)
        .function("getZoom", &WasmSketchSession::getZoom)
        .function("layout", &WasmSketchSession::layout)
        // Editing
        .function("clear", &WasmSketchSession::clear)
        .function("undo", &WasmSketchSession::undo)
        .function("onContextChanged", &WasmSketchSession::onContextChanged)
        // Matcher lifecycle
        .function("beginMatcherLoad", &WasmSketchSession::beginMatcherLoad)
        .function("installMatcher", &WasmSketchSession::installMatcher)
        .function("failMatcherLoad", &WasmSketchSession::failMatcherLoad)
        // Results
        .function("setRecordingSink", &WasmSketchSession::setRecordingSink)
        .function("completeRecording", &WasmSketchSession::completeRecording)
        .function("getStrokes", &WasmSketchSession::getStrokes)
        .function("getCandidates", &WasmSketchSession::getCandidates)
        .function("selectCandidate", &WasmSketchSession::selectCandidate)
        .function("getStats", &WasmSketchSession::getStats)
        .function("getLastError", &WasmSketchSession::getLastError)
        .function("getLastErrorMessage", &WasmSketchSession::getLastErrorMessage);
}
#endif
