#include "inkpad/recompute/recompute_graph.h"
#include "inkpad/core/logging.h"
#include "inkpad/core/util.h"

#include <exception>
#include <utility>

namespace inkpad {

RecomputeGraph::RecomputeGraph(StrokeCollection& strokes, std::uint32_t limit)
    : strokes_(strokes), limit_(limit)
{
    subscription_ = strokes_.subscribe([this](const StrokeCollection&) { onStrokesChanged(); });
}

RecomputeGraph::~RecomputeGraph() {
    strokes_.unsubscribe(subscription_);
}

void RecomputeGraph::beginMatcherLoad() {
    if (state_ == MatcherState::Ready) return;
    state_ = MatcherState::Loading;
}

void RecomputeGraph::installMatcher(std::unique_ptr<Matcher> matcher) {
    if (!matcher) {
        failMatcherLoad("loader produced no matcher");
        return;
    }
    matcher_ = std::move(matcher);
    state_ = MatcherState::Ready;
    computed_ = false;
    INKPAD_LOG_DEBUG("matcher ready, %zu strokes pending", strokes_.size());
    recompute();
}

void RecomputeGraph::failMatcherLoad(const std::string& reason) {
    if (state_ == MatcherState::Ready) return;
    state_ = MatcherState::Failed;
    loadFailures_++;
    candidates_.clear();
    INKPAD_LOG_ERROR("matcher load failed: %s", reason.c_str());
    reportError(SessionError::MatcherLoadFailed, reason);
}

bool RecomputeGraph::runMatcherLoad(const MatcherLoader& loader) {
    if (state_ == MatcherState::Ready) return true;
    if (!loader) {
        failMatcherLoad("no loader");
        return false;
    }
    beginMatcherLoad();
    std::unique_ptr<Matcher> matcher;
    try {
        matcher = loader();
    } catch (const std::exception& e) {
        failMatcherLoad(e.what());
        return false;
    }
    installMatcher(std::move(matcher));
    return isReady();
}

bool RecomputeGraph::recompute() {
    if (state_ != MatcherState::Ready) return false;
    const std::uint32_t revision = strokes_.revision();
    if (computed_ && computedRevision_ == revision) return false;

    const double t0 = nowMs();
    CandidateList next;
    try {
        next = matcher_->match(strokes_.strokes(), limit_);
    } catch (const std::exception& e) {
        matchFailures_++;
        next.clear();
        INKPAD_LOG_ERROR("matcher failed on %zu strokes: %s", strokes_.size(), e.what());
        reportError(SessionError::MatcherFailed, e.what());
    }
    candidates_.swap(next);
    computed_ = true;
    computedRevision_ = revision;
    computeCount_++;
    lastComputeMs_ = nowMs() - t0;
    return true;
}

void RecomputeGraph::onStrokesChanged() {
    if (state_ != MatcherState::Ready) {
        candidates_.clear();
        return;
    }
    recompute();
}

void RecomputeGraph::reportError(SessionError error, const std::string& message) {
    if (errorHandler_) errorHandler_(error, message);
}

} // namespace inkpad
