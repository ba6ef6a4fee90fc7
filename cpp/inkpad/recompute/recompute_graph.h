#pragma once

#include "inkpad/core/types.h"
#include "inkpad/document/stroke_collection.h"
#include "inkpad/recompute/matcher.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace inkpad {

// Keeps the candidate list equal to matcher.match(strokes, limit) for the
// current stroke collection.
//
// The graph subscribes to the collection and recomputes synchronously on
// every mutation. While the matcher is not Ready it stays inert and the
// candidate list is empty; becoming Ready recomputes the strokes that
// accumulated in the meantime.
class RecomputeGraph {
public:
    using ErrorHandler = std::function<void(SessionError, const std::string&)>;

    RecomputeGraph(StrokeCollection& strokes, std::uint32_t limit = defaultCandidateLimit);
    ~RecomputeGraph();

    RecomputeGraph(const RecomputeGraph&) = delete;
    RecomputeGraph& operator=(const RecomputeGraph&) = delete;

    MatcherState matcherState() const noexcept { return state_; }
    bool isReady() const noexcept { return state_ == MatcherState::Ready; }
    std::uint32_t limit() const noexcept { return limit_; }

    // Asynchronous hosts drive loading through these three calls.
    void beginMatcherLoad();
    void installMatcher(std::unique_ptr<Matcher> matcher);
    void failMatcherLoad(const std::string& reason);

    // Runs a deferred load task once. Exceptions are logged and leave the
    // graph in the Failed state. Returns whether the matcher became Ready.
    bool runMatcherLoad(const MatcherLoader& loader);

    // Recomputes if the collection changed since the last computation.
    // Returns whether the matcher was invoked.
    bool recompute();

    const CandidateList& candidates() const noexcept { return candidates_; }

    void setErrorHandler(ErrorHandler handler) { errorHandler_ = std::move(handler); }

    std::uint32_t computeCount() const noexcept { return computeCount_; }
    std::uint32_t loadFailureCount() const noexcept { return loadFailures_; }
    std::uint32_t matchFailureCount() const noexcept { return matchFailures_; }
    double lastComputeMs() const noexcept { return lastComputeMs_; }

private:
    void onStrokesChanged();
    void reportError(SessionError error, const std::string& message);

    StrokeCollection& strokes_;
    StrokeCollection::SubscriptionId subscription_{0};
    std::uint32_t limit_;

    MatcherState state_{MatcherState::NotReady};
    std::unique_ptr<Matcher> matcher_;

    CandidateList candidates_;
    bool computed_{false};
    std::uint32_t computedRevision_{0};

    ErrorHandler errorHandler_;
    std::uint32_t computeCount_{0};
    std::uint32_t loadFailures_{0};
    std::uint32_t matchFailures_{0};
    double lastComputeMs_{0.0};
};

} // namespace inkpad
