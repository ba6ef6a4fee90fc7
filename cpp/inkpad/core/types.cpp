#include "inkpad/core/types.h"

namespace inkpad {

const char* toString(MatcherState state) noexcept {
    switch (state) {
        case MatcherState::NotReady: return "not-ready";
        case MatcherState::Loading: return "loading";
        case MatcherState::Ready: return "ready";
        case MatcherState::Failed: return "failed";
    }
    return "unknown";
}

const char* toString(SessionError error) noexcept {
    switch (error) {
        case SessionError::Ok: return "ok";
        case SessionError::MatcherLoadFailed: return "matcher-load-failed";
        case SessionError::MatcherFailed: return "matcher-failed";
        case SessionError::RecordingFailed: return "recording-failed";
        case SessionError::InvalidCandidate: return "invalid-candidate";
    }
    return "unknown";
}

} // namespace inkpad
