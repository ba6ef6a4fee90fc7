#pragma once

#include "inkpad/core/types.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace inkpad {

// The opaque triple handed off when the user picks a candidate.
struct SelectionRecord {
    std::vector<Stroke> strokes;
    CandidateList candidates;
    Candidate chosen;
};

// Completion callback of a recording call; carries an error message on failure.
using RecordingCallback = std::function<void(const std::optional<std::string>& error)>;

// Remote call that stores finalized selections for later training. The
// outcome is only ever logged.
class RecordingSink {
public:
    virtual ~RecordingSink() = default;
    virtual void record(const SelectionRecord& record, RecordingCallback done) = 0;
};

} // namespace inkpad
