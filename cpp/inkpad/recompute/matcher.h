#pragma once

#include "inkpad/core/types.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace inkpad {

// Ranks candidate characters for a set of strokes. Implementations must be
// pure functions of their inputs.
class Matcher {
public:
    virtual ~Matcher() = default;
    virtual CandidateList match(const std::vector<Stroke>& strokes, std::uint32_t limit) const = 0;
};

// Deferred initialization task producing a ready matcher. May throw; a
// failure is contained by the recompute graph.
using MatcherLoader = std::function<std::unique_ptr<Matcher>()>;

} // namespace inkpad
