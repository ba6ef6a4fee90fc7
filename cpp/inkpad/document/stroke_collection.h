#pragma once

#include "inkpad/core/types.h"
#include <cstdint>
#include <cstddef>
#include <functional>
#include <vector>

namespace inkpad {

// Ordered sequence of committed strokes. Acts as the subject of the
// recompute graph: every mutation advances the revision and notifies all
// listeners synchronously, after the new state is in place.
class StrokeCollection {
public:
    using Listener = std::function<void(const StrokeCollection&)>;
    using SubscriptionId = std::uint32_t;

    StrokeCollection() = default;

    StrokeCollection(const StrokeCollection&) = delete;
    StrokeCollection& operator=(const StrokeCollection&) = delete;

    const std::vector<Stroke>& strokes() const noexcept { return strokes_; }
    std::size_t size() const noexcept { return strokes_.size(); }
    bool empty() const noexcept { return strokes_.empty(); }
    std::uint32_t revision() const noexcept { return revision_; }

    SubscriptionId subscribe(Listener listener);
    void unsubscribe(SubscriptionId id);
    std::size_t listenerCount() const noexcept { return listeners_.size(); }

    // Returns false (and leaves the collection untouched) for strokes with
    // fewer than minCommittedStrokePoints points.
    bool append(Stroke stroke);

    // Removes the last stroke. Returns false on an empty collection.
    bool removeLast();

    // Always counts as a mutation, even when already empty.
    void clear();

private:
    struct Subscription {
        SubscriptionId id;
        Listener listener;
    };

    void notify();

    std::vector<Stroke> strokes_;
    std::vector<Subscription> listeners_;
    SubscriptionId nextSubscriptionId_{1};
    std::uint32_t revision_{0};
};

} // namespace inkpad
