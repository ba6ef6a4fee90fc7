#include "inkpad/document/stroke_collection.h"

#include <algorithm>
#include <utility>

namespace inkpad {

StrokeCollection::SubscriptionId StrokeCollection::subscribe(Listener listener) {
    const SubscriptionId id = nextSubscriptionId_++;
    listeners_.push_back(Subscription{id, std::move(listener)});
    return id;
}

void StrokeCollection::unsubscribe(SubscriptionId id) {
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(), [id](const Subscription& s) { return s.id == id; }),
        listeners_.end());
}

bool StrokeCollection::append(Stroke stroke) {
    if (stroke.size() < minCommittedStrokePoints) return false;
    strokes_.push_back(std::move(stroke));
    notify();
    return true;
}

bool StrokeCollection::removeLast() {
    if (strokes_.empty()) return false;
    strokes_.pop_back();
    notify();
    return true;
}

void StrokeCollection::clear() {
    strokes_.clear();
    notify();
}

void StrokeCollection::notify() {
    revision_++;
    // Copy so that a listener may unsubscribe while being notified.
    const std::vector<Subscription> snapshot = listeners_;
    for (const auto& s : snapshot) {
        if (s.listener) s.listener(*this);
    }
}

} // namespace inkpad
