#pragma once

#include "inkpad/recording/recording_sink.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace inkpad {

// Completion callbacks of recording calls that a host has not settled yet,
// keyed by a numeric ticket the host hands back when its request finishes.
class PendingRecordings {
public:
    using Ticket = std::uint32_t;

    Ticket add(RecordingCallback done);
    // Runs and forgets the callback. Returns false for unknown or already
    // settled tickets.
    bool settle(Ticket ticket, const std::optional<std::string>& error);
    // Forgets the callback without running it.
    void drop(Ticket ticket);

    std::size_t size() const noexcept { return pending_.size(); }

private:
    std::unordered_map<Ticket, RecordingCallback> pending_;
    Ticket nextTicket_{1};
};

} // namespace inkpad
