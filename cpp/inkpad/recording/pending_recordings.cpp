#include "inkpad/recording/pending_recordings.h"
#include "inkpad/core/logging.h"

#include <utility>

namespace inkpad {

PendingRecordings::Ticket PendingRecordings::add(RecordingCallback done) {
    const Ticket ticket = nextTicket_++;
    pending_.emplace(ticket, std::move(done));
    return ticket;
}

bool PendingRecordings::settle(Ticket ticket, const std::optional<std::string>& error) {
    auto it = pending_.find(ticket);
    if (it == pending_.end()) {
        INKPAD_LOG_WARN("recording ticket %u is not pending", ticket);
        return false;
    }
    RecordingCallback done = std::move(it->second);
    pending_.erase(it);
    if (done) done(error);
    return true;
}

void PendingRecordings::drop(Ticket ticket) {
    pending_.erase(ticket);
}

} // namespace inkpad
