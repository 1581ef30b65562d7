#pragma once

#include "data/event_store.hpp"
#include "index/participant_index.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>

// Signed run length ending at the newest event of `prior` (oldest first):
// +n for n consecutive wins, -n for n consecutive losses, 0 if empty.
// Stops at the first change, so the cost is the run length, not the history.
inline int compute_streak(std::span<const EventRef> prior, const EventStore& store,
                          uint32_t pid) {
    if (prior.empty()) return 0;

    bool first = won_by(store.at(prior.back().position), pid);
    int run = 0;
    for (size_t i = prior.size(); i-- > 0;) {
        if (won_by(store.at(prior[i].position), pid) != first) break;
        ++run;
    }
    return first ? run : -run;
}

inline int compute_streak(const ParticipantIndex& index, uint32_t pid, uint64_t cutoff) {
    return compute_streak(index.events_before(pid, cutoff, std::numeric_limits<size_t>::max()),
                          index.store(), pid);
}
