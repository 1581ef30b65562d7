#pragma once

#include "index/participant_index.hpp"
#include "time_utils.hpp"

#include <cstdint>
#include <span>

// Rest value reported when a participant has no event before the cutoff.
constexpr int NO_PRIOR_EVENT_REST = 999;

// Whole days between the newest event of `prior` and `cutoff`.
inline int compute_rest_days(std::span<const EventRef> prior, uint64_t cutoff) {
    if (prior.empty()) return NO_PRIOR_EVENT_REST;
    return time_utils::whole_days_between(prior.back().timestamp, cutoff);
}

inline int compute_rest_days(const ParticipantIndex& index, uint32_t pid, uint64_t cutoff) {
    return compute_rest_days(index.events_before(pid, cutoff, 1), cutoff);
}

inline bool is_back_to_back(int rest_days) {
    return rest_days == 1;
}
