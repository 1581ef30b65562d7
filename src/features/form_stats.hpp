#pragma once

#include "data/event_store.hpp"
#include "index/participant_index.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

// ---------------------------------------------------------------------------
// FormStats — recent performance summary for one participant
// ---------------------------------------------------------------------------
struct FormStats {
    int games_played = 0;
    float win_pct = 0.0f;
    float avg_scored = 0.0f;
    float avg_allowed = 0.0f;
    float avg_differential = 0.0f;
};

// Summarize an already-selected window of pid's events. Scored/allowed are
// taken from whichever side pid played. An empty window is the cold-start
// record (all zeros).
inline FormStats compute_form(std::span<const EventRef> window, const EventStore& store,
                              uint32_t pid) {
    FormStats stats;
    if (window.empty()) return stats;

    int wins = 0;
    double scored = 0.0;
    double allowed = 0.0;
    for (const auto& ref : window) {
        const auto& ev = store.at(ref.position);
        scored += score_for(ev, pid);
        allowed += opponent_score_for(ev, pid);
        if (won_by(ev, pid)) ++wins;
    }

    double n = static_cast<double>(window.size());
    stats.games_played = static_cast<int>(window.size());
    stats.win_pct = static_cast<float>(wins / n);
    stats.avg_scored = static_cast<float>(scored / n);
    stats.avg_allowed = static_cast<float>(allowed / n);
    stats.avg_differential = static_cast<float>(scored / n - allowed / n);
    return stats;
}

inline FormStats compute_form(const ParticipantIndex& index, uint32_t pid, uint64_t cutoff,
                              size_t window_size) {
    return compute_form(index.events_before(pid, cutoff, window_size), index.store(), pid);
}
