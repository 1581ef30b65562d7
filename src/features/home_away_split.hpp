#pragma once

#include "data/event_store.hpp"
#include "index/participant_index.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

// ---------------------------------------------------------------------------
// HomeAwaySplit — win rate by role over the trailing window of each role
// ---------------------------------------------------------------------------
struct HomeAwaySplit {
    int home_games = 0;
    float home_win_pct = 0.0f;
    int away_games = 0;
    float away_win_pct = 0.0f;
};

namespace detail {

inline float win_pct(std::span<const EventRef> refs, const EventStore& store, uint32_t pid) {
    if (refs.empty()) return 0.0f;
    int wins = 0;
    for (const auto& ref : refs) {
        if (won_by(store.at(ref.position), pid)) ++wins;
    }
    return static_cast<float>(static_cast<double>(wins) / static_cast<double>(refs.size()));
}

}  // namespace detail

// Each partition is windowed independently: a participant with 30 prior
// home games and 2 away games gets window_size home games and 2 away games.
inline HomeAwaySplit compute_home_away_split(const ParticipantIndex& index, uint32_t pid,
                                             uint64_t cutoff, size_t window_size) {
    const EventStore& store = index.store();
    auto home = index.role_events_before(pid, true, cutoff, window_size);
    auto away = index.role_events_before(pid, false, cutoff, window_size);

    HomeAwaySplit split;
    split.home_games = static_cast<int>(home.size());
    split.home_win_pct = detail::win_pct(home, store, pid);
    split.away_games = static_cast<int>(away.size());
    split.away_win_pct = detail::win_pct(away, store, pid);
    return split;
}
