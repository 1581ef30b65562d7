#pragma once

#include "index/pair_index.hpp"

#include <cstddef>
#include <cstdint>

// ---------------------------------------------------------------------------
// HeadToHeadStats — shared history of one pair, seen from participant a
// ---------------------------------------------------------------------------
struct HeadToHeadStats {
    int games = 0;
    int wins_a = 0;
    int wins_b = 0;
    float win_pct_a = 0.0f;
};

// Last window_size meetings of a and b before cutoff. No shared history is
// not an error: the result is the zero record.
inline HeadToHeadStats compute_head_to_head(const PairIndex& pairs, uint32_t a, uint32_t b,
                                            uint64_t cutoff, size_t window_size) {
    HeadToHeadStats stats;
    auto meetings = pairs.events_before(a, b, cutoff, window_size);
    if (meetings.empty()) return stats;

    const EventStore& store = pairs.store();
    for (const auto& ref : meetings) {
        if (won_by(store.at(ref.position), a)) {
            ++stats.wins_a;
        } else {
            ++stats.wins_b;
        }
    }
    stats.games = static_cast<int>(meetings.size());
    stats.win_pct_a = static_cast<float>(static_cast<double>(stats.wins_a) /
                                         static_cast<double>(stats.games));
    return stats;
}
