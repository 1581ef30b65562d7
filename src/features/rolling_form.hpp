#pragma once

#include "data/event_store.hpp"
#include "features/form_stats.hpp"
#include "index/participant_index.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>

// Trailing windows (in prior events) summarized side by side.
constexpr std::array<size_t, 3> ROLLING_WINDOWS = {5, 10, 20};

// ---------------------------------------------------------------------------
// RollingStats — FormStats over one trailing window plus scoring spread
// ---------------------------------------------------------------------------
struct RollingStats {
    FormStats form;
    float scored_std = 0.0f;      // sample std (n - 1) of points scored
    float consistency = 0.0f;     // clamp(1 - scored_std / (avg_scored + 1), 0, 1)
};

// ---------------------------------------------------------------------------
// RollingForm — one RollingStats per ROLLING_WINDOWS entry, plus the
// hot/cold scoring streak over the widest window
// ---------------------------------------------------------------------------
struct RollingForm {
    std::array<RollingStats, ROLLING_WINDOWS.size()> windows{};
    int scoring_streak = 0;
};

// Fewer than two games carry no spread: std and consistency stay 0.
inline RollingStats compute_rolling_stats(std::span<const EventRef> window,
                                          const EventStore& store, uint32_t pid) {
    RollingStats stats;
    stats.form = compute_form(window, store, pid);
    if (window.size() < 2) return stats;

    double sum = 0.0;
    for (const auto& ref : window) sum += score_for(store.at(ref.position), pid);
    double mean = sum / static_cast<double>(window.size());
    double ss = 0.0;
    for (const auto& ref : window) {
        double d = score_for(store.at(ref.position), pid) - mean;
        ss += d * d;
    }
    double sd = std::sqrt(ss / static_cast<double>(window.size() - 1));

    stats.scored_std = static_cast<float>(sd);
    stats.consistency = static_cast<float>(std::clamp(1.0 - sd / (mean + 1.0), 0.0, 1.0));
    return stats;
}

// Signed run length of the newest events in `window` that all scored above
// (hot, +n) or not above (cold, -n) the window's mean score. 0 when empty.
inline int compute_scoring_streak(std::span<const EventRef> window, const EventStore& store,
                                  uint32_t pid) {
    if (window.empty()) return 0;

    double sum = 0.0;
    for (const auto& ref : window) sum += score_for(store.at(ref.position), pid);
    double mean = sum / static_cast<double>(window.size());

    auto is_hot = [&](const EventRef& ref) {
        return score_for(store.at(ref.position), pid) > mean;
    };
    bool hot = is_hot(window.back());
    int run = 0;
    for (auto it = window.rbegin(); it != window.rend() && is_hot(*it) == hot; ++it) ++run;
    return hot ? run : -run;
}

// `prior` is pid's full history before the cutoff, oldest first.
inline RollingForm compute_rolling_form(std::span<const EventRef> prior, const EventStore& store,
                                        uint32_t pid) {
    RollingForm out;
    for (size_t w = 0; w < ROLLING_WINDOWS.size(); ++w) {
        out.windows[w] =
            compute_rolling_stats(detail::trailing(prior, prior.size(), ROLLING_WINDOWS[w]), store, pid);
    }
    out.scoring_streak = compute_scoring_streak(
        detail::trailing(prior, prior.size(), ROLLING_WINDOWS.back()), store, pid);
    return out;
}

inline RollingForm compute_rolling_form(const ParticipantIndex& index, uint32_t pid,
                                        uint64_t cutoff) {
    auto refs = index.history(pid);
    return compute_rolling_form(refs.first(detail::lower_bound_cutoff(refs, cutoff)),
                                index.store(), pid);
}
