#pragma once

#include "data/event_store.hpp"
#include "features/form_stats.hpp"
#include "features/head_to_head.hpp"
#include "features/home_away_split.hpp"
#include "features/rest_days.hpp"
#include "features/rolling_form.hpp"
#include "features/streak.hpp"
#include "index/pair_index.hpp"
#include "index/participant_index.hpp"
#include "worker_group.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AssemblerConfig
// ---------------------------------------------------------------------------
struct AssemblerConfig {
    size_t window_size = 10;      // form and home/away window
    size_t h2h_window = 10;       // head-to-head window
    int min_history_games = 0;    // cold-start threshold, applied to both sides
    bool include_label = true;
    int num_threads = 1;

    void validate() const {
        if (window_size < 1) throw std::invalid_argument("window_size must be >= 1");
        if (h2h_window < 1) throw std::invalid_argument("h2h_window must be >= 1");
        if (min_history_games < 0) throw std::invalid_argument("min_history_games must be >= 0");
        if (num_threads < 1) throw std::invalid_argument("num_threads must be >= 1");
    }
};

// ---------------------------------------------------------------------------
// ParticipantFeatures — one side's state strictly before the cutoff
// ---------------------------------------------------------------------------
struct ParticipantFeatures {
    int prior_games = 0;          // full history length, not windowed
    FormStats form;
    int streak = 0;
    int rest_days = NO_PRIOR_EVENT_REST;
    bool back_to_back = false;
    HomeAwaySplit split;
    RollingForm rolling;          // fixed ROLLING_WINDOWS, independent of window_size
};

// ---------------------------------------------------------------------------
// FeatureRecord — one row per eligible event
// ---------------------------------------------------------------------------
struct FeatureRecord {
    uint64_t event_id = 0;
    uint64_t timestamp = 0;
    uint32_t participant_a = 0;
    uint32_t participant_b = 0;
    bool a_is_home = true;

    ParticipantFeatures a;
    ParticipantFeatures b;
    HeadToHeadStats h2h;

    // Realized outcome (targets, not features)
    bool has_label = false;
    int label_a_win = 0;
    float score_a = 0.0f;
    float score_b = 0.0f;

    static std::vector<std::string> feature_names() {
        std::vector<std::string> names;
        for (const char* side : {"a_", "b_"}) {
            std::string p(side);
            names.push_back(p + "games_played");
            names.push_back(p + "win_pct");
            names.push_back(p + "avg_scored");
            names.push_back(p + "avg_allowed");
            names.push_back(p + "avg_differential");
            names.push_back(p + "streak");
            names.push_back(p + "rest_days");
            names.push_back(p + "back_to_back");
            names.push_back(p + "home_games");
            names.push_back(p + "home_win_pct");
            names.push_back(p + "away_games");
            names.push_back(p + "away_win_pct");
            for (size_t w : ROLLING_WINDOWS) {
                std::string r = p + "r" + std::to_string(w) + "_";
                names.push_back(r + "games_played");
                names.push_back(r + "win_pct");
                names.push_back(r + "avg_scored");
                names.push_back(r + "avg_allowed");
                names.push_back(r + "avg_differential");
                names.push_back(r + "scored_std");
                names.push_back(r + "consistency");
            }
            names.push_back(p + "scoring_streak");
        }
        names.push_back("a_is_home");
        names.push_back("h2h_games");
        names.push_back("h2h_wins_a");
        names.push_back("h2h_wins_b");
        names.push_back("h2h_win_pct_a");
        return names;
    }

    // Per side: 12 base + 7 per rolling window + scoring streak.
    // Then a_is_home + 4 head-to-head.
    static size_t feature_count() { return 2 * (12 + 7 * ROLLING_WINDOWS.size() + 1) + 5; }

    // Numeric features in feature_names() order.
    std::vector<float> feature_values() const {
        std::vector<float> v;
        v.reserve(feature_count());
        for (const ParticipantFeatures* side : {&a, &b}) {
            v.push_back(static_cast<float>(side->form.games_played));
            v.push_back(side->form.win_pct);
            v.push_back(side->form.avg_scored);
            v.push_back(side->form.avg_allowed);
            v.push_back(side->form.avg_differential);
            v.push_back(static_cast<float>(side->streak));
            v.push_back(static_cast<float>(side->rest_days));
            v.push_back(side->back_to_back ? 1.0f : 0.0f);
            v.push_back(static_cast<float>(side->split.home_games));
            v.push_back(side->split.home_win_pct);
            v.push_back(static_cast<float>(side->split.away_games));
            v.push_back(side->split.away_win_pct);
            for (const auto& rs : side->rolling.windows) {
                v.push_back(static_cast<float>(rs.form.games_played));
                v.push_back(rs.form.win_pct);
                v.push_back(rs.form.avg_scored);
                v.push_back(rs.form.avg_allowed);
                v.push_back(rs.form.avg_differential);
                v.push_back(rs.scored_std);
                v.push_back(rs.consistency);
            }
            v.push_back(static_cast<float>(side->rolling.scoring_streak));
        }
        v.push_back(a_is_home ? 1.0f : 0.0f);
        v.push_back(static_cast<float>(h2h.games));
        v.push_back(static_cast<float>(h2h.wins_a));
        v.push_back(static_cast<float>(h2h.wins_b));
        v.push_back(h2h.win_pct_a);
        return v;
    }
};

struct AssemblyStats {
    size_t events_seen = 0;
    size_t records_emitted = 0;
    size_t skipped_cold_start = 0;
};

// ---------------------------------------------------------------------------
// FeatureAssembler — indices are built once in the constructor and never
// written again; assemble() and query_matchup() only read them.
// The store must outlive the assembler, so temporaries are rejected.
// ---------------------------------------------------------------------------
class FeatureAssembler {
public:
    explicit FeatureAssembler(const EventStore& store, const AssemblerConfig& config = {})
        : store_(store), config_(validated(config)),
          participants_(ParticipantIndex::build(store, config.num_threads)),
          pairs_(PairIndex::build(participants_)) {}
    FeatureAssembler(EventStore&&, const AssemblerConfig& = {}) = delete;

    // One record per eligible event, in chronological order.
    std::vector<FeatureRecord> assemble() {
        auto events = store_.sorted_events();
        size_t n = events.size();
        size_t num_workers = std::min(static_cast<size_t>(config_.num_threads),
                                      std::max<size_t>(n, 1));

        std::vector<std::optional<FeatureRecord>> slots(n);
        std::vector<AssemblyStats> worker_stats(num_workers);

        if (num_workers == 1) {
            assemble_range(0, n, slots, worker_stats[0]);
        } else {
            std::vector<std::exception_ptr> errors(num_workers);
            {
                WorkerGroup workers(num_workers);
                size_t chunk = (n + num_workers - 1) / num_workers;
                for (size_t w = 0; w < num_workers; ++w) {
                    size_t lo = std::min(n, w * chunk);
                    size_t hi = std::min(n, lo + chunk);
                    workers.spawn([this, lo, hi, w, &slots, &worker_stats, &errors]() {
                        try {
                            assemble_range(lo, hi, slots, worker_stats[w]);
                        } catch (...) {
                            errors[w] = std::current_exception();
                        }
                    });
                }
            }
            for (const auto& err : errors) {
                if (err) std::rethrow_exception(err);
            }
        }

        std::vector<FeatureRecord> records;
        records.reserve(n);
        for (auto& slot : slots) {
            if (slot) records.push_back(std::move(*slot));
        }

        stats_ = AssemblyStats{};
        for (const auto& ws : worker_stats) {
            stats_.events_seen += ws.events_seen;
            stats_.records_emitted += ws.records_emitted;
            stats_.skipped_cold_start += ws.skipped_cold_start;
        }
        return records;
    }

    // Features for a hypothetical event between a and b at time `now`.
    // Same per-side computation as assemble(); no label, no history threshold.
    FeatureRecord query_matchup(uint32_t a, uint32_t b, uint64_t now, bool a_is_home = true) const {
        if (a == b) {
            throw std::invalid_argument("query_matchup requires two distinct participants");
        }
        HistoryCursor cursor(participants_);
        FeatureRecord rec;
        rec.timestamp = now;
        rec.participant_a = a;
        rec.participant_b = b;
        rec.a_is_home = a_is_home;
        rec.a = participant_features(cursor, a, now);
        rec.b = participant_features(cursor, b, now);
        rec.h2h = compute_head_to_head(pairs_, a, b, now, config_.h2h_window);
        return rec;
    }

    const ParticipantIndex& participant_index() const { return participants_; }
    const PairIndex& pair_index() const { return pairs_; }
    const AssemblerConfig& config() const { return config_; }

    // Counters from the most recent assemble().
    const AssemblyStats& stats() const { return stats_; }

private:
    const EventStore& store_;
    AssemblerConfig config_;
    ParticipantIndex participants_;
    PairIndex pairs_;
    AssemblyStats stats_;

    static AssemblerConfig validated(const AssemblerConfig& config) {
        config.validate();
        return config;
    }

    // Cutoffs fed to the cursor are non-decreasing within a range, so each
    // worker advances its own cursor monotonically.
    void assemble_range(size_t lo, size_t hi, std::vector<std::optional<FeatureRecord>>& slots,
                        AssemblyStats& stats) const {
        auto events = store_.sorted_events();
        HistoryCursor cursor(participants_);
        auto min_games = static_cast<size_t>(config_.min_history_games);

        for (size_t i = lo; i < hi; ++i) {
            const auto& ev = events[i];
            ++stats.events_seen;

            if (cursor.end_before(ev.participant_a, ev.timestamp) < min_games ||
                cursor.end_before(ev.participant_b, ev.timestamp) < min_games) {
                ++stats.skipped_cold_start;
                continue;
            }

            FeatureRecord rec;
            rec.event_id = ev.id;
            rec.timestamp = ev.timestamp;
            rec.participant_a = ev.participant_a;
            rec.participant_b = ev.participant_b;
            rec.a_is_home = ev.a_is_home;
            rec.a = participant_features(cursor, ev.participant_a, ev.timestamp);
            rec.b = participant_features(cursor, ev.participant_b, ev.timestamp);
            rec.h2h = compute_head_to_head(pairs_, ev.participant_a, ev.participant_b,
                                           ev.timestamp, config_.h2h_window);

            if (config_.include_label) {
                rec.has_label = true;
                rec.label_a_win = won_by(ev, ev.participant_a) ? 1 : 0;
                rec.score_a = static_cast<float>(ev.score_a);
                rec.score_b = static_cast<float>(ev.score_b);
            }

            slots[i] = std::move(rec);
            ++stats.records_emitted;
        }
    }

    ParticipantFeatures participant_features(HistoryCursor& cursor, uint32_t pid,
                                             uint64_t cutoff) const {
        size_t end = cursor.end_before(pid, cutoff);
        auto prior = participants_.history(pid).first(end);

        ParticipantFeatures f;
        f.prior_games = static_cast<int>(end);
        f.form = compute_form(detail::trailing(prior, end, config_.window_size), store_, pid);
        f.streak = compute_streak(prior, store_, pid);
        f.rest_days = compute_rest_days(prior, cutoff);
        f.back_to_back = is_back_to_back(f.rest_days);
        f.split = compute_home_away_split(participants_, pid, cutoff, config_.window_size);
        f.rolling = compute_rolling_form(prior, store_, pid);
        return f;
    }
};

inline std::vector<FeatureRecord> assemble_features(const EventStore& store,
                                                    const AssemblerConfig& config = {}) {
    FeatureAssembler assembler(store, config);
    return assembler.assemble();
}

std::vector<FeatureRecord> assemble_features(EventStore&&, const AssemblerConfig& = {}) = delete;
