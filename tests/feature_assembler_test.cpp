// feature_assembler_test.cpp — FeatureAssembler end to end: worked example,
// cold-start filtering, labels, determinism, parallel assembly, point-in-time
// queries, and a brute-force leakage check on random logs

#include <gtest/gtest.h>

#include "features/feature_assembler.hpp"
#include "test_helpers.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

using test_helpers::day;
using test_helpers::make_event;
using test_helpers::X;
using test_helpers::Y;

namespace {

const FeatureRecord& find_record(const std::vector<FeatureRecord>& records, uint64_t event_id) {
    auto it = std::find_if(records.begin(), records.end(),
                           [event_id](const FeatureRecord& r) { return r.event_id == event_id; });
    if (it == records.end()) throw std::runtime_error("record not found");
    return *it;
}

template <typename Store>
concept AssemblesFrom = requires(Store&& store) { assemble_features(std::forward<Store>(store)); };

}  // namespace

// ===========================================================================
// Three-game log
// ===========================================================================

class FeatureAssemblerScenarioTest : public ::testing::Test {
protected:
    EventStore store_ = EventStore::build(test_helpers::three_game_log());
};

TEST_F(FeatureAssemblerScenarioTest, OneRecordPerEventInOrder) {
    auto records = assemble_features(store_);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].event_id, 1u);
    EXPECT_EQ(records[1].event_id, 2u);
    EXPECT_EQ(records[2].event_id, 3u);
}

TEST_F(FeatureAssemblerScenarioTest, FirstEventIsColdStart) {
    auto records = assemble_features(store_);
    const auto& r = records[0];
    EXPECT_EQ(r.a.prior_games, 0);
    EXPECT_EQ(r.a.form.games_played, 0);
    EXPECT_EQ(r.a.streak, 0);
    EXPECT_EQ(r.a.rest_days, NO_PRIOR_EVENT_REST);
    EXPECT_FALSE(r.a.back_to_back);
    EXPECT_EQ(r.b.rest_days, NO_PRIOR_EVENT_REST);
    EXPECT_EQ(r.h2h.games, 0);
}

TEST_F(FeatureAssemblerScenarioTest, SecondEventFromYsSide) {
    auto records = assemble_features(store_);
    const auto& r = records[1];
    EXPECT_EQ(r.participant_a, Y);
    EXPECT_EQ(r.participant_b, X);
    EXPECT_EQ(r.a.streak, -1);
    EXPECT_EQ(r.b.streak, 1);
    EXPECT_EQ(r.a.rest_days, 2);
    EXPECT_EQ(r.h2h.games, 1);
    EXPECT_EQ(r.h2h.wins_a, 0);
    EXPECT_EQ(r.h2h.wins_b, 1);
    EXPECT_FLOAT_EQ(r.h2h.win_pct_a, 0.0f);
    EXPECT_EQ(r.label_a_win, 1);
}

TEST_F(FeatureAssemblerScenarioTest, ThirdEventMatchesWorkedExample) {
    auto records = assemble_features(store_);
    const auto& r = records[2];
    EXPECT_EQ(r.participant_a, X);

    EXPECT_EQ(r.a.form.games_played, 2);
    EXPECT_FLOAT_EQ(r.a.form.win_pct, 0.5f);
    EXPECT_FLOAT_EQ(r.a.form.avg_scored, 96.0f);
    EXPECT_FLOAT_EQ(r.a.form.avg_allowed, 92.5f);
    EXPECT_EQ(r.a.streak, -1);
    EXPECT_EQ(r.a.rest_days, 3);
    EXPECT_FALSE(r.a.back_to_back);

    EXPECT_FLOAT_EQ(r.b.form.avg_scored, 92.5f);
    EXPECT_EQ(r.b.streak, 1);

    EXPECT_EQ(r.h2h.games, 2);
    EXPECT_EQ(r.h2h.wins_a, 1);
    EXPECT_EQ(r.h2h.wins_b, 1);
    EXPECT_FLOAT_EQ(r.h2h.win_pct_a, 0.5f);

    EXPECT_TRUE(r.has_label);
    EXPECT_EQ(r.label_a_win, 1);
    EXPECT_FLOAT_EQ(r.score_a, 110.0f);
    EXPECT_FLOAT_EQ(r.score_b, 100.0f);
}

TEST_F(FeatureAssemblerScenarioTest, FeatureValuesFollowNames) {
    auto records = assemble_features(store_);
    auto names = FeatureRecord::feature_names();
    auto values = records[2].feature_values();
    ASSERT_EQ(names.size(), FeatureRecord::feature_count());
    ASSERT_EQ(values.size(), FeatureRecord::feature_count());

    std::map<std::string, float> by_name;
    for (size_t i = 0; i < names.size(); ++i) by_name[names[i]] = values[i];
    EXPECT_FLOAT_EQ(by_name["a_games_played"], 2.0f);
    EXPECT_FLOAT_EQ(by_name["a_streak"], -1.0f);
    EXPECT_FLOAT_EQ(by_name["a_rest_days"], 3.0f);
    EXPECT_FLOAT_EQ(by_name["b_streak"], 1.0f);
    EXPECT_FLOAT_EQ(by_name["a_is_home"], 1.0f);
    EXPECT_FLOAT_EQ(by_name["h2h_games"], 2.0f);
    EXPECT_FLOAT_EQ(by_name["h2h_win_pct_a"], 0.5f);

    EXPECT_EQ(by_name.size(), names.size()) << "feature names must be unique";
    EXPECT_FLOAT_EQ(by_name["a_r5_games_played"], 2.0f);
    EXPECT_FLOAT_EQ(by_name["a_r20_avg_scored"], 96.0f);
    EXPECT_FLOAT_EQ(by_name["b_r10_avg_scored"], 92.5f);
    EXPECT_FLOAT_EQ(by_name["a_scoring_streak"], -1.0f);   // 92 after 100
    EXPECT_FLOAT_EQ(by_name["b_scoring_streak"], 1.0f);    // 95 after 90
}

// ===========================================================================
// Cold-start threshold and labels
// ===========================================================================

class FeatureAssemblerConfigTest : public FeatureAssemblerScenarioTest {};

TEST_F(FeatureAssemblerConfigTest, MinHistorySkipsColdEvents) {
    AssemblerConfig config;
    config.min_history_games = 1;
    FeatureAssembler assembler(store_, config);
    auto records = assembler.assemble();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].event_id, 2u);
    EXPECT_EQ(assembler.stats().events_seen, 3u);
    EXPECT_EQ(assembler.stats().records_emitted, 2u);
    EXPECT_EQ(assembler.stats().skipped_cold_start, 1u);
}

TEST_F(FeatureAssemblerConfigTest, MinHistoryAppliesToBothSides) {
    // Participant 3 debuts on day 4 against X, who already has history.
    auto events = test_helpers::three_game_log();
    events.push_back(make_event(4, 4, X, 3, 80, 70));
    auto store = EventStore::build(events);

    AssemblerConfig config;
    config.min_history_games = 2;
    auto records = assemble_features(store, config);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].event_id, 3u);
}

TEST_F(FeatureAssemblerConfigTest, UnlabeledRecordsCarryNoOutcome) {
    AssemblerConfig config;
    config.include_label = false;
    auto records = assemble_features(store_, config);
    ASSERT_EQ(records.size(), 3u);
    for (const auto& r : records) {
        EXPECT_FALSE(r.has_label);
        EXPECT_EQ(r.label_a_win, 0);
    }
    // Features are unaffected by the label switch.
    auto labeled = assemble_features(store_);
    EXPECT_EQ(records[2].feature_values(), labeled[2].feature_values());
}

TEST_F(FeatureAssemblerConfigTest, InvalidConfigRejected) {
    AssemblerConfig config;
    config.window_size = 0;
    EXPECT_THROW((FeatureAssembler{store_, config}), std::invalid_argument);

    config = AssemblerConfig{};
    config.h2h_window = 0;
    EXPECT_THROW((FeatureAssembler{store_, config}), std::invalid_argument);

    config = AssemblerConfig{};
    config.min_history_games = -1;
    EXPECT_THROW((FeatureAssembler{store_, config}), std::invalid_argument);

    config = AssemblerConfig{};
    config.num_threads = 0;
    EXPECT_THROW((FeatureAssembler{store_, config}), std::invalid_argument);
}

// The assembler reads the store on every assemble(); a temporary would dangle.
TEST_F(FeatureAssemblerConfigTest, TemporaryStoreRejectedAtCompileTime) {
    EXPECT_FALSE((std::is_constructible_v<FeatureAssembler, EventStore&&>));
    EXPECT_FALSE((std::is_constructible_v<FeatureAssembler, EventStore&&, const AssemblerConfig&>));
    EXPECT_TRUE((std::is_constructible_v<FeatureAssembler, const EventStore&>));
    EXPECT_TRUE((std::is_constructible_v<FeatureAssembler, EventStore&, const AssemblerConfig&>));
    EXPECT_FALSE(AssemblesFrom<EventStore>);
    EXPECT_TRUE(AssemblesFrom<const EventStore&>);
}

TEST_F(FeatureAssemblerConfigTest, EmptyStoreGivesNoRecords) {
    auto empty = EventStore::build({});
    FeatureAssembler assembler(empty);
    EXPECT_TRUE(assembler.assemble().empty());
    EXPECT_EQ(assembler.stats().events_seen, 0u);
}

TEST_F(FeatureAssemblerConfigTest, SameTimestampEventsDoNotSeeEachOther) {
    auto store = EventStore::build({
        make_event(1, 2, X, Y, 10, 5),
        make_event(2, 2, X, 3, 10, 5),
        make_event(3, 3, X, 4, 10, 5),
    });
    auto records = assemble_features(store);
    EXPECT_EQ(find_record(records, 1).a.prior_games, 0);
    EXPECT_EQ(find_record(records, 2).a.prior_games, 0);
    EXPECT_EQ(find_record(records, 3).a.prior_games, 2);
    EXPECT_TRUE(find_record(records, 3).a.back_to_back);
}

// ===========================================================================
// Determinism and parallel assembly
// ===========================================================================

class FeatureAssemblerRandomTest : public ::testing::Test {
protected:
    EventStore store_ = EventStore::build(test_helpers::random_log(3000, 30, 250, 2024));
};

TEST_F(FeatureAssemblerRandomTest, RecordsAreChronological) {
    auto records = assemble_features(store_);
    ASSERT_EQ(records.size(), store_.size());
    for (size_t i = 1; i < records.size(); ++i) {
        EXPECT_LE(records[i - 1].timestamp, records[i].timestamp);
        EXPECT_EQ(records[i].event_id, store_.at(static_cast<uint32_t>(i)).id);
    }
}

TEST_F(FeatureAssemblerRandomTest, RebuildIsBitIdentical) {
    auto first = assemble_features(store_);
    auto second = assemble_features(store_);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].event_id, second[i].event_id);
        EXPECT_EQ(first[i].feature_values(), second[i].feature_values()) << "row " << i;
    }
}

TEST_F(FeatureAssemblerRandomTest, ParallelMatchesSerial) {
    AssemblerConfig serial_cfg;
    serial_cfg.min_history_games = 3;
    FeatureAssembler serial(store_, serial_cfg);
    auto expected = serial.assemble();

    for (int threads : {2, 4, 7}) {
        AssemblerConfig cfg = serial_cfg;
        cfg.num_threads = threads;
        FeatureAssembler parallel(store_, cfg);
        auto actual = parallel.assemble();
        ASSERT_EQ(actual.size(), expected.size()) << "threads=" << threads;
        for (size_t i = 0; i < actual.size(); ++i) {
            EXPECT_EQ(actual[i].event_id, expected[i].event_id);
            EXPECT_EQ(actual[i].feature_values(), expected[i].feature_values())
                << "threads=" << threads << " row " << i;
        }
        EXPECT_EQ(parallel.stats().skipped_cold_start, serial.stats().skipped_cold_start);
        EXPECT_EQ(parallel.stats().records_emitted, serial.stats().records_emitted);
    }
}

TEST_F(FeatureAssemblerRandomTest, MoreThreadsThanEvents) {
    auto small = EventStore::build(test_helpers::three_game_log());
    AssemblerConfig cfg;
    cfg.num_threads = 8;
    auto records = assemble_features(small, cfg);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[2].a.streak, -1);
}

TEST_F(FeatureAssemblerRandomTest, QueryMatchesAssembledRow) {
    FeatureAssembler assembler(store_);
    auto records = assembler.assemble();
    for (size_t i = 0; i < records.size(); i += 97) {
        const auto& r = records[i];
        auto q = assembler.query_matchup(r.participant_a, r.participant_b, r.timestamp, r.a_is_home);
        EXPECT_EQ(q.feature_values(), r.feature_values()) << "event " << r.event_id;
        EXPECT_FALSE(q.has_label);
    }
}

// No feature may depend on an event at or after its cutoff: every value is
// recomputed from a linear rescan of the raw log.
TEST_F(FeatureAssemblerRandomTest, NoLeakageAgainstBruteForce) {
    AssemblerConfig cfg;
    cfg.window_size = 6;
    cfg.h2h_window = 3;
    auto records = assemble_features(store_, cfg);

    for (size_t i = 0; i < records.size(); i += 13) {
        const auto& r = records[i];
        for (uint32_t pid : {r.participant_a, r.participant_b}) {
            const auto& side = pid == r.participant_a ? r.a : r.b;
            auto prior = test_helpers::naive_prior(store_, pid, r.timestamp);
            auto window = test_helpers::last_n(prior, cfg.window_size);

            ASSERT_EQ(side.prior_games, static_cast<int>(prior.size()));
            ASSERT_EQ(side.form.games_played, static_cast<int>(window.size()));
            double scored = 0.0, allowed = 0.0;
            int wins = 0;
            for (const auto& ev : window) {
                scored += score_for(ev, pid);
                allowed += opponent_score_for(ev, pid);
                if (won_by(ev, pid)) ++wins;
            }
            if (!window.empty()) {
                double n = static_cast<double>(window.size());
                EXPECT_FLOAT_EQ(side.form.avg_scored, static_cast<float>(scored / n));
                EXPECT_FLOAT_EQ(side.form.avg_allowed, static_cast<float>(allowed / n));
                EXPECT_FLOAT_EQ(side.form.win_pct, static_cast<float>(wins / n));
            }

            int streak = 0;
            if (!prior.empty()) {
                bool last = won_by(prior.back(), pid);
                for (auto it = prior.rbegin(); it != prior.rend() && won_by(*it, pid) == last; ++it) {
                    streak += last ? 1 : -1;
                }
            }
            EXPECT_EQ(side.streak, streak) << "event " << r.event_id << " pid " << pid;

            int rest = prior.empty()
                           ? NO_PRIOR_EVENT_REST
                           : static_cast<int>((r.timestamp - prior.back().timestamp) /
                                              time_utils::NS_PER_DAY);
            EXPECT_EQ(side.rest_days, rest);

            std::vector<ContestEvent> home_events, away_events;
            for (const auto& ev : prior) {
                (is_home_for(ev, pid) ? home_events : away_events).push_back(ev);
            }
            EXPECT_EQ(side.split.home_games,
                      static_cast<int>(test_helpers::last_n(home_events, cfg.window_size).size()));
            EXPECT_EQ(side.split.away_games,
                      static_cast<int>(test_helpers::last_n(away_events, cfg.window_size).size()));

            for (size_t w = 0; w < ROLLING_WINDOWS.size(); ++w) {
                auto tail = test_helpers::last_n(prior, ROLLING_WINDOWS[w]);
                const auto& rs = side.rolling.windows[w];
                ASSERT_EQ(rs.form.games_played, static_cast<int>(tail.size()));
                if (tail.empty()) continue;
                double n = static_cast<double>(tail.size());
                double sum = 0.0, against = 0.0;
                for (const auto& ev : tail) {
                    sum += score_for(ev, pid);
                    against += opponent_score_for(ev, pid);
                }
                EXPECT_FLOAT_EQ(rs.form.avg_scored, static_cast<float>(sum / n));
                EXPECT_FLOAT_EQ(rs.form.avg_allowed, static_cast<float>(against / n));
                if (tail.size() > 1) {
                    double ss = 0.0;
                    for (const auto& ev : tail) {
                        ss += (score_for(ev, pid) - sum / n) * (score_for(ev, pid) - sum / n);
                    }
                    EXPECT_NEAR(rs.scored_std, std::sqrt(ss / (n - 1.0)), 1e-3)
                        << "event " << r.event_id << " pid " << pid << " window " << ROLLING_WINDOWS[w];
                }
            }

            auto widest = test_helpers::last_n(prior, ROLLING_WINDOWS.back());
            int scoring_streak = 0;
            if (!widest.empty()) {
                double mean = 0.0;
                for (const auto& ev : widest) mean += score_for(ev, pid);
                mean /= static_cast<double>(widest.size());
                bool hot = score_for(widest.back(), pid) > mean;
                for (auto it = widest.rbegin();
                     it != widest.rend() && (score_for(*it, pid) > mean) == hot; ++it) {
                    scoring_streak += hot ? 1 : -1;
                }
            }
            EXPECT_EQ(side.rolling.scoring_streak, scoring_streak)
                << "event " << r.event_id << " pid " << pid;
        }

        std::vector<ContestEvent> meetings;
        for (const auto& ev : test_helpers::naive_prior(store_, r.participant_a, r.timestamp)) {
            if (involves(ev, r.participant_b)) meetings.push_back(ev);
        }
        meetings = test_helpers::last_n(meetings, cfg.h2h_window);
        int wins_a = 0;
        for (const auto& ev : meetings) {
            if (won_by(ev, r.participant_a)) ++wins_a;
        }
        EXPECT_EQ(r.h2h.games, static_cast<int>(meetings.size()));
        EXPECT_EQ(r.h2h.wins_a, wins_a);
        EXPECT_EQ(r.h2h.wins_b, static_cast<int>(meetings.size()) - wins_a);
    }
}

// ===========================================================================
// query_matchup
// ===========================================================================

class QueryMatchupTest : public FeatureAssemblerScenarioTest {};

TEST_F(QueryMatchupTest, AfterLastEventSeesWholeLog) {
    FeatureAssembler assembler(store_);
    auto q = assembler.query_matchup(X, Y, day(7));
    EXPECT_EQ(q.a.prior_games, 3);
    EXPECT_EQ(q.a.streak, 1);
    EXPECT_EQ(q.a.rest_days, 1);
    EXPECT_TRUE(q.a.back_to_back);
    EXPECT_EQ(q.h2h.games, 3);
    EXPECT_EQ(q.h2h.wins_a, 2);
    EXPECT_EQ(q.b.streak, -1);
}

TEST_F(QueryMatchupTest, QueriesDoNotDependOnOrder) {
    FeatureAssembler assembler(store_);
    auto late = assembler.query_matchup(X, Y, day(7));
    auto early = assembler.query_matchup(X, Y, day(2));
    auto late_again = assembler.query_matchup(X, Y, day(7));
    EXPECT_EQ(late.feature_values(), late_again.feature_values());
    EXPECT_EQ(early.a.prior_games, 1);
}

TEST_F(QueryMatchupTest, SameParticipantRejected) {
    FeatureAssembler assembler(store_);
    EXPECT_THROW(assembler.query_matchup(X, X, day(7)), std::invalid_argument);
}

TEST_F(QueryMatchupTest, UnknownParticipantsAreColdStart) {
    FeatureAssembler assembler(store_);
    auto q = assembler.query_matchup(100, 200, day(7), false);
    EXPECT_EQ(q.a.prior_games, 0);
    EXPECT_EQ(q.b.rest_days, NO_PRIOR_EVENT_REST);
    EXPECT_EQ(q.h2h.games, 0);
    EXPECT_FALSE(q.a_is_home);
}
