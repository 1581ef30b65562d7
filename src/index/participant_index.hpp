#pragma once

#include "data/event_store.hpp"
#include "worker_group.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// EventRef — positional reference into an EventStore
// ---------------------------------------------------------------------------
struct EventRef {
    uint64_t event_id = 0;
    uint32_t position = 0;
    uint64_t timestamp = 0;
};

namespace detail {

// Index one past the last ref with timestamp < cutoff.
inline size_t lower_bound_cutoff(std::span<const EventRef> refs, uint64_t cutoff) {
    auto it = std::lower_bound(refs.begin(), refs.end(), cutoff,
                               [](const EventRef& ref, uint64_t ts) { return ref.timestamp < ts; });
    return static_cast<size_t>(it - refs.begin());
}

// Trailing window of refs[0, end) holding at most max_count entries.
inline std::span<const EventRef> trailing(std::span<const EventRef> refs, size_t end,
                                          size_t max_count) {
    size_t begin = end > max_count ? end - max_count : 0;
    return refs.subspan(begin, end - begin);
}

}  // namespace detail

// ---------------------------------------------------------------------------
// ParticipantIndex — per-participant chronological event history
//
// Built once from an EventStore, then frozen. The store must outlive the
// index. Concurrent readers need no locking.
// ---------------------------------------------------------------------------
class ParticipantIndex {
public:
    ParticipantIndex() = default;

    // Single pass over the sorted store. With num_threads > 1, worker w owns
    // every participant with pid % num_threads == w; buckets are disjoint and
    // each is filled in store order, so the result equals the serial build.
    static ParticipantIndex build(const EventStore& store, int num_threads = 1) {
        if (num_threads < 1) {
            throw std::invalid_argument("ParticipantIndex::build requires num_threads >= 1");
        }
        ParticipantIndex index;
        index.store_ = &store;

        if (num_threads == 1 || store.size() < 2) {
            fill_partition(store, 0, 1, index.by_participant_);
            return index;
        }

        std::vector<Buckets> partials(static_cast<size_t>(num_threads));
        {
            WorkerGroup workers(partials.size());
            for (int w = 0; w < num_threads; ++w) {
                workers.spawn([&store, &partials, w, num_threads]() {
                    fill_partition(store, static_cast<uint32_t>(w),
                                   static_cast<uint32_t>(num_threads), partials[w]);
                });
            }
        }

        for (auto& part : partials) {
            for (auto& [pid, hist] : part) {
                index.by_participant_.emplace(pid, std::move(hist));
            }
        }
        return index;
    }

    // The index keeps a pointer into the store; a temporary would dangle.
    static ParticipantIndex build(EventStore&&, int = 1) = delete;

    // Up to the last max_count events of pid with timestamp < cutoff,
    // oldest first. Unknown participant -> empty.
    std::span<const EventRef> events_before(uint32_t pid, uint64_t cutoff,
                                            size_t max_count) const {
        auto refs = history(pid);
        return detail::trailing(refs, detail::lower_bound_cutoff(refs, cutoff), max_count);
    }

    // Same contract, restricted to events where pid held (home) or did not
    // hold (!home) the home role.
    std::span<const EventRef> role_events_before(uint32_t pid, bool home, uint64_t cutoff,
                                                 size_t max_count) const {
        auto refs = role_history(pid, home);
        return detail::trailing(refs, detail::lower_bound_cutoff(refs, cutoff), max_count);
    }

    size_t count_before(uint32_t pid, uint64_t cutoff) const {
        return detail::lower_bound_cutoff(history(pid), cutoff);
    }

    std::span<const EventRef> history(uint32_t pid) const {
        auto it = by_participant_.find(pid);
        if (it == by_participant_.end()) return {};
        return as_span(it->second.all);
    }

    std::span<const EventRef> role_history(uint32_t pid, bool home) const {
        auto it = by_participant_.find(pid);
        if (it == by_participant_.end()) return {};
        return as_span(home ? it->second.home : it->second.away);
    }

    const EventStore& store() const {
        if (store_ == nullptr) {
            throw std::logic_error("ParticipantIndex used before build()");
        }
        return *store_;
    }

    size_t participant_count() const { return by_participant_.size(); }

private:
    struct History {
        std::vector<EventRef> all;
        std::vector<EventRef> home;
        std::vector<EventRef> away;
    };
    using Buckets = std::unordered_map<uint32_t, History>;

    const EventStore* store_ = nullptr;
    Buckets by_participant_;

    static void fill_partition(const EventStore& store, uint32_t part, uint32_t num_parts,
                               Buckets& out) {
        auto events = store.sorted_events();
        for (size_t i = 0; i < events.size(); ++i) {
            const auto& ev = events[i];
            EventRef ref{ev.id, static_cast<uint32_t>(i), ev.timestamp};
            for (uint32_t pid : {ev.participant_a, ev.participant_b}) {
                if (pid % num_parts != part) continue;
                auto& hist = out[pid];
                hist.all.push_back(ref);
                (is_home_for(ev, pid) ? hist.home : hist.away).push_back(ref);
            }
        }
    }

    static std::span<const EventRef> as_span(const std::vector<EventRef>& refs) {
        return std::span<const EventRef>(refs.data(), refs.size());
    }
};

// ---------------------------------------------------------------------------
// HistoryCursor — monotonic per-participant pointer over a ParticipantIndex
//
// When the cutoffs queried for a participant never decrease, each query
// advances the stored position and costs amortized O(1). A decreasing cutoff
// re-seeks by binary search; results are identical either way.
// ---------------------------------------------------------------------------
class HistoryCursor {
public:
    explicit HistoryCursor(const ParticipantIndex& index) : index_(&index) {}
    explicit HistoryCursor(ParticipantIndex&&) = delete;

    // Number of pid's events with timestamp < cutoff.
    size_t end_before(uint32_t pid, uint64_t cutoff) {
        auto refs = index_->history(pid);
        if (refs.empty()) return 0;

        auto it = state_.find(pid);
        if (it == state_.end()) {
            size_t end = detail::lower_bound_cutoff(refs, cutoff);
            state_.emplace(pid, State{end, cutoff});
            return end;
        }

        State& st = it->second;
        if (cutoff < st.last_cutoff) {
            ++fallback_seeks_;
            st.end = detail::lower_bound_cutoff(refs, cutoff);
        } else {
            while (st.end < refs.size() && refs[st.end].timestamp < cutoff) ++st.end;
        }
        st.last_cutoff = cutoff;
        return st.end;
    }

    std::span<const EventRef> events_before(uint32_t pid, uint64_t cutoff, size_t max_count) {
        size_t end = end_before(pid, cutoff);
        return detail::trailing(index_->history(pid), end, max_count);
    }

    const ParticipantIndex& index() const { return *index_; }

    // Queries that went backwards in time and fell back to binary search.
    size_t fallback_seeks() const { return fallback_seeks_; }

private:
    struct State {
        size_t end = 0;
        uint64_t last_cutoff = 0;
    };

    const ParticipantIndex* index_;
    std::unordered_map<uint32_t, State> state_;
    size_t fallback_seeks_ = 0;
};
