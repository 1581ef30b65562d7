#pragma once

#include "index/participant_index.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <stdexcept>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// PairKey — unordered participant pair, stored as (min id, max id)
// ---------------------------------------------------------------------------
struct PairKey {
    uint32_t lo = 0;
    uint32_t hi = 0;

    bool operator==(const PairKey& other) const { return lo == other.lo && hi == other.hi; }
};

inline PairKey make_pair_key(uint32_t a, uint32_t b) {
    return a < b ? PairKey{a, b} : PairKey{b, a};
}

struct PairKeyHash {
    size_t operator()(const PairKey& key) const {
        uint64_t packed = (static_cast<uint64_t>(key.lo) << 32) | key.hi;
        return std::hash<uint64_t>{}(packed);
    }
};

// ---------------------------------------------------------------------------
// PairIndex — head-to-head history per unordered pair
//
// Derived from a ParticipantIndex: each participant's chronological history
// contributes the events whose opponent has a higher id, so every event
// lands in exactly one bucket and each bucket stays chronological.
// ---------------------------------------------------------------------------
class PairIndex {
public:
    PairIndex() = default;

    static PairIndex build(const ParticipantIndex& participants) {
        const EventStore& store = participants.store();
        PairIndex index;
        index.store_ = &store;

        for (uint32_t pid : store.participants()) {
            for (const auto& ref : participants.history(pid)) {
                const auto& ev = store.at(ref.position);
                uint32_t opp = opponent_of(ev, pid);
                if (opp < pid) continue;
                index.by_pair_[PairKey{pid, opp}].push_back(ref);
            }
        }
        return index;
    }
    static PairIndex build(ParticipantIndex&&) = delete;

    std::span<const EventRef> events_before(uint32_t a, uint32_t b, uint64_t cutoff,
                                            size_t max_count) const {
        auto refs = history(a, b);
        return detail::trailing(refs, detail::lower_bound_cutoff(refs, cutoff), max_count);
    }

    std::span<const EventRef> history(uint32_t a, uint32_t b) const {
        auto it = by_pair_.find(make_pair_key(a, b));
        if (it == by_pair_.end()) return {};
        return std::span<const EventRef>(it->second.data(), it->second.size());
    }

    const EventStore& store() const {
        if (store_ == nullptr) {
            throw std::logic_error("PairIndex used before build()");
        }
        return *store_;
    }

    size_t pair_count() const { return by_pair_.size(); }

private:
    const EventStore* store_ = nullptr;
    std::unordered_map<PairKey, std::vector<EventRef>, PairKeyHash> by_pair_;
};
