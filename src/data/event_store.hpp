#pragma once

#include "data/contest_event.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// ---------------------------------------------------------------------------
// EventStore — validated contest log, sorted by (timestamp, id)
//
// Immutable after build(). Position i is the zero-based rank of an event in
// chronological order and is stable for the lifetime of the store.
// ---------------------------------------------------------------------------
class EventStore {
public:
    EventStore() = default;

    static EventStore build(std::vector<ContestEvent> events) {
        std::unordered_set<uint64_t> seen;
        seen.reserve(events.size());
        for (const auto& ev : events) {
            validate_event(ev);
            if (!seen.insert(ev.id).second) {
                throw EventValidationError(ev.id, "duplicate event id");
            }
        }

        std::sort(events.begin(), events.end(),
                  [](const ContestEvent& lhs, const ContestEvent& rhs) {
                      if (lhs.timestamp != rhs.timestamp) return lhs.timestamp < rhs.timestamp;
                      return lhs.id < rhs.id;
                  });

        EventStore store;
        store.events_ = std::move(events);
        store.position_by_id_.reserve(store.events_.size());
        for (size_t i = 0; i < store.events_.size(); ++i) {
            store.position_by_id_[store.events_[i].id] = static_cast<uint32_t>(i);
        }
        return store;
    }

    std::span<const ContestEvent> sorted_events() const {
        return std::span<const ContestEvent>(events_.data(), events_.size());
    }

    const ContestEvent& at(uint32_t position) const {
        if (position >= events_.size()) {
            throw std::out_of_range("EventStore position " + std::to_string(position) +
                                    " out of range (size " + std::to_string(events_.size()) + ")");
        }
        return events_[position];
    }

    std::optional<uint32_t> position_of(uint64_t event_id) const {
        auto it = position_by_id_.find(event_id);
        if (it == position_by_id_.end()) return std::nullopt;
        return it->second;
    }

    // Sorted unique participant ids.
    std::vector<uint32_t> participants() const {
        std::vector<uint32_t> ids;
        ids.reserve(events_.size() * 2);
        for (const auto& ev : events_) {
            ids.push_back(ev.participant_a);
            ids.push_back(ev.participant_b);
        }
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        return ids;
    }

    size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }

private:
    std::vector<ContestEvent> events_;
    std::unordered_map<uint64_t, uint32_t> position_by_id_;
};
