#pragma once

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// ContestEvent — one timestamped contest between two participants
// ---------------------------------------------------------------------------
struct ContestEvent {
    uint64_t id = 0;
    uint64_t timestamp = 0;      // ns since Unix epoch (UTC)
    uint32_t participant_a = 0;
    uint32_t participant_b = 0;
    double score_a = 0.0;
    double score_b = 0.0;
    bool a_is_home = true;       // role flag: participant_a held the home role
};

// ---------------------------------------------------------------------------
// EventValidationError — a malformed event rejects the whole store
// ---------------------------------------------------------------------------
class EventValidationError : public std::invalid_argument {
public:
    EventValidationError(uint64_t event_id, const std::string& reason)
        : std::invalid_argument("Invalid event " + std::to_string(event_id) + ": " + reason),
          event_id_(event_id) {}

    uint64_t event_id() const { return event_id_; }

private:
    uint64_t event_id_;
};

// Throws EventValidationError if the event breaks a record invariant.
// Ties are rejected: every contest must have exactly one winner.
inline void validate_event(const ContestEvent& ev) {
    if (ev.participant_a == ev.participant_b) {
        throw EventValidationError(ev.id, "participant_a == participant_b (" +
                                              std::to_string(ev.participant_a) + ")");
    }
    if (!std::isfinite(ev.score_a) || !std::isfinite(ev.score_b)) {
        throw EventValidationError(ev.id, "non-finite score");
    }
    if (ev.score_a < 0.0 || ev.score_b < 0.0) {
        throw EventValidationError(ev.id, "negative score");
    }
    if (ev.score_a == ev.score_b) {
        throw EventValidationError(ev.id, "tied score");
    }
}

// ---------------------------------------------------------------------------
// Per-participant views of an event. `pid` must be one of the two sides.
// ---------------------------------------------------------------------------
inline bool involves(const ContestEvent& ev, uint32_t pid) {
    return ev.participant_a == pid || ev.participant_b == pid;
}

inline bool is_side_a(const ContestEvent& ev, uint32_t pid) {
    return ev.participant_a == pid;
}

inline uint32_t opponent_of(const ContestEvent& ev, uint32_t pid) {
    return is_side_a(ev, pid) ? ev.participant_b : ev.participant_a;
}

inline double score_for(const ContestEvent& ev, uint32_t pid) {
    return is_side_a(ev, pid) ? ev.score_a : ev.score_b;
}

inline double opponent_score_for(const ContestEvent& ev, uint32_t pid) {
    return is_side_a(ev, pid) ? ev.score_b : ev.score_a;
}

inline bool won_by(const ContestEvent& ev, uint32_t pid) {
    return score_for(ev, pid) > opponent_score_for(ev, pid);
}

inline bool is_home_for(const ContestEvent& ev, uint32_t pid) {
    return is_side_a(ev, pid) == ev.a_is_home;
}
