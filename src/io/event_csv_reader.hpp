#pragma once

// event_csv_reader.hpp — contest log ingestion from CSV
//
// Expected header (column order free, a_is_home optional, defaults to 1):
//   id,date,participant_a,participant_b,score_a,score_b,a_is_home
// `date` is either YYYY-MM-DD (midnight UTC) or an integer ns timestamp.
// Rows are parsed only; record invariants are enforced by EventStore::build.

#include "data/contest_event.hpp"
#include "time_utils.hpp"

#include <cstdint>
#include <exception>
#include <initializer_list>
#include <fstream>
#include <istream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace event_csv {

namespace detail {

inline std::vector<std::string> split_line(const std::string& line) {
    std::vector<std::string> cols;
    std::istringstream ss(line);
    std::string col;
    while (std::getline(ss, col, ',')) {
        while (!col.empty() && (col.back() == '\r' || col.back() == ' ')) col.pop_back();
        size_t start = col.find_first_not_of(' ');
        cols.push_back(start == std::string::npos ? std::string() : col.substr(start));
    }
    if (!line.empty() && line.back() == ',') cols.emplace_back();
    return cols;
}

inline uint64_t parse_u64(const std::string& s, const std::string& field) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("bad " + field + " '" + s + "'");
    }
    return std::stoull(s);
}

inline uint32_t parse_participant(const std::string& s, const std::string& field) {
    uint64_t v = parse_u64(s, field);
    if (v > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument(field + " " + s + " exceeds 32 bits");
    }
    return static_cast<uint32_t>(v);
}

inline double parse_double(const std::string& s, const std::string& field) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("bad " + field + " '" + s + "'");
    }
    if (used != s.size()) throw std::invalid_argument("bad " + field + " '" + s + "'");
    return v;
}

inline bool parse_bool(const std::string& s) {
    if (s == "1" || s == "true" || s == "TRUE" || s == "True") return true;
    if (s == "0" || s == "false" || s == "FALSE" || s == "False") return false;
    throw std::invalid_argument("bad a_is_home '" + s + "'");
}

inline uint64_t parse_timestamp(const std::string& s) {
    if (s.find('-') != std::string::npos) return time_utils::parse_iso_date_ns(s);
    return parse_u64(s, "date");
}

}  // namespace detail

inline std::vector<ContestEvent> read_events(std::istream& in) {
    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error("Event CSV is empty");
    }

    std::map<std::string, size_t> column;
    auto header = detail::split_line(line);
    for (size_t i = 0; i < header.size(); ++i) column[header[i]] = i;

    for (const char* required :
         {"id", "date", "participant_a", "participant_b", "score_a", "score_b"}) {
        if (column.find(required) == column.end()) {
            throw std::runtime_error(std::string("Event CSV missing column: ") + required);
        }
    }
    bool has_home_flag = column.count("a_is_home") > 0;

    std::vector<ContestEvent> events;
    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;

        auto cols = detail::split_line(line);
        if (cols.size() < header.size()) {
            throw std::runtime_error("Event CSV line " + std::to_string(line_no) + ": expected " +
                                     std::to_string(header.size()) + " columns, got " +
                                     std::to_string(cols.size()));
        }

        try {
            ContestEvent ev;
            ev.id = detail::parse_u64(cols[column["id"]], "id");
            ev.timestamp = detail::parse_timestamp(cols[column["date"]]);
            ev.participant_a = detail::parse_participant(cols[column["participant_a"]], "participant_a");
            ev.participant_b = detail::parse_participant(cols[column["participant_b"]], "participant_b");
            ev.score_a = detail::parse_double(cols[column["score_a"]], "score_a");
            ev.score_b = detail::parse_double(cols[column["score_b"]], "score_b");
            if (has_home_flag) ev.a_is_home = detail::parse_bool(cols[column["a_is_home"]]);
            events.push_back(ev);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("Event CSV line " + std::to_string(line_no) + ": " + e.what());
        } catch (const std::out_of_range&) {
            throw std::runtime_error("Event CSV line " + std::to_string(line_no) +
                                     ": value out of range");
        }
    }
    return events;
}

inline std::vector<ContestEvent> read_events_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open event file: " + path);
    }
    return read_events(in);
}

}  // namespace event_csv
