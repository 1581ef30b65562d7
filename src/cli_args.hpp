#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// cli namespace — checked numeric flag values for the command-line tools
// ---------------------------------------------------------------------------
namespace cli {

// Whole decimal integer >= min_value. Signs are parsed before range checks so
// "-1" is rejected rather than wrapped to a huge unsigned value.
inline long long parse_count(const std::string& text, const std::string& flag,
                             long long min_value) {
    size_t pos = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + text + "'");
    }
    if (pos != text.size()) {
        throw std::invalid_argument(flag + " expects an integer, got '" + text + "'");
    }
    if (value < min_value) {
        throw std::invalid_argument(flag + " must be >= " + std::to_string(min_value) +
                                    ", got " + text);
    }
    return value;
}

}  // namespace cli
