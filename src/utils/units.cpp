/**
 * @file units.cpp
 * @brief Human-readable durations for the status line.
 */

#include "units.hpp"

#include <vector>

/**
 * @brief Converts seconds to human-readable duration string.
 *
 * Formats time duration as combinations of days, hours, minutes, and seconds
 * (e.g., "2d5h", "3h15m", "45s"). Starts from the largest non-zero unit and
 * shows at most maxUnits consecutive units.
 *
 * @param seconds Duration in seconds.
 * @param maxUnits Maximum number of different time units to display.
 * @return Human-readable duration string.
 */
std::string seconds2human(uint64_t seconds, size_t maxUnits) {
    static const std::vector<std::pair<uint64_t, const char*>> units = {
        {86400, "d"},
        {3600, "h"},
        {60, "m"},
        {1, "s"}
    };

    std::string result;
    size_t unitsAdded = 0;

    for (const auto& [size, suffix] : units) {
        if (unitsAdded >= maxUnits) {
            break;
        }
        if (seconds >= size || unitsAdded > 0) { // once started, lower units are shown even if zero
            result += std::to_string(seconds / size) + suffix;
            seconds %= size;
            ++unitsAdded;
        }
    }

    return result.empty() ? "0s" : result;
}
