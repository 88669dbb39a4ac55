/**
 * @file antenna.cpp
 * @brief Antenna availability queries.
 * @author ConstellationPlanner contributors
 */

#include "resources/antenna.hpp"

#include <algorithm>

namespace constellation_planner {

bool Antenna::is_available_at(Timestamp t) const {
    if (!available_windows) return true;
    return std::any_of(available_windows->begin(), available_windows->end(),
                       [t](const TimeWindow& w) { return w.contains(t); });
}

bool Antenna::is_available_during(const TimeWindow& window) const {
    if (!available_windows) return true;
    return std::any_of(available_windows->begin(), available_windows->end(),
                       [&window](const TimeWindow& w) { return w.contains(window); });
}

bool Antenna::supports_frequency(std::string_view band) const {
    return std::find(supported_frequencies.begin(), supported_frequencies.end(), band)
        != supported_frequencies.end();
}

}  // namespace constellation_planner
