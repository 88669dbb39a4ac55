/**
 * @file provider.cpp
 * @brief Shared helpers for visibility providers.
 * @author ConstellationPlanner contributors
 */

#include "visibility/provider.hpp"

#include "core/time.hpp"

#include <algorithm>

namespace constellation_planner {

std::vector<AccessWindow> expand_to_antennas(const GroundStationWindow& contact,
                                             const TtcStation& station) {
    std::vector<AccessWindow> out;
    out.reserve(station.antennas.size());
    for (const auto& antenna : station.antennas) {
        const double rate = contact.max_data_rate_mbps > 0.0
            ? std::min(contact.max_data_rate_mbps, antenna.max_data_rate_mbps)
            : antenna.max_data_rate_mbps;
        out.push_back(AccessWindow{station.id, antenna.id, contact.window, rate});
    }
    return out;
}

Result<TimeWindow> parse_time_range(std::string_view start_iso, std::string_view end_iso) {
    auto start = parse_iso8601(start_iso);
    if (!start) return start.error().with_context("range start");
    auto end = parse_iso8601(end_iso);
    if (!end) return end.error().with_context("range end");
    if (*end <= *start) {
        return Error{"empty time range " + std::string{start_iso} + " .. " + std::string{end_iso}};
    }
    return TimeWindow{*start, *end};
}

}  // namespace constellation_planner
