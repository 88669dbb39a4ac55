/**
 * @file antenna.hpp
 * @brief Ground antenna: rate, bands, availability and satellite switch time.
 * @author ConstellationPlanner contributors
 *
 * The antenna itself is immutable configuration. Its allocated time slots
 * live in the scheduling ledger (one timeline per antenna).
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace constellation_planner {

struct Antenna {
    AntennaId id;
    std::string name;
    StationId station_id;
    double max_data_rate_mbps = 800.0;
    std::vector<std::string> supported_frequencies{"X"};
    std::optional<std::vector<TimeWindow>> available_windows;   ///< nullopt = always available
    double satellite_switch_time_sec = 5.0;

    [[nodiscard]] bool is_available_at(Timestamp t) const;

    /// True when one availability window covers the whole of @p window.
    [[nodiscard]] bool is_available_during(const TimeWindow& window) const;

    [[nodiscard]] bool supports_frequency(std::string_view band) const;
};

}  // namespace constellation_planner
