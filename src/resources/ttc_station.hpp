/**
 * @file ttc_station.hpp
 * @brief Telemetry, tracking and command station owning 1..N antennas.
 * @author ConstellationPlanner contributors
 *
 * Uplink (command) and downlink (data) share the station's antennas.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "resources/antenna.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace constellation_planner {

struct TtcStation {
    StationId id;
    std::string name;
    double latitude_deg = 0.0;
    double longitude_deg = 0.0;
    double altitude_m = 0.0;
    std::vector<Antenna> antennas;
    double min_elevation_deg = 5.0;
    double uplink_rate_kbps = 64.0;
    double base_uplink_time_sec = 5.0;
    double per_task_uplink_time_sec = 1.0;
    double inter_antenna_switch_time_sec = 2.0;

    /// base + per_task × task_count
    [[nodiscard]] double uplink_duration_sec(size_t task_count) const noexcept {
        return base_uplink_time_sec + per_task_uplink_time_sec * static_cast<double>(task_count);
    }

    [[nodiscard]] const Antenna* find_antenna(std::string_view antenna_id) const;
    [[nodiscard]] std::vector<const Antenna*> antennas_available_at(Timestamp t) const;
    [[nodiscard]] std::vector<const Antenna*> antennas_available_during(const TimeWindow& window) const;
    [[nodiscard]] std::vector<const Antenna*> antennas_by_frequency(std::string_view band) const;

    /// Highest single-antenna rate, 0 without antennas.
    [[nodiscard]] double max_data_rate_mbps() const noexcept;
};

/**
 * @brief Built-in four-station network (BJGS, KSGS, SYGS, JMSGS).
 */
[[nodiscard]] std::vector<TtcStation> default_ttc_stations();

/**
 * @brief Stations from configuration; an empty list yields default_ttc_stations().
 */
[[nodiscard]] std::vector<TtcStation> ttc_stations_from_config(const std::vector<StationConfig>& configs);

}  // namespace constellation_planner
