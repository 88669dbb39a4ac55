/**
 * @file provider.hpp
 * @brief Visibility provider interface: target access and station contact windows.
 * @author ConstellationPlanner contributors
 *
 * Orbit propagation lives outside this project. A provider answers two
 * questions over a time range given as ISO-8601 text with an explicit UTC
 * offset, and returns an error result for malformed or empty ranges.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "resources/satellite_type.hpp"
#include "resources/ttc_station.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace constellation_planner {

/// A satellite can image a target during @p window.
struct VisibilityWindow {
    std::string id;
    SatelliteId satellite_id;
    TargetId target_id;
    TimeWindow window;
    double off_nadir_deg = 0.0;
    double elevation_deg = 90.0;
};

/// A satellite is above a station's elevation mask during @p window.
struct GroundStationWindow {
    std::string id;
    SatelliteId satellite_id;
    StationId station_id;
    TimeWindow window;
    double max_data_rate_mbps = 0.0;
};

class IVisibilityProvider {
public:
    virtual ~IVisibilityProvider() = default;

    virtual Result<std::vector<VisibilityWindow>> compute_access(
        const Satellite& satellite, double latitude_deg, double longitude_deg,
        std::string_view start_iso, std::string_view end_iso) = 0;

    virtual Result<std::vector<GroundStationWindow>> compute_ground_station_access(
        const Satellite& satellite, const TtcStation& station,
        std::string_view start_iso, std::string_view end_iso) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief One AccessWindow per antenna of @p station for a contact window.
 *
 * Each antenna's rate is capped by the antenna's own maximum.
 */
[[nodiscard]] std::vector<AccessWindow> expand_to_antennas(const GroundStationWindow& contact,
                                                           const TtcStation& station);

/// Parsed [start, end) range; errors when either bound is malformed or end <= start.
[[nodiscard]] Result<TimeWindow> parse_time_range(std::string_view start_iso,
                                                  std::string_view end_iso);

}  // namespace constellation_planner
