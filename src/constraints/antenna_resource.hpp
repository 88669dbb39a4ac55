/**
 * @file antenna_resource.hpp
 * @brief One satellite per antenna at a time, with switch time between satellites.
 * @author ConstellationPlanner contributors
 */

#pragma once

#include "constraints/violation.hpp"
#include "resources/ttc_station.hpp"
#include "scheduling/actions.hpp"

#include <map>
#include <span>
#include <vector>

namespace constellation_planner {

/// An uplink or downlink as seen from one antenna.
struct AntennaOccupancy {
    ActionId action_id;
    ActionKind kind = ActionKind::Uplink;
    SatelliteId satellite_id;
    AntennaId antenna_id;
    Timestamp start;
    Timestamp end;
};

using AntennaOccupancyMap = std::map<AntennaId, std::vector<AntennaOccupancy>, std::less<>>;

class AntennaResourceConstraint {
public:
    /**
     * @brief Group actions by antenna. An aggregated downlink contributes
     *        one entry to every antenna it uses.
     */
    [[nodiscard]] static AntennaOccupancyMap group_by_antenna(
        std::span<const UplinkAction> uplinks, std::span<const DownlinkAction> downlinks);

    /// Overlap yields antenna_conflict; otherwise a short gap between different satellites yields antenna_switch_time.
    /// Every pair closer than the switch time is reported, not only neighbours.
    [[nodiscard]] std::vector<ConstraintViolation> check_antenna(
        const Antenna& antenna, std::span<const AntennaOccupancy> occupancy) const;

    /// Antennas missing from @p stations are skipped.
    [[nodiscard]] std::vector<ConstraintViolation> check_schedule(
        std::span<const UplinkAction> uplinks, std::span<const DownlinkAction> downlinks,
        std::span<const TtcStation> stations) const;
};

}  // namespace constellation_planner
