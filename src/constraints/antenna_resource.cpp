/**
 * @file antenna_resource.cpp
 * @brief AntennaResourceConstraint implementation.
 * @author ConstellationPlanner contributors
 */

#include "constraints/antenna_resource.hpp"

#include <algorithm>
#include <format>

namespace constellation_planner {

AntennaOccupancyMap AntennaResourceConstraint::group_by_antenna(
    std::span<const UplinkAction> uplinks, std::span<const DownlinkAction> downlinks) {
    AntennaOccupancyMap grouped;

    for (const auto& u : uplinks) {
        grouped[u.antenna_id].push_back(AntennaOccupancy{
            u.id, ActionKind::Uplink, u.satellite_id, u.antenna_id, u.start, u.end});
    }
    for (const auto& d : downlinks) {
        if (d.antenna_ids.empty()) {
            grouped[d.antenna_id].push_back(AntennaOccupancy{
                d.id, ActionKind::Downlink, d.satellite_id, d.antenna_id, d.start, d.end});
            continue;
        }
        for (const auto& antenna_id : d.antenna_ids) {
            grouped[antenna_id].push_back(AntennaOccupancy{
                d.id, ActionKind::Downlink, d.satellite_id, antenna_id, d.start, d.end});
        }
    }
    return grouped;
}

std::vector<ConstraintViolation> AntennaResourceConstraint::check_antenna(
    const Antenna& antenna, std::span<const AntennaOccupancy> occupancy) const {
    std::vector<ConstraintViolation> out;
    if (occupancy.size() < 2) return out;

    std::vector<AntennaOccupancy> sorted(occupancy.begin(), occupancy.end());
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const AntennaOccupancy& a, const AntennaOccupancy& b) { return a.start < b.start; });

    // Each slot is compared with every later one that starts before its end
    // plus the switch time; a long slot can clash with several of them.
    for (size_t i = 0; i < sorted.size(); ++i) {
        const auto& prev = sorted[i];
        const Timestamp horizon = add_seconds(prev.end, antenna.satellite_switch_time_sec);

        for (size_t j = i + 1; j < sorted.size() && sorted[j].start < horizon; ++j) {
            const auto& curr = sorted[j];

            if (TimeWindow{prev.start, prev.end}.overlaps(TimeWindow{curr.start, curr.end})) {
                out.push_back(ConstraintViolation{
                    .type = ViolationType::AntennaConflict,
                    .severity = Severity::Error,
                    .message = std::format("antenna {}: {} overlaps {}", antenna.id,
                                           prev.action_id, curr.action_id),
                    .subject = antenna.id,
                    .first_action_id = prev.action_id,
                    .second_action_id = curr.action_id,
                });
                continue;
            }

            if (prev.satellite_id == curr.satellite_id) continue;
            const double gap = seconds_between(prev.end, curr.start);
            if (gap < antenna.satellite_switch_time_sec) {
                out.push_back(ConstraintViolation{
                    .type = ViolationType::AntennaSwitchTime,
                    .severity = Severity::Error,
                    .message = std::format("antenna {}: satellite switch {:.1f}s < {:.1f}s between {} and {}",
                                           antenna.id, gap, antenna.satellite_switch_time_sec,
                                           prev.action_id, curr.action_id),
                    .subject = antenna.id,
                    .first_action_id = prev.action_id,
                    .second_action_id = curr.action_id,
                    .required_gap_sec = antenna.satellite_switch_time_sec,
                    .actual_gap_sec = gap,
                });
            }
        }
    }
    return out;
}

std::vector<ConstraintViolation> AntennaResourceConstraint::check_schedule(
    std::span<const UplinkAction> uplinks, std::span<const DownlinkAction> downlinks,
    std::span<const TtcStation> stations) const {
    std::vector<ConstraintViolation> out;

    for (const auto& [antenna_id, occupancy] : group_by_antenna(uplinks, downlinks)) {
        const Antenna* antenna = nullptr;
        for (const auto& station : stations) {
            antenna = station.find_antenna(antenna_id);
            if (antenna) break;
        }
        if (!antenna) continue;

        auto found = check_antenna(*antenna, occupancy);
        out.insert(out.end(), found.begin(), found.end());
    }
    return out;
}

}  // namespace constellation_planner
