/**
 * @file actions.hpp
 * @brief Scheduled action records: imaging, uplink, downlink, downlink plans.
 * @author ConstellationPlanner contributors
 *
 * Actions are write-once results. Ids follow "UL_0001", "DL_0001",
 * "ADL_0001" (aggregated), "SDL_0001" (segmented) and "PLAN_0001".
 */

#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace constellation_planner {

struct ImagingAction {
    ActionId id;
    SatelliteId satellite_id;
    TargetId target_id;
    TaskId task_id;
    Timestamp start;
    Timestamp end;
    double extension_rate = 0.0;

    [[nodiscard]] TimeWindow interval() const noexcept { return {start, end}; }
};

struct UplinkRequest {
    SatelliteId satellite_id;
    std::vector<TaskId> task_ids;
    Timestamp earliest;   ///< Uplink may not start before this
    Timestamp latest;     ///< Uplink must be complete by this
    int priority = 1;
};

struct UplinkAction {
    ActionId id;
    SatelliteId satellite_id;
    StationId station_id;
    AntennaId antenna_id;
    Timestamp start;
    Timestamp end;
    double duration_sec = 0.0;
    std::vector<TaskId> task_ids;

    [[nodiscard]] TimeWindow interval() const noexcept { return {start, end}; }

    [[nodiscard]] bool contains_task(const TaskId& task_id) const {
        return std::find(task_ids.begin(), task_ids.end(), task_id) != task_ids.end();
    }
};

struct DownlinkSegment {
    std::string segment_id;       ///< "<task>_SEG01"
    TaskId parent_task_id;
    int sequence_number = 1;      ///< 1-based
    int total_segments = 0;       ///< Filled once allocation completes
    double data_volume_gb = 0.0;
    double data_offset_gb = 0.0;

    [[nodiscard]] bool is_first() const noexcept { return sequence_number == 1; }
    [[nodiscard]] bool is_last() const noexcept { return sequence_number == total_segments; }
};

struct DownlinkAction {
    ActionId id;
    SatelliteId satellite_id;
    StationId station_id;
    AntennaId antenna_id;                  ///< Primary antenna
    std::vector<AntennaId> antenna_ids;    ///< All antennas carrying the transfer
    Timestamp start;
    Timestamp end;
    double duration_sec = 0.0;
    double data_volume_gb = 0.0;
    double data_rate_mbps = 0.0;           ///< Achieved (aggregate) rate
    bool aggregated = false;
    std::optional<DownlinkSegment> segment;
    double segment_overhead_sec = 0.0;

    [[nodiscard]] TimeWindow interval() const noexcept { return {start, end}; }
    [[nodiscard]] size_t antenna_count() const noexcept {
        return antenna_ids.empty() ? 1 : antenna_ids.size();
    }
};

struct DownlinkPlan {
    std::string plan_id;
    SatelliteId satellite_id;
    TaskId task_id;
    double total_data_gb = 0.0;
    std::vector<DownlinkAction> actions;
    bool segmented = false;
    bool aggregated = false;

    [[nodiscard]] double completed_gb() const noexcept {
        double sum = 0.0;
        for (const auto& a : actions) sum += a.data_volume_gb;
        return sum;
    }

    [[nodiscard]] double total_duration_sec() const noexcept {
        double sum = 0.0;
        for (const auto& a : actions) sum += a.duration_sec;
        return sum;
    }

    [[nodiscard]] bool is_complete() const noexcept {
        return !actions.empty() && completed_gb() >= total_data_gb - kVolumeToleranceGb;
    }

    [[nodiscard]] std::optional<Timestamp> earliest_start() const {
        if (actions.empty()) return std::nullopt;
        return std::min_element(actions.begin(), actions.end(),
            [](const auto& a, const auto& b) { return a.start < b.start; })->start;
    }

    [[nodiscard]] std::optional<Timestamp> latest_end() const {
        if (actions.empty()) return std::nullopt;
        return std::max_element(actions.begin(), actions.end(),
            [](const auto& a, const auto& b) { return a.end < b.end; })->end;
    }
};

}  // namespace constellation_planner
