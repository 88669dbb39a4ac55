/**
 * @file advanced_downlink.hpp
 * @brief Multi-antenna aggregation and segmented downlink planning.
 * @author ConstellationPlanner contributors
 *
 * Both strategies work on the TtcScheduler's ledger, so their slots
 * conflict-check against ordinary uplinks and downlinks. Every plan is
 * drafted first against a read-only view of the ledger and then committed
 * with one all-or-nothing reservation; a failed request leaves the ledger
 * untouched. Action and plan ids are drawn only by a successful commit.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "resources/satellite_type.hpp"
#include "scheduling/actions.hpp"
#include "scheduling/resource_ledger.hpp"
#include "scheduling/ttc_scheduler.hpp"

#include <atomic>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace constellation_planner {

class AdvancedDownlinkPlanner {
public:
    AdvancedDownlinkPlanner(TtcScheduler& scheduler, DownlinkConfig config, Logger* logger = nullptr,
                            TransitionConfig transition = {});

    /**
     * @brief One transfer over several antennas of one station in parallel.
     *
     * Free antennas are taken by descending rate, up to max_antennas, until
     * the summed rate moves @p volume_gb inside @p window. A null
     * @p satellite_type is treated as capable.
     */
    Result<DownlinkAction> schedule_aggregated_downlink(const SatelliteId& satellite_id,
                                                        double volume_gb,
                                                        const StationId& station_id,
                                                        const TimeWindow& window,
                                                        const SatelliteTypeConfig* satellite_type = nullptr);

    /**
     * @brief Spread @p volume_gb over chronologically ordered windows.
     *
     * Every segment after the first pays the per-segment overhead. A
     * segment starts no earlier than the previous one ends, plus the
     * satellite's downlink switch time when the station changes; windows
     * with no room left after that are skipped. Fails with the unassigned
     * remainder when the windows (or max_segments) run out.
     */
    Result<DownlinkPlan> plan_segmented_downlink(const SatelliteId& satellite_id,
                                                 const TaskId& task_id,
                                                 double volume_gb,
                                                 std::span<const AccessWindow> windows,
                                                 const SatelliteTypeConfig* satellite_type = nullptr);

    /**
     * @brief Aggregation first, segmentation for the rest.
     *
     * With prefer_aggregation and a capable satellite, each station's
     * earliest window is tried for the whole volume. Otherwise the
     * best-capacity aggregated window takes what it can and segments over
     * the remaining windows carry the rest; both parts commit together.
     * A satellite with neither capability gets a single-antenna downlink.
     */
    Result<DownlinkPlan> plan_hybrid_downlink(const SatelliteId& satellite_id,
                                              const TaskId& task_id,
                                              double volume_gb,
                                              std::span<const AccessWindow> windows,
                                              const SatelliteTypeConfig* satellite_type = nullptr);

    /// Restart plan and action numbering. Slots belong to the scheduler's ledger.
    void clear_schedule();

    [[nodiscard]] const DownlinkConfig& config() const noexcept { return config_; }

private:
    struct AggregationDraft {
        StationId station_id;
        std::vector<AntennaId> antenna_ids;
        TimeWindow slot;
        double rate_mbps = 0.0;
        double volume_gb = 0.0;
    };

    struct SegmentDraft {
        AccessWindow window;
        TimeWindow slot;
        double rate_mbps = 0.0;
        double volume_gb = 0.0;
        double offset_gb = 0.0;
        double overhead_sec = 0.0;
    };

    [[nodiscard]] Result<AggregationDraft> draft_aggregation(const SatelliteId& satellite_id,
                                                             double volume_gb,
                                                             const StationId& station_id,
                                                             const TimeWindow& window,
                                                             bool allow_partial,
                                                             std::span<const SlotRequest> pending) const;

    [[nodiscard]] Result<std::vector<SegmentDraft>> draft_segments(const SatelliteId& satellite_id,
                                                                   double volume_gb,
                                                                   std::span<const AccessWindow> windows,
                                                                   double overhead_sec,
                                                                   double switch_sec,
                                                                   double offset_gb,
                                                                   std::span<const SlotRequest> pending) const;

    // Actions carry provisional ids until commit() resolves them.
    DownlinkAction materialize(const SatelliteId& satellite_id, const AggregationDraft& draft,
                               std::vector<SlotRequest>& requests) const;
    std::vector<DownlinkAction> materialize(const SatelliteId& satellite_id, const TaskId& task_id,
                                            const std::vector<SegmentDraft>& drafts,
                                            std::vector<SlotRequest>& requests) const;

    /// Reserve every request at once and give the actions their final ids.
    Result<void> commit(std::vector<SlotRequest>& requests, std::vector<DownlinkAction>& actions);

    [[nodiscard]] double segment_overhead(const SatelliteTypeConfig* satellite_type) const noexcept;
    [[nodiscard]] double downlink_switch(const SatelliteTypeConfig* satellite_type) const noexcept;

    ActionId next_action_id(std::string_view prefix);
    std::string next_plan_id();

    TtcScheduler& scheduler_;
    DownlinkConfig config_;
    TransitionConfig transition_;
    Logger* logger_;

    std::atomic<uint32_t> action_counter_{0};
    std::atomic<uint32_t> plan_counter_{0};
};

}  // namespace constellation_planner
