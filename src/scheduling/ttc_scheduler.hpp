/**
 * @file ttc_scheduler.hpp
 * @brief Uplink/downlink placement onto station antennas.
 * @author ConstellationPlanner contributors
 *
 * Candidates are tried in input order and the first feasible one is
 * committed. A request that fits nowhere returns an error result naming
 * why each candidate was rejected; nothing is reserved in that case.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "resources/ttc_station.hpp"
#include "scheduling/actions.hpp"
#include "scheduling/resource_ledger.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace constellation_planner {

class TtcScheduler {
public:
    explicit TtcScheduler(std::vector<TtcStation> stations, Logger* logger = nullptr);

    /**
     * @brief Place an uplink of the station's command duration.
     *
     * start = max(window start, request.earliest); rejected when the end
     * passes the window end or request.latest, or on an antenna conflict.
     */
    Result<UplinkAction> schedule_uplink(const UplinkRequest& request,
                                         std::span<const AccessWindow> windows);

    /**
     * @brief Place a single-antenna downlink of @p volume_gb.
     *
     * Achieved rate is min(window rate, antenna rate).
     */
    Result<DownlinkAction> schedule_downlink(const SatelliteId& satellite_id,
                                             double volume_gb,
                                             std::span<const AccessWindow> windows,
                                             std::optional<Timestamp> earliest = std::nullopt);

    /// Drop every slot and record and restart id numbering.
    void clear_schedule();

    [[nodiscard]] double antenna_utilization(std::string_view antenna_id) const;

    [[nodiscard]] std::vector<UplinkAction> scheduled_uplinks() const;
    [[nodiscard]] std::vector<DownlinkAction> scheduled_downlinks() const;

    [[nodiscard]] const TtcStation* find_station(std::string_view station_id) const;
    [[nodiscard]] const std::vector<TtcStation>& stations() const noexcept { return stations_; }

    [[nodiscard]] ResourceLedger& ledger() noexcept { return ledger_; }
    [[nodiscard]] const ResourceLedger& ledger() const noexcept { return ledger_; }

private:
    ActionId next_action_id(std::string_view prefix);

    std::vector<TtcStation> stations_;
    ResourceLedger ledger_;
    Logger* logger_;

    std::atomic<uint32_t> action_counter_{0};

    mutable std::mutex records_mutex_;
    std::vector<UplinkAction> uplinks_;
    std::vector<DownlinkAction> downlinks_;
};

}  // namespace constellation_planner
