/**
 * @file resource_ledger.hpp
 * @brief Per-antenna slot timelines shared by every scheduler.
 * @author ConstellationPlanner contributors
 *
 * The antenna slot lists are the only shared mutable state of a planning
 * session. Each AntennaTimeline guards its own list; a check and the
 * following append happen under one exclusive lock, so two callers can
 * never both observe "free" and collide. Multi-antenna commits lock the
 * involved timelines in ascending antenna-id order.
 *
 * The set of timelines is fixed at construction; only slot lists change.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "resources/antenna.hpp"
#include "resources/ttc_station.hpp"

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string_view>
#include <vector>

namespace constellation_planner {

struct ScheduleSlot {
    Timestamp start;
    Timestamp end;
    ActionId action_id;
    ActionKind kind = ActionKind::Downlink;
    SatelliteId satellite_id;

    [[nodiscard]] TimeWindow interval() const noexcept { return {start, end}; }
};

struct SlotRequest {
    AntennaId antenna_id;
    ScheduleSlot slot;
};

/// Maps a provisional action id to the id stored in the ledger.
using ActionIdResolver = std::function<ActionId(std::string_view provisional_id)>;

/**
 * @brief Can @p satellite_id occupy @p window on @p antenna next to @p slots?
 *
 * Rejects when the antenna is unavailable, when the window intersects any
 * slot, or when a slot serving a different satellite ends less than the
 * switch time before the window starts (or starts less than the switch
 * time after it ends).
 */
[[nodiscard]] Result<void> check_slot_against(const Antenna& antenna,
                                              std::span<const ScheduleSlot> slots,
                                              const TimeWindow& window,
                                              std::string_view satellite_id);

class AntennaTimeline {
public:
    explicit AntennaTimeline(Antenna antenna);

    [[nodiscard]] const Antenna& antenna() const noexcept { return antenna_; }

    [[nodiscard]] Result<void> check(const TimeWindow& window, std::string_view satellite_id) const;

    /// Check and insert as one atomic step; slots stay sorted by start.
    Result<void> reserve(ScheduleSlot slot);

    /// As reserve(), with the id drawn from @p resolve only once the check passed.
    Result<ActionId> reserve(ScheduleSlot slot, const ActionIdResolver& resolve);

    [[nodiscard]] std::vector<ScheduleSlot> slots() const;
    void clear();

    /// Busy time over the span from first start to last end; 0 when empty.
    [[nodiscard]] double utilization() const;

private:
    friend class ResourceLedger;

    void insert_locked(ScheduleSlot slot);

    Antenna antenna_;
    mutable std::shared_mutex mutex_;
    std::vector<ScheduleSlot> slots_;
};

class ResourceLedger {
public:
    explicit ResourceLedger(std::span<const TtcStation> stations);

    [[nodiscard]] const Antenna* find_antenna(std::string_view antenna_id) const;
    [[nodiscard]] std::vector<AntennaId> antenna_ids() const;

    /**
     * @brief Conflict check against committed slots plus not-yet-committed
     *        @p pending requests on the same antenna.
     */
    [[nodiscard]] Result<void> check(std::string_view antenna_id, const TimeWindow& window,
                                     std::string_view satellite_id,
                                     std::span<const SlotRequest> pending = {}) const;

    Result<void> reserve(std::string_view antenna_id, ScheduleSlot slot);
    Result<ActionId> reserve(std::string_view antenna_id, ScheduleSlot slot,
                             const ActionIdResolver& resolve);

    /**
     * @brief All-or-nothing commit of several slots (possibly on several antennas).
     *
     * When @p resolve is set it is called once per request, in request
     * order, after every check has passed and before anything is inserted;
     * the returned ids are stored and written back into @p requests. A
     * failed commit never calls it.
     */
    Result<void> reserve_all(std::span<SlotRequest> requests, const ActionIdResolver& resolve = {});

    [[nodiscard]] std::vector<ScheduleSlot> slots(std::string_view antenna_id) const;
    [[nodiscard]] double utilization(std::string_view antenna_id) const;

    void clear();

private:
    [[nodiscard]] AntennaTimeline* timeline(std::string_view antenna_id) const;

    std::map<AntennaId, std::unique_ptr<AntennaTimeline>, std::less<>> timelines_;
};

}  // namespace constellation_planner
