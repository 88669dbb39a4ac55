/**
 * @file resource_ledger.cpp
 * @brief Slot conflict checks and per-antenna reservation.
 * @author ConstellationPlanner contributors
 */

#include "scheduling/resource_ledger.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <set>

namespace constellation_planner {

Result<void> check_slot_against(const Antenna& antenna,
                                std::span<const ScheduleSlot> slots,
                                const TimeWindow& window,
                                std::string_view satellite_id) {
    if (!antenna.is_available_during(window)) {
        return Error{"antenna " + antenna.id + " unavailable during the requested interval"};
    }

    const auto switch_time = Seconds{antenna.satellite_switch_time_sec};
    for (const auto& slot : slots) {
        if (window.overlaps(slot.interval())) {
            return Error{"overlaps action " + slot.action_id + " on " + antenna.id};
        }
        if (slot.satellite_id == satellite_id) continue;

        // New window after the slot: needs slot.end + switch ≤ start.
        if (window.start >= slot.end && window.start - slot.end < switch_time) {
            return Error{std::format("satellite switch after {} on {}: gap {:.1f}s < {:.1f}s",
                                     slot.action_id, antenna.id,
                                     seconds_between(slot.end, window.start),
                                     antenna.satellite_switch_time_sec)};
        }
        // New window before the slot: needs end + switch ≤ slot.start.
        if (window.end <= slot.start && slot.start - window.end < switch_time) {
            return Error{std::format("satellite switch before {} on {}: gap {:.1f}s < {:.1f}s",
                                     slot.action_id, antenna.id,
                                     seconds_between(window.end, slot.start),
                                     antenna.satellite_switch_time_sec)};
        }
    }
    return {};
}

// ─────────────────────────────────────────────
// AntennaTimeline
// ─────────────────────────────────────────────

AntennaTimeline::AntennaTimeline(Antenna antenna) : antenna_(std::move(antenna)) {}

Result<void> AntennaTimeline::check(const TimeWindow& window, std::string_view satellite_id) const {
    std::shared_lock lock(mutex_);
    return check_slot_against(antenna_, slots_, window, satellite_id);
}

Result<void> AntennaTimeline::reserve(ScheduleSlot slot) {
    std::unique_lock lock(mutex_);
    if (auto ok = check_slot_against(antenna_, slots_, slot.interval(), slot.satellite_id); !ok) {
        return ok;
    }
    insert_locked(std::move(slot));
    return {};
}

Result<ActionId> AntennaTimeline::reserve(ScheduleSlot slot, const ActionIdResolver& resolve) {
    std::unique_lock lock(mutex_);
    if (auto ok = check_slot_against(antenna_, slots_, slot.interval(), slot.satellite_id); !ok) {
        return ok.error();
    }
    if (resolve) slot.action_id = resolve(slot.action_id);
    ActionId id = slot.action_id;
    insert_locked(std::move(slot));
    return id;
}

void AntennaTimeline::insert_locked(ScheduleSlot slot) {
    auto pos = std::upper_bound(slots_.begin(), slots_.end(), slot.start,
        [](Timestamp t, const ScheduleSlot& s) { return t < s.start; });
    slots_.insert(pos, std::move(slot));
}

std::vector<ScheduleSlot> AntennaTimeline::slots() const {
    std::shared_lock lock(mutex_);
    return slots_;
}

void AntennaTimeline::clear() {
    std::unique_lock lock(mutex_);
    slots_.clear();
}

double AntennaTimeline::utilization() const {
    std::shared_lock lock(mutex_);
    if (slots_.empty()) return 0.0;

    double busy = 0.0;
    Timestamp first = slots_.front().start;
    Timestamp last = slots_.front().end;
    for (const auto& s : slots_) {
        busy += seconds_between(s.start, s.end);
        first = std::min(first, s.start);
        last = std::max(last, s.end);
    }
    const double span = seconds_between(first, last);
    return span > 0.0 ? busy / span : 0.0;
}

// ─────────────────────────────────────────────
// ResourceLedger
// ─────────────────────────────────────────────

ResourceLedger::ResourceLedger(std::span<const TtcStation> stations) {
    for (const auto& station : stations) {
        for (const auto& antenna : station.antennas) {
            timelines_.emplace(antenna.id, std::make_unique<AntennaTimeline>(antenna));
        }
    }
}

AntennaTimeline* ResourceLedger::timeline(std::string_view antenna_id) const {
    auto it = timelines_.find(antenna_id);
    return it != timelines_.end() ? it->second.get() : nullptr;
}

const Antenna* ResourceLedger::find_antenna(std::string_view antenna_id) const {
    const auto* tl = timeline(antenna_id);
    return tl ? &tl->antenna() : nullptr;
}

std::vector<AntennaId> ResourceLedger::antenna_ids() const {
    std::vector<AntennaId> ids;
    ids.reserve(timelines_.size());
    for (const auto& [id, _] : timelines_) ids.push_back(id);
    return ids;
}

Result<void> ResourceLedger::check(std::string_view antenna_id, const TimeWindow& window,
                                   std::string_view satellite_id,
                                   std::span<const SlotRequest> pending) const {
    const auto* tl = timeline(antenna_id);
    if (!tl) return Error{"unknown antenna " + std::string{antenna_id}};

    std::shared_lock lock(tl->mutex_);
    if (pending.empty()) {
        return check_slot_against(tl->antenna_, tl->slots_, window, satellite_id);
    }

    std::vector<ScheduleSlot> combined = tl->slots_;
    for (const auto& req : pending) {
        if (req.antenna_id == antenna_id) combined.push_back(req.slot);
    }
    return check_slot_against(tl->antenna_, combined, window, satellite_id);
}

Result<void> ResourceLedger::reserve(std::string_view antenna_id, ScheduleSlot slot) {
    auto* tl = timeline(antenna_id);
    if (!tl) return Error{"unknown antenna " + std::string{antenna_id}};
    return tl->reserve(std::move(slot));
}

Result<ActionId> ResourceLedger::reserve(std::string_view antenna_id, ScheduleSlot slot,
                                         const ActionIdResolver& resolve) {
    auto* tl = timeline(antenna_id);
    if (!tl) return Error{"unknown antenna " + std::string{antenna_id}};
    return tl->reserve(std::move(slot), resolve);
}

Result<void> ResourceLedger::reserve_all(std::span<SlotRequest> requests,
                                         const ActionIdResolver& resolve) {
    std::set<std::string_view> involved;
    for (const auto& req : requests) {
        if (!timeline(req.antenna_id)) return Error{"unknown antenna " + req.antenna_id};
        involved.insert(req.antenna_id);
    }

    // Ascending id order keeps concurrent multi-antenna commits deadlock-free.
    std::vector<std::unique_lock<std::shared_mutex>> locks;
    locks.reserve(involved.size());
    for (auto id : involved) {
        locks.emplace_back(timeline(id)->mutex_);
    }

    std::map<std::string_view, std::vector<ScheduleSlot>> staged;
    for (const auto& req : requests) {
        const auto* tl = timeline(req.antenna_id);
        auto& extra = staged[req.antenna_id];
        std::vector<ScheduleSlot> combined = tl->slots_;
        combined.insert(combined.end(), extra.begin(), extra.end());
        if (auto ok = check_slot_against(tl->antenna_, combined, req.slot.interval(),
                                         req.slot.satellite_id); !ok) {
            return ok;
        }
        extra.push_back(req.slot);
    }

    for (auto& req : requests) {
        if (resolve) req.slot.action_id = resolve(req.slot.action_id);
        timeline(req.antenna_id)->insert_locked(req.slot);
    }
    return {};
}

std::vector<ScheduleSlot> ResourceLedger::slots(std::string_view antenna_id) const {
    const auto* tl = timeline(antenna_id);
    return tl ? tl->slots() : std::vector<ScheduleSlot>{};
}

double ResourceLedger::utilization(std::string_view antenna_id) const {
    const auto* tl = timeline(antenna_id);
    return tl ? tl->utilization() : 0.0;
}

void ResourceLedger::clear() {
    for (auto& [_, tl] : timelines_) tl->clear();
}

}  // namespace constellation_planner
