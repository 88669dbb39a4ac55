/**
 * @file advanced_downlink.cpp
 * @brief Aggregated, segmented and hybrid downlink planning.
 * @author ConstellationPlanner contributors
 *
 * Segment capacity at rate R over a usable span u is R·u / 8192 GB; the
 * action occupies [start, start + transfer + overhead], where start is the
 * window start pushed past the previous segment and any pending slot of
 * the same satellite.
 */

#include "scheduling/advanced_downlink.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <map>
#include <optional>

namespace constellation_planner {

namespace {

constexpr std::string_view kPendingId = "pending";

/// Provisional ids look like "SDL#3"; the prefix names the final id series.
std::string provisional_id(std::string_view prefix, size_t index) {
    return std::format("{}#{}", prefix, index);
}

std::string_view id_prefix(std::string_view provisional) {
    return provisional.substr(0, provisional.find('#'));
}

struct BusySpan {
    TimeWindow span;
    StationId station_id;
};

std::vector<AccessWindow> sorted_by_start(std::span<const AccessWindow> windows) {
    std::vector<AccessWindow> sorted(windows.begin(), windows.end());
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const AccessWindow& a, const AccessWindow& b) { return a.window.start < b.window.start; });
    return sorted;
}

}  // anonymous namespace

AdvancedDownlinkPlanner::AdvancedDownlinkPlanner(TtcScheduler& scheduler, DownlinkConfig config,
                                                 Logger* logger, TransitionConfig transition)
    : scheduler_(scheduler), config_(config), transition_(transition), logger_(logger) {}

ActionId AdvancedDownlinkPlanner::next_action_id(std::string_view prefix) {
    return std::format("{}_{:04d}", prefix, ++action_counter_);
}

std::string AdvancedDownlinkPlanner::next_plan_id() {
    return std::format("PLAN_{:04d}", ++plan_counter_);
}

void AdvancedDownlinkPlanner::clear_schedule() {
    action_counter_ = 0;
    plan_counter_ = 0;
}

double AdvancedDownlinkPlanner::segment_overhead(const SatelliteTypeConfig* satellite_type) const noexcept {
    return satellite_type ? satellite_type->segment_overhead_sec
                          : config_.default_segment_overhead_sec;
}

double AdvancedDownlinkPlanner::downlink_switch(const SatelliteTypeConfig* satellite_type) const noexcept {
    return satellite_type ? satellite_type->downlink_switch_time_sec
                          : transition_.downlink_switch_sec;
}

// ─────────────────────────────────────────────
// Drafting (read-only against the ledger)
// ─────────────────────────────────────────────

Result<AdvancedDownlinkPlanner::AggregationDraft> AdvancedDownlinkPlanner::draft_aggregation(
    const SatelliteId& satellite_id, double volume_gb, const StationId& station_id,
    const TimeWindow& window, bool allow_partial, std::span<const SlotRequest> pending) const {

    const auto* station = scheduler_.find_station(station_id);
    if (!station) return Error{"unknown station " + station_id};

    const double window_sec = window.duration_sec();
    if (window_sec <= 0.0) return Error{"empty window at " + station_id};

    std::vector<const Antenna*> free;
    for (const auto& antenna : station->antennas) {
        if (scheduler_.ledger().check(antenna.id, window, satellite_id, pending)) {
            free.push_back(&antenna);
        }
    }
    if (free.empty()) return Error{"no free antenna at " + station_id};

    std::stable_sort(free.begin(), free.end(), [](const Antenna* a, const Antenna* b) {
        return a->max_data_rate_mbps > b->max_data_rate_mbps;
    });

    AggregationDraft draft{.station_id = station_id, .antenna_ids = {}, .slot = {},
                           .rate_mbps = 0.0, .volume_gb = volume_gb};
    const auto limit = static_cast<size_t>(std::max(config_.max_antennas, 1));
    for (size_t i = 0; i < free.size() && i < limit; ++i) {
        draft.antenna_ids.push_back(free[i]->id);
        draft.rate_mbps += free[i]->max_data_rate_mbps;
        if (transfer_seconds(volume_gb, draft.rate_mbps) <= window_sec) break;
    }

    double needed = transfer_seconds(volume_gb, draft.rate_mbps);
    if (needed > window_sec) {
        if (!allow_partial) {
            return Error{std::format("aggregated rate {:.0f} Mbps over {} antennas cannot move "
                                     "{:.3f} GB within {:.1f}s at {}",
                                     draft.rate_mbps, draft.antenna_ids.size(), volume_gb,
                                     window_sec, station_id)};
        }
        draft.volume_gb = transfer_volume_gb(draft.rate_mbps, window_sec);
        needed = window_sec;
    }
    draft.slot = TimeWindow{window.start, add_seconds(window.start, needed)};
    return draft;
}

Result<std::vector<AdvancedDownlinkPlanner::SegmentDraft>> AdvancedDownlinkPlanner::draft_segments(
    const SatelliteId& satellite_id, double volume_gb, std::span<const AccessWindow> windows,
    double overhead_sec, double switch_sec, double offset_gb,
    std::span<const SlotRequest> pending) const {

    // Slots already promised to this satellite that no segment may run into.
    std::vector<BusySpan> busy;
    for (const auto& req : pending) {
        if (req.slot.satellite_id != satellite_id) continue;
        const auto* antenna = scheduler_.ledger().find_antenna(req.antenna_id);
        busy.push_back(BusySpan{req.slot.interval(), antenna ? antenna->station_id : StationId{}});
    }
    std::sort(busy.begin(), busy.end(),
        [](const BusySpan& a, const BusySpan& b) { return a.span.start < b.span.start; });

    auto gap_between = [switch_sec](const StationId& a, const StationId& b) {
        return a == b ? 0.0 : switch_sec;
    };

    std::vector<SlotRequest> staged(pending.begin(), pending.end());
    std::vector<SegmentDraft> drafts;
    double remaining = volume_gb;
    double offset = offset_gb;
    const auto max_segments = static_cast<size_t>(std::max(config_.max_segments, 1));

    for (const auto& w : sorted_by_start(windows)) {
        if (remaining <= kVolumeToleranceGb || drafts.size() >= max_segments) break;

        const auto* station = scheduler_.find_station(w.station_id);
        const Antenna* antenna = station ? station->find_antenna(w.antenna_id) : nullptr;
        if (!antenna) continue;

        const double overhead = drafts.empty() ? 0.0 : overhead_sec;
        const double rate = std::min(w.rate_mbps, antenna->max_data_rate_mbps);
        if (rate <= 0.0) continue;

        Timestamp start = w.window.start;
        Timestamp limit = w.window.end;
        if (!drafts.empty()) {
            const auto& prev = drafts.back();
            start = std::max(start, add_seconds(prev.slot.end,
                                                gap_between(prev.window.station_id, w.station_id)));
        }
        for (const auto& b : busy) {
            const double gap = gap_between(b.station_id, w.station_id);
            if (start >= add_seconds(b.span.end, gap)) continue;
            if (add_seconds(b.span.start, -gap) >= start) {
                limit = std::min(limit, add_seconds(b.span.start, -gap));
            } else {
                start = add_seconds(b.span.end, gap);
            }
        }

        const double usable = seconds_between(start, limit) - overhead;
        if (usable <= 0.0) continue;

        const double volume = std::min(remaining, transfer_volume_gb(rate, usable));
        const double transfer = transfer_seconds(volume, rate);
        const TimeWindow slot{start, add_seconds(start, transfer + overhead)};

        if (!scheduler_.ledger().check(w.antenna_id, slot, satellite_id, staged)) continue;

        drafts.push_back(SegmentDraft{.window = w, .slot = slot, .rate_mbps = rate,
                                      .volume_gb = volume, .offset_gb = offset,
                                      .overhead_sec = overhead});
        staged.push_back(SlotRequest{w.antenna_id, ScheduleSlot{
            .start = slot.start, .end = slot.end, .action_id = std::string{kPendingId},
            .kind = ActionKind::Downlink, .satellite_id = satellite_id}});

        remaining -= volume;
        offset += volume;
    }

    if (drafts.empty()) {
        return Error{std::format("no usable downlink window for {:.3f} GB", volume_gb)};
    }
    if (remaining > kVolumeToleranceGb) {
        return Error{std::format("windows exhausted after {} segments, {:.3f} GB of {:.3f} GB "
                                 "unassigned", drafts.size(), remaining, volume_gb)};
    }
    return drafts;
}

// ─────────────────────────────────────────────
// Materialization and commit
// ─────────────────────────────────────────────

DownlinkAction AdvancedDownlinkPlanner::materialize(const SatelliteId& satellite_id,
                                                    const AggregationDraft& draft,
                                                    std::vector<SlotRequest>& requests) const {
    DownlinkAction action{
        .id = provisional_id("ADL", requests.size()),
        .satellite_id = satellite_id,
        .station_id = draft.station_id,
        .antenna_id = draft.antenna_ids.front(),
        .antenna_ids = draft.antenna_ids,
        .start = draft.slot.start,
        .end = draft.slot.end,
        .duration_sec = draft.slot.duration_sec(),
        .data_volume_gb = draft.volume_gb,
        .data_rate_mbps = draft.rate_mbps,
        .aggregated = true,
    };
    for (const auto& antenna_id : draft.antenna_ids) {
        requests.push_back(SlotRequest{antenna_id, ScheduleSlot{
            .start = action.start, .end = action.end, .action_id = action.id,
            .kind = ActionKind::Downlink, .satellite_id = satellite_id}});
    }
    return action;
}

std::vector<DownlinkAction> AdvancedDownlinkPlanner::materialize(
    const SatelliteId& satellite_id, const TaskId& task_id,
    const std::vector<SegmentDraft>& drafts, std::vector<SlotRequest>& requests) const {

    std::vector<DownlinkAction> actions;
    const int total = static_cast<int>(drafts.size());
    for (int i = 0; i < total; ++i) {
        const auto& d = drafts[static_cast<size_t>(i)];
        DownlinkAction action{
            .id = provisional_id("SDL", requests.size()),
            .satellite_id = satellite_id,
            .station_id = d.window.station_id,
            .antenna_id = d.window.antenna_id,
            .antenna_ids = {d.window.antenna_id},
            .start = d.slot.start,
            .end = d.slot.end,
            .duration_sec = d.slot.duration_sec(),
            .data_volume_gb = d.volume_gb,
            .data_rate_mbps = d.rate_mbps,
            .aggregated = false,
            .segment = DownlinkSegment{
                .segment_id = std::format("{}_SEG{:02d}", task_id, i + 1),
                .parent_task_id = task_id,
                .sequence_number = i + 1,
                .total_segments = total,
                .data_volume_gb = d.volume_gb,
                .data_offset_gb = d.offset_gb,
            },
            .segment_overhead_sec = d.overhead_sec,
        };
        requests.push_back(SlotRequest{d.window.antenna_id, ScheduleSlot{
            .start = action.start, .end = action.end, .action_id = action.id,
            .kind = ActionKind::Downlink, .satellite_id = satellite_id}});
        actions.push_back(std::move(action));
    }
    return actions;
}

Result<void> AdvancedDownlinkPlanner::commit(std::vector<SlotRequest>& requests,
                                             std::vector<DownlinkAction>& actions) {
    std::map<std::string, ActionId, std::less<>> assigned;
    auto resolve = [&](std::string_view provisional) {
        auto it = assigned.find(provisional);
        if (it == assigned.end()) {
            it = assigned.emplace(std::string{provisional},
                                  next_action_id(id_prefix(provisional))).first;
        }
        return it->second;
    };
    if (auto ok = scheduler_.ledger().reserve_all(requests, resolve); !ok) return ok;

    for (auto& action : actions) action.id = assigned.at(action.id);
    return {};
}

// ─────────────────────────────────────────────
// Public strategies
// ─────────────────────────────────────────────

Result<DownlinkAction> AdvancedDownlinkPlanner::schedule_aggregated_downlink(
    const SatelliteId& satellite_id, double volume_gb, const StationId& station_id,
    const TimeWindow& window, const SatelliteTypeConfig* satellite_type) {

    if (volume_gb <= 0.0) return Error{"Downlink volume must be positive"};
    if (satellite_type && !satellite_type->multi_antenna_capable) {
        return Error{"Satellite type " + satellite_type->id +
                     " does not support multi-antenna aggregation"};
    }

    auto draft = draft_aggregation(satellite_id, volume_gb, station_id, window, false, {});
    if (!draft) return draft.error().with_context("Aggregated downlink for " + satellite_id);

    std::vector<SlotRequest> requests;
    std::vector<DownlinkAction> actions;
    actions.push_back(materialize(satellite_id, *draft, requests));
    if (auto ok = commit(requests, actions); !ok) {
        return ok.error().with_context("Aggregated downlink for " + satellite_id);
    }
    DownlinkAction action = std::move(actions.front());

    if (logger_) {
        logger_->log(LogLevel::Debug, "downlink", std::format(
            "{} sat={} station={} antennas={} rate={:.0f}Mbps volume={:.3f}GB",
            action.id, satellite_id, station_id, action.antenna_ids.size(),
            action.data_rate_mbps, action.data_volume_gb));
    }
    return action;
}

Result<DownlinkPlan> AdvancedDownlinkPlanner::plan_segmented_downlink(
    const SatelliteId& satellite_id, const TaskId& task_id, double volume_gb,
    std::span<const AccessWindow> windows, const SatelliteTypeConfig* satellite_type) {

    if (volume_gb <= 0.0) return Error{"Downlink volume must be positive"};
    if (satellite_type && !satellite_type->segmented_downlink_capable) {
        return Error{"Satellite type " + satellite_type->id +
                     " does not support segmented downlink"};
    }

    auto drafts = draft_segments(satellite_id, volume_gb, windows, segment_overhead(satellite_type),
                                 downlink_switch(satellite_type), 0.0, {});
    if (!drafts) return drafts.error().with_context("Segmented downlink for " + task_id);

    std::vector<SlotRequest> requests;
    auto actions = materialize(satellite_id, task_id, *drafts, requests);
    if (auto ok = commit(requests, actions); !ok) {
        return ok.error().with_context("Segmented downlink for " + task_id);
    }

    DownlinkPlan plan{
        .plan_id = next_plan_id(),
        .satellite_id = satellite_id,
        .task_id = task_id,
        .total_data_gb = volume_gb,
        .actions = std::move(actions),
        .segmented = true,
        .aggregated = false,
    };

    if (logger_) {
        logger_->log(LogLevel::Debug, "downlink", std::format(
            "{} task={} segments={} volume={:.3f}GB", plan.plan_id, task_id,
            plan.actions.size(), plan.completed_gb()));
    }
    return plan;
}

Result<DownlinkPlan> AdvancedDownlinkPlanner::plan_hybrid_downlink(
    const SatelliteId& satellite_id, const TaskId& task_id, double volume_gb,
    std::span<const AccessWindow> windows, const SatelliteTypeConfig* satellite_type) {

    if (volume_gb <= 0.0) return Error{"Downlink volume must be positive"};
    if (windows.empty()) return Error{"No downlink windows for task " + task_id};

    const bool can_aggregate = !satellite_type || satellite_type->multi_antenna_capable;
    const bool can_segment = !satellite_type || satellite_type->segmented_downlink_capable;
    const double overhead = segment_overhead(satellite_type);
    const double switch_sec = downlink_switch(satellite_type);
    std::vector<std::string> reasons;

    auto make_plan = [&](std::vector<DownlinkAction> actions, bool aggregated, bool segmented) {
        return DownlinkPlan{
            .plan_id = next_plan_id(),
            .satellite_id = satellite_id,
            .task_id = task_id,
            .total_data_gb = volume_gb,
            .actions = std::move(actions),
            .segmented = segmented,
            .aggregated = aggregated,
        };
    };

    if (config_.prefer_aggregation && can_aggregate) {
        // Stations in order of first appearance, each with its earliest window.
        std::vector<const AccessWindow*> earliest;
        for (const auto& w : windows) {
            auto it = std::find_if(earliest.begin(), earliest.end(),
                [&w](const AccessWindow* e) { return e->station_id == w.station_id; });
            if (it == earliest.end()) {
                earliest.push_back(&w);
            } else if (w.window.start < (*it)->window.start) {
                *it = &w;
            }
        }

        for (const auto* w : earliest) {
            auto draft = draft_aggregation(satellite_id, volume_gb, w->station_id, w->window,
                                           false, {});
            if (!draft) {
                reasons.push_back(draft.error().message);
                continue;
            }
            std::vector<SlotRequest> requests;
            std::vector<DownlinkAction> actions;
            actions.push_back(materialize(satellite_id, *draft, requests));
            if (auto ok = commit(requests, actions); !ok) {
                reasons.push_back(ok.error().message);
                continue;
            }
            return make_plan(std::move(actions), true, false);
        }

        if (can_segment) {
            std::optional<AggregationDraft> best;
            const AccessWindow* best_window = nullptr;
            for (const auto& w : windows) {
                auto draft = draft_aggregation(satellite_id, volume_gb, w.station_id, w.window,
                                               true, {});
                if (draft && (!best || draft->volume_gb > best->volume_gb)) {
                    best = *draft;
                    best_window = &w;
                }
            }

            if (best && best->volume_gb > kVolumeToleranceGb) {
                std::vector<AccessWindow> unused;
                for (const auto& w : windows) {
                    if (w.station_id == best_window->station_id && w.window == best_window->window) {
                        continue;
                    }
                    unused.push_back(w);
                }

                std::vector<SlotRequest> pending;
                for (const auto& antenna_id : best->antenna_ids) {
                    pending.push_back(SlotRequest{antenna_id, ScheduleSlot{
                        .start = best->slot.start, .end = best->slot.end,
                        .action_id = std::string{kPendingId},
                        .kind = ActionKind::Downlink, .satellite_id = satellite_id}});
                }

                auto drafts = draft_segments(satellite_id, volume_gb - best->volume_gb, unused,
                                             overhead, switch_sec, best->volume_gb, pending);
                if (drafts) {
                    std::vector<SlotRequest> requests;
                    std::vector<DownlinkAction> actions;
                    actions.push_back(materialize(satellite_id, *best, requests));
                    auto segments = materialize(satellite_id, task_id, *drafts, requests);
                    std::move(segments.begin(), segments.end(), std::back_inserter(actions));
                    if (auto ok = commit(requests, actions); ok) {
                        return make_plan(std::move(actions), true, true);
                    } else {
                        reasons.push_back(ok.error().message);
                    }
                } else {
                    reasons.push_back(drafts.error().message);
                }
            }
        }
    }

    if (can_segment) {
        auto plan = plan_segmented_downlink(satellite_id, task_id, volume_gb, windows,
                                            satellite_type);
        if (plan) return plan;
        reasons.push_back(plan.error().message);
    }

    auto single = scheduler_.schedule_downlink(satellite_id, volume_gb, windows);
    if (single) {
        std::vector<DownlinkAction> actions;
        actions.push_back(std::move(single).value());
        return make_plan(std::move(actions), false, false);
    }
    reasons.push_back(single.error().message);

    std::string message = "No downlink strategy moves " + std::format("{:.3f}", volume_gb) +
                          " GB for task " + task_id;
    for (const auto& r : reasons) message += "; " + r;
    if (logger_) logger_->log(LogLevel::Warn, "downlink", message);
    return Error{std::move(message)};
}

}  // namespace constellation_planner
