/**
 * @file ttc_scheduler.cpp
 * @brief TtcScheduler implementation.
 * @author ConstellationPlanner contributors
 */

#include "scheduling/ttc_scheduler.hpp"

#include <algorithm>
#include <format>

namespace constellation_planner {

namespace {

std::string join_reasons(const std::vector<std::string>& reasons) {
    if (reasons.empty()) return "no candidate windows";
    std::string out;
    for (const auto& r : reasons) {
        if (!out.empty()) out += "; ";
        out += r;
    }
    return out;
}

std::string candidate_label(const AccessWindow& w) {
    return w.station_id + "/" + w.antenna_id;
}

}  // anonymous namespace

TtcScheduler::TtcScheduler(std::vector<TtcStation> stations, Logger* logger)
    : stations_(std::move(stations)), ledger_(stations_), logger_(logger) {}

ActionId TtcScheduler::next_action_id(std::string_view prefix) {
    return std::format("{}_{:04d}", prefix, ++action_counter_);
}

const TtcStation* TtcScheduler::find_station(std::string_view station_id) const {
    auto it = std::find_if(stations_.begin(), stations_.end(),
                           [station_id](const TtcStation& s) { return s.id == station_id; });
    return it != stations_.end() ? &*it : nullptr;
}

Result<UplinkAction> TtcScheduler::schedule_uplink(const UplinkRequest& request,
                                                   std::span<const AccessWindow> windows) {
    std::vector<std::string> rejected;

    for (const auto& w : windows) {
        const auto* station = find_station(w.station_id);
        if (!station) {
            rejected.push_back(candidate_label(w) + ": unknown station");
            continue;
        }
        if (!station->find_antenna(w.antenna_id)) {
            rejected.push_back(candidate_label(w) + ": unknown antenna");
            continue;
        }

        const double duration = station->uplink_duration_sec(request.task_ids.size());
        const Timestamp start = std::max(w.window.start, request.earliest);
        const Timestamp end = add_seconds(start, duration);

        if (end > w.window.end) {
            rejected.push_back(candidate_label(w) + ": uplink does not fit the window");
            continue;
        }
        if (end > request.latest) {
            rejected.push_back(candidate_label(w) + ": uplink would end after the deadline");
            continue;
        }

        const TimeWindow slot_window{start, end};
        if (auto ok = ledger_.check(w.antenna_id, slot_window, request.satellite_id); !ok) {
            rejected.push_back(candidate_label(w) + ": " + ok.error().message);
            continue;
        }

        auto reserved = ledger_.reserve(w.antenna_id, ScheduleSlot{
                .start = start, .end = end, .action_id = "UL",
                .kind = ActionKind::Uplink, .satellite_id = request.satellite_id},
            [this](std::string_view prefix) { return next_action_id(prefix); });
        if (!reserved) {
            rejected.push_back(candidate_label(w) + ": " + reserved.error().message);
            continue;
        }
        ActionId id = std::move(reserved).value();

        UplinkAction action{
            .id = std::move(id),
            .satellite_id = request.satellite_id,
            .station_id = w.station_id,
            .antenna_id = w.antenna_id,
            .start = start,
            .end = end,
            .duration_sec = duration,
            .task_ids = request.task_ids,
        };
        {
            std::lock_guard lock(records_mutex_);
            uplinks_.push_back(action);
        }
        if (logger_) {
            logger_->log(LogLevel::Debug, "ttc_scheduler", std::format(
                "uplink {} sat={} on {} ({} tasks)", action.id, action.satellite_id,
                candidate_label(w), action.task_ids.size()));
        }
        return action;
    }

    auto message = "No feasible uplink window for " + request.satellite_id + ": " +
                   join_reasons(rejected);
    if (logger_) logger_->log(LogLevel::Warn, "ttc_scheduler", message);
    return Error{std::move(message)};
}

Result<DownlinkAction> TtcScheduler::schedule_downlink(const SatelliteId& satellite_id,
                                                       double volume_gb,
                                                       std::span<const AccessWindow> windows,
                                                       std::optional<Timestamp> earliest) {
    if (volume_gb <= 0.0) {
        return Error{"Downlink volume must be positive"};
    }

    std::vector<std::string> rejected;

    for (const auto& w : windows) {
        const auto* station = find_station(w.station_id);
        const Antenna* antenna = station ? station->find_antenna(w.antenna_id) : nullptr;
        if (!antenna) {
            rejected.push_back(candidate_label(w) + ": unknown station or antenna");
            continue;
        }

        const double rate = std::min(w.rate_mbps, antenna->max_data_rate_mbps);
        if (rate <= 0.0) {
            rejected.push_back(candidate_label(w) + ": no usable rate");
            continue;
        }

        const double duration = transfer_seconds(volume_gb, rate);
        Timestamp start = w.window.start;
        if (earliest && *earliest > start) start = *earliest;
        const Timestamp end = add_seconds(start, duration);

        if (end > w.window.end) {
            rejected.push_back(std::format("{}: {:.2f} GB needs {:.1f}s at {:.0f} Mbps",
                                           candidate_label(w), volume_gb, duration, rate));
            continue;
        }

        const TimeWindow slot_window{start, end};
        if (auto ok = ledger_.check(w.antenna_id, slot_window, satellite_id); !ok) {
            rejected.push_back(candidate_label(w) + ": " + ok.error().message);
            continue;
        }

        auto reserved = ledger_.reserve(w.antenna_id, ScheduleSlot{
                .start = start, .end = end, .action_id = "DL",
                .kind = ActionKind::Downlink, .satellite_id = satellite_id},
            [this](std::string_view prefix) { return next_action_id(prefix); });
        if (!reserved) {
            rejected.push_back(candidate_label(w) + ": " + reserved.error().message);
            continue;
        }
        ActionId id = std::move(reserved).value();

        DownlinkAction action{
            .id = std::move(id),
            .satellite_id = satellite_id,
            .station_id = w.station_id,
            .antenna_id = w.antenna_id,
            .antenna_ids = {w.antenna_id},
            .start = start,
            .end = end,
            .duration_sec = duration,
            .data_volume_gb = volume_gb,
            .data_rate_mbps = rate,
        };
        {
            std::lock_guard lock(records_mutex_);
            downlinks_.push_back(action);
        }
        return action;
    }

    auto message = "No feasible downlink window for " + satellite_id + ": " +
                   join_reasons(rejected);
    if (logger_) logger_->log(LogLevel::Warn, "ttc_scheduler", message);
    return Error{std::move(message)};
}

void TtcScheduler::clear_schedule() {
    ledger_.clear();
    action_counter_ = 0;
    std::lock_guard lock(records_mutex_);
    uplinks_.clear();
    downlinks_.clear();
}

double TtcScheduler::antenna_utilization(std::string_view antenna_id) const {
    return ledger_.utilization(antenna_id);
}

std::vector<UplinkAction> TtcScheduler::scheduled_uplinks() const {
    std::lock_guard lock(records_mutex_);
    return uplinks_;
}

std::vector<DownlinkAction> TtcScheduler::scheduled_downlinks() const {
    std::lock_guard lock(records_mutex_);
    return downlinks_;
}

}  // namespace constellation_planner
