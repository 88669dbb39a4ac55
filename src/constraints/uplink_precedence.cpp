/**
 * @file uplink_precedence.cpp
 * @brief UplinkPrecedenceConstraint implementation.
 * @author ConstellationPlanner contributors
 */

#include "constraints/uplink_precedence.hpp"

#include <algorithm>
#include <format>

namespace constellation_planner {

UplinkPrecedenceConstraint::UplinkPrecedenceConstraint(double min_gap_sec)
    : min_gap_sec_(min_gap_sec) {}

std::optional<ConstraintViolation> UplinkPrecedenceConstraint::check_task(
    const ImagingAction& task, std::span<const UplinkAction> uplinks) const {

    bool listed = false;
    const UplinkAction* latest = nullptr;
    for (const auto& u : uplinks) {
        if (u.satellite_id != task.satellite_id || !u.contains_task(task.task_id)) continue;
        listed = true;
        if (u.end < task.start && (!latest || u.end > latest->end)) latest = &u;
    }

    if (!latest) {
        return ConstraintViolation{
            .type = ViolationType::MissingUplink,
            .severity = Severity::Error,
            .message = listed
                ? std::format("task {}: no uplink completes before imaging starts", task.task_id)
                : std::format("task {}: no uplink on {} carries its commands", task.task_id,
                              task.satellite_id),
            .subject = task.task_id,
            .first_action_id = task.id,
        };
    }

    const double gap = seconds_between(latest->end, task.start);
    if (gap < min_gap_sec_) {
        return ConstraintViolation{
            .type = ViolationType::InsufficientUplinkGap,
            .severity = Severity::Warning,
            .message = std::format("task {}: uplink {} ends {:.1f}s before imaging, < {:.1f}s",
                                   task.task_id, latest->id, gap, min_gap_sec_),
            .subject = task.task_id,
            .first_action_id = latest->id,
            .second_action_id = task.id,
            .required_gap_sec = min_gap_sec_,
            .actual_gap_sec = gap,
        };
    }
    return std::nullopt;
}

std::vector<ConstraintViolation> UplinkPrecedenceConstraint::check_all(
    std::span<const ImagingAction> tasks, std::span<const UplinkAction> uplinks) const {
    std::vector<ConstraintViolation> out;
    for (const auto& task : tasks) {
        if (auto v = check_task(task, uplinks)) out.push_back(std::move(*v));
    }
    return out;
}

ImagingBySatellite UplinkPrecedenceConstraint::find_required_uplinks(
    std::span<const ImagingAction> tasks) {
    ImagingBySatellite grouped;
    for (const auto& t : tasks) grouped[t.satellite_id].push_back(t);
    for (auto& [_, group] : grouped) {
        std::stable_sort(group.begin(), group.end(),
            [](const ImagingAction& a, const ImagingAction& b) { return a.start < b.start; });
    }
    return grouped;
}

std::vector<UplinkRequest> UplinkPrecedenceConstraint::build_uplink_requests(
    std::span<const ImagingAction> tasks, double lead_hours) const {
    std::vector<UplinkRequest> requests;
    for (const auto& [satellite_id, group] : find_required_uplinks(tasks)) {
        if (group.empty()) continue;
        const Timestamp first_start = group.front().start;

        UplinkRequest request{
            .satellite_id = satellite_id,
            .task_ids = {},
            .earliest = add_seconds(first_start, -lead_hours * 3600.0),
            .latest = add_seconds(first_start, -min_gap_sec_),
            .priority = 1,
        };
        for (const auto& t : group) request.task_ids.push_back(t.task_id);
        requests.push_back(std::move(request));
    }
    return requests;
}

}  // namespace constellation_planner
