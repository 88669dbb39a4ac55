/**
 * @file transition.cpp
 * @brief TransitionConstraint implementation.
 * @author ConstellationPlanner contributors
 */

#include "constraints/transition.hpp"

#include <algorithm>
#include <format>
#include <set>

namespace constellation_planner {

namespace {

template <typename Action>
std::vector<const Action*> sorted_by_start(std::span<const Action> actions) {
    std::vector<const Action*> sorted;
    sorted.reserve(actions.size());
    for (const auto& a : actions) sorted.push_back(&a);
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const Action* a, const Action* b) { return a->start < b->start; });
    return sorted;
}

ConstraintViolation gap_violation(ViolationType type, const std::string& subject,
                                  const ActionId& first, const ActionId& second,
                                  double required, double actual) {
    return ConstraintViolation{
        .type = type,
        .severity = Severity::Error,
        .message = std::format("{} gap {:.1f}s < {:.1f}s between {} and {}",
                               to_string(type), actual, required, first, second),
        .subject = subject,
        .first_action_id = first,
        .second_action_id = second,
        .required_gap_sec = required,
        .actual_gap_sec = actual,
    };
}

}  // anonymous namespace

TransitionConstraint::TransitionConstraint(TransitionConfig fallback) : fallback_(fallback) {}

SatelliteTypeConfig TransitionConstraint::profile_for(std::string_view type_id) const {
    return satellite_type_or_default(type_id, fallback_);
}

std::vector<ConstraintViolation> TransitionConstraint::check_imaging_sequence(
    std::span<const ImagingAction> imaging, const SatelliteTypeConfig& type) const {
    std::vector<ConstraintViolation> out;
    if (imaging.size() < 2) return out;

    const auto sorted = sorted_by_start(imaging);
    for (size_t i = 1; i < sorted.size(); ++i) {
        const auto* prev = sorted[i - 1];
        const auto* curr = sorted[i];
        const double gap = seconds_between(prev->end, curr->start);
        if (gap < type.imaging_switch_time_sec) {
            out.push_back(gap_violation(ViolationType::ImagingSwitch, curr->satellite_id,
                                        prev->id, curr->id, type.imaging_switch_time_sec, gap));
        }
    }
    return out;
}

std::vector<ConstraintViolation> TransitionConstraint::check_downlink_sequence(
    std::span<const DownlinkAction> downlinks, const SatelliteTypeConfig& type) const {
    std::vector<ConstraintViolation> out;
    if (downlinks.size() < 2) return out;

    const auto sorted = sorted_by_start(downlinks);
    for (size_t i = 1; i < sorted.size(); ++i) {
        const auto* prev = sorted[i - 1];
        const auto* curr = sorted[i];
        if (prev->station_id == curr->station_id) continue;
        const double gap = seconds_between(prev->end, curr->start);
        if (gap < type.downlink_switch_time_sec) {
            out.push_back(gap_violation(ViolationType::DownlinkSwitch, curr->satellite_id,
                                        prev->id, curr->id, type.downlink_switch_time_sec, gap));
        }
    }
    return out;
}

std::vector<ConstraintViolation> TransitionConstraint::check_imaging_to_downlink(
    std::span<const ImagingAction> imaging, std::span<const DownlinkAction> downlinks,
    const SatelliteTypeConfig& type) const {
    std::vector<ConstraintViolation> out;
    if (imaging.empty() || downlinks.empty()) return out;

    struct Entry {
        Timestamp start;
        Timestamp end;
        const ActionId* id;
        const SatelliteId* satellite_id;
        bool is_imaging;
    };

    std::vector<Entry> timeline;
    timeline.reserve(imaging.size() + downlinks.size());
    for (const auto& a : imaging) timeline.push_back({a.start, a.end, &a.id, &a.satellite_id, true});
    for (const auto& d : downlinks) timeline.push_back({d.start, d.end, &d.id, &d.satellite_id, false});
    std::stable_sort(timeline.begin(), timeline.end(),
        [](const Entry& a, const Entry& b) { return a.start < b.start; });

    for (size_t i = 1; i < timeline.size(); ++i) {
        const auto& prev = timeline[i - 1];
        const auto& curr = timeline[i];
        if (!prev.is_imaging || curr.is_imaging) continue;
        const double gap = seconds_between(prev.end, curr.start);
        if (gap < type.imaging_to_downlink_time_sec) {
            out.push_back(gap_violation(ViolationType::ImagingToDownlink, *curr.satellite_id,
                                        *prev.id, *curr.id, type.imaging_to_downlink_time_sec,
                                        gap));
        }
    }
    return out;
}

std::vector<ConstraintViolation> TransitionConstraint::check_satellite(
    std::span<const ImagingAction> imaging, std::span<const DownlinkAction> downlinks,
    const SatelliteTypeConfig& type) const {
    auto out = check_imaging_sequence(imaging, type);
    auto more = check_downlink_sequence(downlinks, type);
    out.insert(out.end(), more.begin(), more.end());
    more = check_imaging_to_downlink(imaging, downlinks, type);
    out.insert(out.end(), more.begin(), more.end());
    return out;
}

std::vector<ConstraintViolation> TransitionConstraint::check_all(
    std::span<const ImagingAction> imaging, std::span<const DownlinkAction> downlinks,
    const SatelliteTypeMap& satellite_types) const {

    std::map<SatelliteId, std::vector<ImagingAction>> imaging_by_sat;
    std::map<SatelliteId, std::vector<DownlinkAction>> downlinks_by_sat;
    std::set<SatelliteId> satellites;
    for (const auto& a : imaging) {
        imaging_by_sat[a.satellite_id].push_back(a);
        satellites.insert(a.satellite_id);
    }
    for (const auto& d : downlinks) {
        downlinks_by_sat[d.satellite_id].push_back(d);
        satellites.insert(d.satellite_id);
    }

    std::vector<ConstraintViolation> out;
    for (const auto& sat : satellites) {
        auto type_it = satellite_types.find(sat);
        const auto profile = profile_for(type_it != satellite_types.end() ? type_it->second
                                                                           : std::string{});
        auto found = check_satellite(imaging_by_sat[sat], downlinks_by_sat[sat], profile);
        out.insert(out.end(), found.begin(), found.end());
    }
    return out;
}

}  // namespace constellation_planner
