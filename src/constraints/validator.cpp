/**
 * @file validator.cpp
 * @brief ScheduleValidator implementation.
 * @author ConstellationPlanner contributors
 */

#include "constraints/validator.hpp"

#include <algorithm>
#include <iterator>

namespace constellation_planner {

size_t ValidationReport::error_count() const noexcept {
    return static_cast<size_t>(std::count_if(violations.begin(), violations.end(),
        [](const ConstraintViolation& v) { return v.severity == Severity::Error; }));
}

size_t ValidationReport::warning_count() const noexcept {
    return static_cast<size_t>(std::count_if(violations.begin(), violations.end(),
        [](const ConstraintViolation& v) { return v.severity == Severity::Warning; }));
}

size_t ValidationReport::count(ViolationType type) const noexcept {
    return static_cast<size_t>(std::count_if(violations.begin(), violations.end(),
        [type](const ConstraintViolation& v) { return v.type == type; }));
}

ScheduleValidator::ScheduleValidator(TransitionConfig transition, double min_uplink_gap_sec)
    : transition_(transition), uplink_(min_uplink_gap_sec) {}

ValidationReport ScheduleValidator::validate(const ScheduleSnapshot& schedule) const {
    ValidationReport report;
    auto append = [&report](std::vector<ConstraintViolation> found) {
        std::move(found.begin(), found.end(), std::back_inserter(report.violations));
    };

    append(transition_.check_all(schedule.imaging, schedule.downlinks, schedule.satellite_types));
    append(antenna_.check_schedule(schedule.uplinks, schedule.downlinks, schedule.stations));
    append(uplink_.check_all(schedule.imaging, schedule.uplinks));
    return report;
}

}  // namespace constellation_planner
