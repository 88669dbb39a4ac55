/**
 * @file validator.hpp
 * @brief Runs every constraint checker over a finished schedule.
 * @author ConstellationPlanner contributors
 */

#pragma once

#include "constraints/antenna_resource.hpp"
#include "constraints/transition.hpp"
#include "constraints/uplink_precedence.hpp"
#include "constraints/violation.hpp"
#include "core/config.hpp"
#include "resources/ttc_station.hpp"
#include "scheduling/actions.hpp"

#include <vector>

namespace constellation_planner {

/// Everything the validator looks at; plain values, no references into the scheduler.
struct ScheduleSnapshot {
    std::vector<ImagingAction> imaging;
    std::vector<UplinkAction> uplinks;
    std::vector<DownlinkAction> downlinks;
    std::vector<TtcStation> stations;
    SatelliteTypeMap satellite_types;
};

struct ValidationReport {
    std::vector<ConstraintViolation> violations;

    [[nodiscard]] bool feasible() const noexcept { return is_feasible(violations); }
    [[nodiscard]] size_t error_count() const noexcept;
    [[nodiscard]] size_t warning_count() const noexcept;
    [[nodiscard]] size_t count(ViolationType type) const noexcept;
};

class ScheduleValidator {
public:
    ScheduleValidator(TransitionConfig transition, double min_uplink_gap_sec);

    /// Transition, antenna and uplink-precedence violations, in that order.
    [[nodiscard]] ValidationReport validate(const ScheduleSnapshot& schedule) const;

    [[nodiscard]] const TransitionConstraint& transition() const noexcept { return transition_; }
    [[nodiscard]] const AntennaResourceConstraint& antenna() const noexcept { return antenna_; }
    [[nodiscard]] const UplinkPrecedenceConstraint& uplink() const noexcept { return uplink_; }

private:
    TransitionConstraint transition_;
    AntennaResourceConstraint antenna_;
    UplinkPrecedenceConstraint uplink_;
};

}  // namespace constellation_planner
