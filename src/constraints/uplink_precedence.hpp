/**
 * @file uplink_precedence.hpp
 * @brief Every imaging task needs its commands uplinked before it starts.
 * @author ConstellationPlanner contributors
 *
 * A task is covered by an uplink on the same satellite that lists the task
 * and ends strictly before the task starts. Among covering uplinks the
 * latest-ending one must leave at least the minimum gap; a shorter gap is
 * a warning, no covering uplink at all is an error.
 */

#pragma once

#include "constraints/violation.hpp"
#include "scheduling/actions.hpp"

#include <map>
#include <optional>
#include <span>
#include <vector>

namespace constellation_planner {

using ImagingBySatellite = std::map<SatelliteId, std::vector<ImagingAction>, std::less<>>;

class UplinkPrecedenceConstraint {
public:
    explicit UplinkPrecedenceConstraint(double min_gap_sec = 60.0);

    [[nodiscard]] std::optional<ConstraintViolation> check_task(
        const ImagingAction& task, std::span<const UplinkAction> uplinks) const;

    [[nodiscard]] std::vector<ConstraintViolation> check_all(
        std::span<const ImagingAction> tasks, std::span<const UplinkAction> uplinks) const;

    /// Tasks grouped by satellite, each group sorted by start.
    [[nodiscard]] static ImagingBySatellite find_required_uplinks(std::span<const ImagingAction> tasks);

    /**
     * @brief One request per satellite covering all of its tasks.
     *
     * The request must end min_gap before the satellite's first task and
     * may start at most @p lead_hours earlier.
     */
    [[nodiscard]] std::vector<UplinkRequest> build_uplink_requests(
        std::span<const ImagingAction> tasks, double lead_hours) const;

    [[nodiscard]] double min_gap_sec() const noexcept { return min_gap_sec_; }

private:
    double min_gap_sec_;
};

}  // namespace constellation_planner
