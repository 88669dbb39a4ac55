/**
 * @file transition.hpp
 * @brief Minimum transition times between consecutive actions of one satellite.
 * @author ConstellationPlanner contributors
 *
 * Three gaps are enforced, each against the satellite type's profile:
 *   - imaging → imaging                     (imaging_switch)
 *   - downlink → downlink at another station (downlink_switch)
 *   - imaging → the downlink that follows it (imaging_to_downlink)
 * Satellites of an unregistered type use the configured fallback times.
 */

#pragma once

#include "constraints/violation.hpp"
#include "core/config.hpp"
#include "resources/satellite_type.hpp"
#include "scheduling/actions.hpp"

#include <map>
#include <span>
#include <string>
#include <vector>

namespace constellation_planner {

/// Satellite id → satellite type id.
using SatelliteTypeMap = std::map<SatelliteId, std::string, std::less<>>;

class TransitionConstraint {
public:
    explicit TransitionConstraint(TransitionConfig fallback = {});

    [[nodiscard]] std::vector<ConstraintViolation> check_imaging_sequence(
        std::span<const ImagingAction> imaging, const SatelliteTypeConfig& type) const;

    /// Only consecutive downlinks at different stations are checked.
    [[nodiscard]] std::vector<ConstraintViolation> check_downlink_sequence(
        std::span<const DownlinkAction> downlinks, const SatelliteTypeConfig& type) const;

    /**
     * @brief Every point on the merged timeline where an imaging action is
     *        directly followed by a downlink.
     */
    [[nodiscard]] std::vector<ConstraintViolation> check_imaging_to_downlink(
        std::span<const ImagingAction> imaging, std::span<const DownlinkAction> downlinks,
        const SatelliteTypeConfig& type) const;

    /// All three checks for the actions of one satellite.
    [[nodiscard]] std::vector<ConstraintViolation> check_satellite(
        std::span<const ImagingAction> imaging, std::span<const DownlinkAction> downlinks,
        const SatelliteTypeConfig& type) const;

    /// Groups actions by satellite and checks each group.
    [[nodiscard]] std::vector<ConstraintViolation> check_all(
        std::span<const ImagingAction> imaging, std::span<const DownlinkAction> downlinks,
        const SatelliteTypeMap& satellite_types = {}) const;

    [[nodiscard]] SatelliteTypeConfig profile_for(std::string_view type_id) const;

    [[nodiscard]] const TransitionConfig& fallback() const noexcept { return fallback_; }

private:
    TransitionConfig fallback_;
};

}  // namespace constellation_planner
