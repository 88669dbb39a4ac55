/**
 * @file violation.hpp
 * @brief Constraint violation records shared by every checker.
 * @author ConstellationPlanner contributors
 *
 * Violations are data, not errors: checkers return them in a list and the
 * caller decides what to do. A schedule is feasible iff no violation has
 * error severity.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace constellation_planner {

enum class ViolationType : uint8_t {
    ImagingSwitch,
    DownlinkSwitch,
    ImagingToDownlink,
    AntennaConflict,
    AntennaSwitchTime,
    MissingUplink,
    InsufficientUplinkGap
};

[[nodiscard]] constexpr std::string_view to_string(ViolationType type) noexcept {
    switch (type) {
        case ViolationType::ImagingSwitch:         return "imaging_switch";
        case ViolationType::DownlinkSwitch:        return "downlink_switch";
        case ViolationType::ImagingToDownlink:     return "imaging_to_downlink";
        case ViolationType::AntennaConflict:       return "antenna_conflict";
        case ViolationType::AntennaSwitchTime:     return "antenna_switch_time";
        case ViolationType::MissingUplink:         return "missing_uplink";
        case ViolationType::InsufficientUplinkGap: return "insufficient_uplink_gap";
    }
    return "unknown";
}

enum class Severity : uint8_t {
    Error,
    Warning
};

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Error:   return "error";
        case Severity::Warning: return "warning";
    }
    return "unknown";
}

struct ConstraintViolation {
    ViolationType type;
    Severity severity = Severity::Error;
    std::string message;
    std::string subject;                       ///< Antenna, satellite or task id
    ActionId first_action_id;
    std::optional<ActionId> second_action_id;
    std::optional<double> required_gap_sec;
    std::optional<double> actual_gap_sec;

    [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }
};

[[nodiscard]] inline bool is_feasible(std::span<const ConstraintViolation> violations) noexcept {
    for (const auto& v : violations) {
        if (v.is_error()) return false;
    }
    return true;
}

}  // namespace constellation_planner
