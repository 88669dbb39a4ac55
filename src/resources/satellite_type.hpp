/**
 * @file satellite_type.hpp
 * @brief Satellite models: transition times and downlink capabilities.
 * @author ConstellationPlanner contributors
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace constellation_planner {

enum class SensorCategory : uint8_t {
    Optical,
    Sar
};

[[nodiscard]] constexpr std::string_view to_string(SensorCategory category) noexcept {
    switch (category) {
        case SensorCategory::Optical: return "optical";
        case SensorCategory::Sar:     return "sar";
    }
    return "unknown";
}

struct SatelliteTypeConfig {
    std::string id;
    std::string name;
    SensorCategory category = SensorCategory::Optical;

    // Transition times (seconds)
    double imaging_switch_time_sec = 5.0;
    double imaging_to_downlink_time_sec = 10.0;
    double downlink_switch_time_sec = 3.0;

    // Downlink capability
    std::vector<std::string> antenna_types{"X"};
    double max_downlink_rate_mbps = 800.0;
    bool multi_antenna_capable = false;
    bool segmented_downlink_capable = false;
    double segment_overhead_sec = 2.0;

    double storage_capacity_gb = 2000.0;
    double max_off_nadir_deg = 45.0;
};

/// UHR_OPTICAL, HR_OPTICAL, UHR_SAR, HR_SAR.
[[nodiscard]] std::span<const SatelliteTypeConfig> builtin_satellite_types();

/// nullptr for an unregistered type id.
[[nodiscard]] const SatelliteTypeConfig* find_satellite_type(std::string_view type_id);

/**
 * @brief Registered type, or a generic profile carrying the configured
 *        fallback transition times.
 */
[[nodiscard]] SatelliteTypeConfig satellite_type_or_default(std::string_view type_id,
                                                            const TransitionConfig& fallback);

struct Satellite {
    SatelliteId id;
    std::string name;
    std::string type_id;
    double altitude_km = 500.0;
    double inclination_deg = 97.4;
};

}  // namespace constellation_planner
