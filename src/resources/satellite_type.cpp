/**
 * @file satellite_type.cpp
 * @brief Built-in satellite type registry.
 * @author ConstellationPlanner contributors
 */

#include "resources/satellite_type.hpp"

#include <algorithm>
#include <array>

namespace constellation_planner {

namespace {

std::array<SatelliteTypeConfig, 4> make_registry() {
    return {{
        SatelliteTypeConfig{
            .id = "UHR_OPTICAL",
            .name = "Ultra-high resolution optical",
            .category = SensorCategory::Optical,
            .imaging_switch_time_sec = 8.0,
            .imaging_to_downlink_time_sec = 15.0,
            .downlink_switch_time_sec = 5.0,
            .antenna_types = {"X", "Ka"},
            .max_downlink_rate_mbps = 1200.0,
            .multi_antenna_capable = true,
            .segmented_downlink_capable = false,
            .segment_overhead_sec = 2.0,
            .storage_capacity_gb = 4000.0,
            .max_off_nadir_deg = 45.0,
        },
        SatelliteTypeConfig{
            .id = "HR_OPTICAL",
            .name = "High resolution optical",
            .category = SensorCategory::Optical,
            .imaging_switch_time_sec = 5.0,
            .imaging_to_downlink_time_sec = 10.0,
            .downlink_switch_time_sec = 3.0,
            .antenna_types = {"X"},
            .max_downlink_rate_mbps = 800.0,
            .multi_antenna_capable = false,
            .segmented_downlink_capable = false,
            .segment_overhead_sec = 2.0,
            .storage_capacity_gb = 2000.0,
            .max_off_nadir_deg = 40.0,
        },
        SatelliteTypeConfig{
            .id = "UHR_SAR",
            .name = "Ultra-high resolution SAR",
            .category = SensorCategory::Sar,
            .imaging_switch_time_sec = 10.0,
            .imaging_to_downlink_time_sec = 20.0,
            .downlink_switch_time_sec = 5.0,
            .antenna_types = {"X", "Ka"},
            .max_downlink_rate_mbps = 1500.0,
            .multi_antenna_capable = true,
            .segmented_downlink_capable = true,
            .segment_overhead_sec = 3.0,
            .storage_capacity_gb = 6000.0,
            .max_off_nadir_deg = 35.0,
        },
        SatelliteTypeConfig{
            .id = "HR_SAR",
            .name = "High resolution SAR",
            .category = SensorCategory::Sar,
            .imaging_switch_time_sec = 8.0,
            .imaging_to_downlink_time_sec = 15.0,
            .downlink_switch_time_sec = 4.0,
            .antenna_types = {"X"},
            .max_downlink_rate_mbps = 1000.0,
            .multi_antenna_capable = false,
            .segmented_downlink_capable = false,
            .segment_overhead_sec = 2.0,
            .storage_capacity_gb = 4000.0,
            .max_off_nadir_deg = 30.0,
        },
    }};
}

const std::array<SatelliteTypeConfig, 4>& registry() {
    static const auto types = make_registry();
    return types;
}

}  // anonymous namespace

std::span<const SatelliteTypeConfig> builtin_satellite_types() {
    return registry();
}

const SatelliteTypeConfig* find_satellite_type(std::string_view type_id) {
    const auto& types = registry();
    auto it = std::find_if(types.begin(), types.end(),
                           [type_id](const SatelliteTypeConfig& t) { return t.id == type_id; });
    return it != types.end() ? &*it : nullptr;
}

SatelliteTypeConfig satellite_type_or_default(std::string_view type_id,
                                              const TransitionConfig& fallback) {
    if (const auto* known = find_satellite_type(type_id)) return *known;

    SatelliteTypeConfig generic;
    generic.id = std::string{type_id};
    generic.name = "Generic";
    generic.imaging_switch_time_sec = fallback.imaging_switch_sec;
    generic.imaging_to_downlink_time_sec = fallback.imaging_to_downlink_sec;
    generic.downlink_switch_time_sec = fallback.downlink_switch_sec;
    return generic;
}

}  // namespace constellation_planner
