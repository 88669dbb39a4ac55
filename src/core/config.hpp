/**
 * @file config.hpp
 * @brief Planner configuration with TOML deserialization.
 * @author ConstellationPlanner contributors
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"

namespace constellation_planner {

struct PlannerConfig {
    std::string algorithm = "awcsat";   ///< Only "awcsat" is provided
    double horizon_hours = 24.0;
    double min_uplink_gap_sec = 60.0;   ///< Uplink end → imaging start
    double uplink_lead_hours = 12.0;    ///< How far before imaging uplink windows are searched
};

struct AwcsatConfig {
    int32_t outer_loops = 3000;          ///< K
    int32_t initial_inner_loops = 200;   ///< L0
    int32_t tabu_tenure = 5;
    double q = 0.9;                      ///< Initial temperature coefficient, (0,1)
    double n = 1.0;                      ///< Wave period constant
    double c = 0.25;                     ///< Cooling damping constant
    int32_t initial_sample_size = 10;    ///< N
    uint64_t seed = 42;
    double time_limit_sec = 300.0;
    double r_max = 1.0;
    double r_min = 0.0;
    double default_temperature = 100.0;
    double temperature_floor = 1e-10;
};

struct DownlinkConfig {
    double default_segment_overhead_sec = 2.0;
    int32_t max_segments = 10;
    int32_t max_antennas = 4;
    bool prefer_aggregation = true;
};

/// Fallback switch times for satellites whose type is not registered.
struct TransitionConfig {
    double imaging_switch_sec = 5.0;
    double imaging_to_downlink_sec = 10.0;
    double downlink_switch_sec = 3.0;
};

struct ObjectiveConfig {
    double violation_penalty = 10.0;
    double extension_reward = 0.1;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

struct AntennaConfig {
    std::string id;
    std::string name;
    double max_data_rate_mbps = 800.0;
    std::vector<std::string> frequency_bands{"X"};
    double satellite_switch_time_sec = 5.0;
};

struct StationConfig {
    std::string id;
    std::string name;
    double latitude_deg = 0.0;
    double longitude_deg = 0.0;
    double altitude_m = 0.0;
    double min_elevation_deg = 5.0;
    double uplink_rate_kbps = 64.0;
    double base_uplink_time_sec = 5.0;
    double per_task_uplink_time_sec = 1.0;
    double inter_antenna_switch_time_sec = 2.0;
    std::vector<AntennaConfig> antennas;
};

/**
 * @brief Top-level planner configuration.
 *
 * An empty station list means the built-in station network is used.
 */
struct Config {
    PlannerConfig planner;
    AwcsatConfig awcsat;
    DownlinkConfig downlink;
    TransitionConfig transition;
    ObjectiveConfig objective;
    TelemetryConfig telemetry;
    std::vector<StationConfig> stations;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. The loaded configuration is validated
 * before it is returned.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check value ranges; the first offending key is reported.
 */
Result<void> validate_config(const Config& config);

/// Optimizer-only subset of validate_config, shared with the optimizer constructor.
Result<void> validate_awcsat_config(const AwcsatConfig& config);

/// Optimizer seed from command-line text: decimal digits only, no sign.
Result<uint64_t> parse_seed(std::string_view text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace constellation_planner
