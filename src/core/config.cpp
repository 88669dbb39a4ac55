/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author ConstellationPlanner contributors
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <charconv>
#include <set>

#include <toml++/toml.hpp>

namespace constellation_planner {

namespace {

std::vector<std::string> read_string_array(const toml::node_view<const toml::node>& node) {
    std::vector<std::string> out;
    if (const auto* arr = node.as_array()) {
        for (const auto& item : *arr) {
            if (auto s = item.value<std::string>()) out.push_back(*s);
        }
    }
    return out;
}

AntennaConfig read_antenna(const toml::table& tbl) {
    AntennaConfig ant;
    ant.id = tbl["id"].value_or(std::string{});
    ant.name = tbl["name"].value_or(ant.id);
    ant.max_data_rate_mbps = tbl["max_data_rate_mbps"].value_or(ant.max_data_rate_mbps);
    ant.satellite_switch_time_sec =
        tbl["satellite_switch_time_sec"].value_or(ant.satellite_switch_time_sec);
    if (auto bands = read_string_array(tbl["frequency_bands"]); !bands.empty()) {
        ant.frequency_bands = std::move(bands);
    }
    return ant;
}

StationConfig read_station(const toml::table& tbl) {
    StationConfig st;
    st.id = tbl["id"].value_or(std::string{});
    st.name = tbl["name"].value_or(st.id);
    st.latitude_deg = tbl["latitude_deg"].value_or(0.0);
    st.longitude_deg = tbl["longitude_deg"].value_or(0.0);
    st.altitude_m = tbl["altitude_m"].value_or(0.0);
    st.min_elevation_deg = tbl["min_elevation_deg"].value_or(st.min_elevation_deg);
    st.uplink_rate_kbps = tbl["uplink_rate_kbps"].value_or(st.uplink_rate_kbps);
    st.base_uplink_time_sec = tbl["base_uplink_time_sec"].value_or(st.base_uplink_time_sec);
    st.per_task_uplink_time_sec =
        tbl["per_task_uplink_time_sec"].value_or(st.per_task_uplink_time_sec);
    st.inter_antenna_switch_time_sec =
        tbl["inter_antenna_switch_time_sec"].value_or(st.inter_antenna_switch_time_sec);

    if (const auto* antennas = tbl["antennas"].as_array()) {
        for (const auto& node : *antennas) {
            if (const auto* ant = node.as_table()) {
                st.antennas.push_back(read_antenna(*ant));
            }
        }
    }
    return st;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    Config config;
    try {
        const auto tbl = toml::parse_file(path.string());

        // [planner]
        if (auto planner = tbl["planner"]; planner.is_table()) {
            config.planner.algorithm = planner["algorithm"].value_or(std::string{"awcsat"});
            config.planner.horizon_hours = planner["horizon_hours"].value_or(24.0);
            config.planner.min_uplink_gap_sec = planner["min_uplink_gap_sec"].value_or(60.0);
            config.planner.uplink_lead_hours = planner["uplink_lead_hours"].value_or(12.0);
        }

        // [awcsat]
        if (auto awcsat = tbl["awcsat"]; awcsat.is_table()) {
            auto& a = config.awcsat;
            a.outer_loops = static_cast<int32_t>(
                awcsat["outer_loops"].value_or(int64_t{3000}));
            a.initial_inner_loops = static_cast<int32_t>(
                awcsat["initial_inner_loops"].value_or(int64_t{200}));
            a.tabu_tenure = static_cast<int32_t>(
                awcsat["tabu_tenure"].value_or(int64_t{5}));
            a.q = awcsat["q"].value_or(0.9);
            a.n = awcsat["n"].value_or(1.0);
            a.c = awcsat["c"].value_or(0.25);
            a.initial_sample_size = static_cast<int32_t>(
                awcsat["initial_sample_size"].value_or(int64_t{10}));
            a.seed = static_cast<uint64_t>(awcsat["seed"].value_or(int64_t{42}));
            a.time_limit_sec = awcsat["time_limit_sec"].value_or(300.0);
            a.r_max = awcsat["r_max"].value_or(1.0);
            a.r_min = awcsat["r_min"].value_or(0.0);
            a.default_temperature = awcsat["default_temperature"].value_or(100.0);
            a.temperature_floor = awcsat["temperature_floor"].value_or(1e-10);
        }

        // [downlink]
        if (auto downlink = tbl["downlink"]; downlink.is_table()) {
            config.downlink.default_segment_overhead_sec =
                downlink["default_segment_overhead_sec"].value_or(2.0);
            config.downlink.max_segments = static_cast<int32_t>(
                downlink["max_segments"].value_or(int64_t{10}));
            config.downlink.max_antennas = static_cast<int32_t>(
                downlink["max_antennas"].value_or(int64_t{4}));
            config.downlink.prefer_aggregation = downlink["prefer_aggregation"].value_or(true);
        }

        // [transition]
        if (auto transition = tbl["transition"]; transition.is_table()) {
            config.transition.imaging_switch_sec =
                transition["imaging_switch_sec"].value_or(5.0);
            config.transition.imaging_to_downlink_sec =
                transition["imaging_to_downlink_sec"].value_or(10.0);
            config.transition.downlink_switch_sec =
                transition["downlink_switch_sec"].value_or(3.0);
        }

        // [objective]
        if (auto objective = tbl["objective"]; objective.is_table()) {
            config.objective.violation_penalty = objective["violation_penalty"].value_or(10.0);
            config.objective.extension_reward = objective["extension_reward"].value_or(0.1);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        // [[stations]]
        if (const auto* stations = tbl["stations"].as_array()) {
            for (const auto& node : *stations) {
                if (const auto* st = node.as_table()) {
                    config.stations.push_back(read_station(*st));
                }
            }
        }

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error().with_context(path.string());
    }
    return config;
}

Result<void> validate_awcsat_config(const AwcsatConfig& a) {
    if (a.outer_loops <= 0) return Error{"awcsat.outer_loops must be positive"};
    if (a.initial_inner_loops <= 0) return Error{"awcsat.initial_inner_loops must be positive"};
    if (a.tabu_tenure <= 0) return Error{"awcsat.tabu_tenure must be positive"};
    if (a.initial_sample_size <= 0) return Error{"awcsat.initial_sample_size must be positive"};
    if (a.q <= 0.0 || a.q >= 1.0) return Error{"awcsat.q must lie strictly between 0 and 1"};
    if (a.n <= 0.0) return Error{"awcsat.n must be positive"};
    if (a.c < 0.0) return Error{"awcsat.c must not be negative"};
    if (a.r_max < a.r_min) return Error{"awcsat.r_max must not be below awcsat.r_min"};
    if (a.time_limit_sec <= 0.0) return Error{"awcsat.time_limit_sec must be positive"};
    if (a.default_temperature <= 0.0) return Error{"awcsat.default_temperature must be positive"};
    if (a.temperature_floor <= 0.0) return Error{"awcsat.temperature_floor must be positive"};
    return {};
}

Result<void> validate_config(const Config& config) {
    if (config.planner.algorithm.empty()) return Error{"planner.algorithm must not be empty"};
    if (config.planner.horizon_hours <= 0.0) return Error{"planner.horizon_hours must be positive"};
    if (config.planner.min_uplink_gap_sec < 0.0) {
        return Error{"planner.min_uplink_gap_sec must not be negative"};
    }
    if (config.planner.uplink_lead_hours <= 0.0) {
        return Error{"planner.uplink_lead_hours must be positive"};
    }

    if (auto awcsat = validate_awcsat_config(config.awcsat); !awcsat) return awcsat;

    if (config.downlink.max_segments <= 0) return Error{"downlink.max_segments must be positive"};
    if (config.downlink.max_antennas <= 0) return Error{"downlink.max_antennas must be positive"};
    if (config.downlink.default_segment_overhead_sec < 0.0) {
        return Error{"downlink.default_segment_overhead_sec must not be negative"};
    }

    const auto& t = config.transition;
    if (t.imaging_switch_sec < 0.0 || t.imaging_to_downlink_sec < 0.0 ||
        t.downlink_switch_sec < 0.0) {
        return Error{"transition times must not be negative"};
    }

    if (config.objective.violation_penalty < 0.0) {
        return Error{"objective.violation_penalty must not be negative"};
    }

    if (auto level = parse_log_level(config.telemetry.log_level); !level) {
        return level.error().with_context("telemetry.log_level");
    }

    std::set<std::string> station_ids;
    std::set<std::string> antenna_ids;
    for (const auto& st : config.stations) {
        if (st.id.empty()) return Error{"stations.id must not be empty"};
        if (!station_ids.insert(st.id).second) return Error{"duplicate station id: " + st.id};
        if (st.antennas.empty()) return Error{"station " + st.id + " has no antennas"};
        for (const auto& ant : st.antennas) {
            if (ant.id.empty()) return Error{"station " + st.id + " has an antenna without id"};
            if (!antenna_ids.insert(ant.id).second) {
                return Error{"duplicate antenna id: " + ant.id};
            }
            if (ant.max_data_rate_mbps <= 0.0) {
                return Error{"antenna " + ant.id + " max_data_rate_mbps must be positive"};
            }
            if (ant.satellite_switch_time_sec < 0.0) {
                return Error{"antenna " + ant.id + " satellite_switch_time_sec must not be negative"};
            }
        }
    }

    return {};
}

Result<uint64_t> parse_seed(std::string_view text) {
    const auto rejected = [text] {
        return Error{"--seed expects a non-negative integer, got '" + std::string{text} + "'"};
    };
    if (text.empty()) return rejected();

    uint64_t seed = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, seed);
    if (ec != std::errc{} || ptr != end) return rejected();
    return seed;
}

Config default_config() {
    return Config{};
}

}  // namespace constellation_planner
