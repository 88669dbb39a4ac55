/**
 * @file mock_provider.cpp
 * @brief MockVisibilityProvider implementation.
 * @author ConstellationPlanner contributors
 */

#include "visibility/mock_provider.hpp"

#include <cmath>
#include <format>

namespace constellation_planner {

namespace {

/// Hash mapped onto [0, span); 0 when span <= 0.
double hashed_fraction(std::string_view key, double span) {
    if (span <= 0.0) return 0.0;
    const auto h = MockVisibilityProvider::stable_hash(key);
    return static_cast<double>(h % 1'000'000ULL) / 1'000'000.0 * span;
}

}  // anonymous namespace

MockVisibilityProvider::MockVisibilityProvider(MockVisibilityConfig config) : config_(config) {}

uint64_t MockVisibilityProvider::stable_hash(std::string_view text) noexcept {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

Result<std::vector<VisibilityWindow>> MockVisibilityProvider::compute_access(
    const Satellite& satellite, double latitude_deg, double longitude_deg,
    std::string_view start_iso, std::string_view end_iso) {

    auto range = parse_time_range(start_iso, end_iso);
    if (!range) return range.error().with_context("compute_access");
    if (config_.target_revisit_hours <= 0.0) return Error{"target revisit interval must be positive"};

    const auto target_id = std::format("TGT_{:.2f}_{:.2f}", latitude_deg, longitude_deg);
    const double offset_h = std::floor(hashed_fraction(satellite.id + target_id,
                                                       config_.target_max_offset_hours));

    std::vector<VisibilityWindow> windows;
    Timestamp t = add_seconds(range->start, offset_h * 3600.0);
    for (int index = 0; t < range->end; ++index) {
        const auto key = std::format("{}_{}_{}", satellite.id, target_id, index);
        const double duration = config_.target_min_duration_sec +
                                std::floor(hashed_fraction(key, config_.target_duration_spread_sec));
        const double off_nadir = std::floor(hashed_fraction(key + "_angle", config_.max_off_nadir_deg));

        windows.push_back(VisibilityWindow{
            .id = std::format("OBS_{}_{:04d}", satellite.id, index),
            .satellite_id = satellite.id,
            .target_id = target_id,
            .window = TimeWindow{t, add_seconds(t, duration)},
            .off_nadir_deg = off_nadir,
            .elevation_deg = 90.0 - off_nadir,
        });
        t = add_seconds(t, config_.target_revisit_hours * 3600.0);
    }
    return windows;
}

Result<std::vector<GroundStationWindow>> MockVisibilityProvider::compute_ground_station_access(
    const Satellite& satellite, const TtcStation& station,
    std::string_view start_iso, std::string_view end_iso) {

    auto range = parse_time_range(start_iso, end_iso);
    if (!range) return range.error().with_context("compute_ground_station_access");
    if (config_.station_revisit_hours <= 0.0) return Error{"station revisit interval must be positive"};
    if (station.antennas.empty()) return Error{"station " + station.id + " has no antennas"};

    const double offset_h = std::floor(hashed_fraction(satellite.id + station.id,
                                                       config_.station_max_offset_hours));

    std::vector<GroundStationWindow> windows;
    Timestamp t = add_seconds(range->start, offset_h * 3600.0);
    for (int index = 0; t < range->end; ++index) {
        const auto key = std::format("{}_{}_{}", satellite.id, station.id, index);
        const double duration = config_.station_min_duration_sec +
                                std::floor(hashed_fraction(key, config_.station_duration_spread_sec));

        windows.push_back(GroundStationWindow{
            .id = std::format("DL_{}_{}_{:04d}", satellite.id, station.id, index),
            .satellite_id = satellite.id,
            .station_id = station.id,
            .window = TimeWindow{t, add_seconds(t, duration)},
            .max_data_rate_mbps = station.max_data_rate_mbps(),
        });
        t = add_seconds(t, config_.station_revisit_hours * 3600.0);
    }
    return windows;
}

}  // namespace constellation_planner
