/**
 * @file mock_provider.hpp
 * @brief Deterministic geometric stand-in for an orbit propagator.
 * @author ConstellationPlanner contributors
 *
 * Passes recur at a fixed revisit interval. The first pass offset, each
 * pass duration and its off-nadir angle are derived from a stable 64-bit
 * hash of the ids involved, so identical inputs give identical windows on
 * every platform.
 */

#pragma once

#include "visibility/provider.hpp"

#include <cstdint>
#include <string_view>

namespace constellation_planner {

struct MockVisibilityConfig {
    double target_revisit_hours = 9.6;          ///< ~2.5 passes a day
    double target_max_offset_hours = 10.0;
    double target_min_duration_sec = 120.0;
    double target_duration_spread_sec = 360.0;
    double max_off_nadir_deg = 30.0;

    double station_revisit_hours = 5.0;
    double station_max_offset_hours = 4.0;
    double station_min_duration_sec = 300.0;
    double station_duration_spread_sec = 300.0;
};

class MockVisibilityProvider : public IVisibilityProvider {
public:
    explicit MockVisibilityProvider(MockVisibilityConfig config = {});

    Result<std::vector<VisibilityWindow>> compute_access(
        const Satellite& satellite, double latitude_deg, double longitude_deg,
        std::string_view start_iso, std::string_view end_iso) override;

    Result<std::vector<GroundStationWindow>> compute_ground_station_access(
        const Satellite& satellite, const TtcStation& station,
        std::string_view start_iso, std::string_view end_iso) override;

    [[nodiscard]] std::string name() const override { return "mock"; }

    [[nodiscard]] const MockVisibilityConfig& config() const noexcept { return config_; }

    /// FNV-1a 64 over the bytes of @p text.
    [[nodiscard]] static uint64_t stable_hash(std::string_view text) noexcept;

private:
    MockVisibilityConfig config_;
};

}  // namespace constellation_planner
