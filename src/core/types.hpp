/**
 * @file types.hpp
 * @brief Fundamental types used throughout ConstellationPlanner.
 * @author ConstellationPlanner contributors
 *
 * Defines the identity aliases, the timestamp vocabulary, time windows and
 * the data-volume/rate conversions shared by every planning module.
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace constellation_planner {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using SatelliteId = std::string;
using StationId = std::string;
using AntennaId = std::string;
using TaskId = std::string;
using TargetId = std::string;
using ActionId = std::string;

using Timestamp = std::chrono::system_clock::time_point;
using Seconds = std::chrono::duration<double>;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Time arithmetic
// ─────────────────────────────────────────────

[[nodiscard]] inline Timestamp add_seconds(Timestamp t, double seconds) {
    return t + std::chrono::duration_cast<Timestamp::duration>(Seconds{seconds});
}

/// Signed gap in seconds from @p from to @p to (negative when @p to is earlier).
[[nodiscard]] inline double seconds_between(Timestamp from, Timestamp to) {
    return std::chrono::duration_cast<Seconds>(to - from).count();
}

// ─────────────────────────────────────────────
// Time Window
// ─────────────────────────────────────────────

/**
 * @brief Half-open interval [start, end) on the UTC timeline.
 */
struct TimeWindow {
    Timestamp start;
    Timestamp end;

    [[nodiscard]] double duration_sec() const { return seconds_between(start, end); }

    /// True when @p other lies entirely inside this window.
    [[nodiscard]] bool contains(const TimeWindow& other) const noexcept {
        return start <= other.start && other.end <= end;
    }

    [[nodiscard]] bool contains(Timestamp t) const noexcept {
        return start <= t && t <= end;
    }

    /// Two windows overlap iff their intervals intersect with positive length.
    [[nodiscard]] bool overlaps(const TimeWindow& other) const noexcept {
        return !(end <= other.start || other.end <= start);
    }

    auto operator<=>(const TimeWindow&) const = default;
};

// ─────────────────────────────────────────────
// Access Window
// ─────────────────────────────────────────────

/**
 * @brief A contact opportunity between a satellite and one ground antenna.
 *
 * @p rate_mbps is the link-budget limit of the pass; the achieved rate is
 * additionally capped by the antenna.
 */
struct AccessWindow {
    StationId station_id;
    AntennaId antenna_id;
    TimeWindow window;
    double rate_mbps = 100.0;
};

// ─────────────────────────────────────────────
// Action kinds
// ─────────────────────────────────────────────

enum class ActionKind : uint8_t {
    Imaging,
    Uplink,
    Downlink
};

[[nodiscard]] constexpr std::string_view to_string(ActionKind kind) noexcept {
    switch (kind) {
        case ActionKind::Imaging:  return "imaging";
        case ActionKind::Uplink:   return "uplink";
        case ActionKind::Downlink: return "downlink";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Data volume conversions
// ─────────────────────────────────────────────

/// Megabits in one gigabyte (GB × 8 × 1024).
inline constexpr double kMegabitsPerGigabyte = 8.0 * 1024.0;

/// Volume tolerance used wherever data amounts are compared.
inline constexpr double kVolumeToleranceGb = 0.001;

[[nodiscard]] constexpr double transfer_seconds(double volume_gb, double rate_mbps) noexcept {
    return rate_mbps > 0.0 ? volume_gb * kMegabitsPerGigabyte / rate_mbps : 0.0;
}

[[nodiscard]] constexpr double transfer_volume_gb(double rate_mbps, double seconds) noexcept {
    return rate_mbps * seconds / kMegabitsPerGigabyte;
}

}  // namespace constellation_planner
