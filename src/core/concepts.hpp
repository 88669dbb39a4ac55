/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for ConstellationPlanner interfaces.
 * @author ConstellationPlanner contributors
 *
 * Compile-time contracts for the values the optimizer consumes. Task
 * capability is expressed through explicit members (an id, opportunity
 * counts and an optional pre-assigned satellite) rather than probed at
 * runtime.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <optional>
#include <string_view>

namespace constellation_planner {

// Forward declarations
class Encoding;

// ─────────────────────────────────────────────
// ObjectiveLike
// ─────────────────────────────────────────────

/**
 * @concept ObjectiveLike
 * @brief Pure scoring function over an encoding (higher is better).
 *
 * Called once per neighbor on the optimizer's inner loop.
 */
template <typename F>
concept ObjectiveLike = std::copy_constructible<F> && requires(const F& f, const Encoding& enc) {
    { f(enc) } -> std::convertible_to<double>;
};

// ─────────────────────────────────────────────
// TaskLike
// ─────────────────────────────────────────────

/**
 * @concept TaskLike
 * @brief A candidate observation as seen by the optimizer.
 */
template <typename T>
concept TaskLike = requires(const T& task) {
    { task.id } -> std::convertible_to<std::string_view>;
    { task.assigned_satellite } -> std::convertible_to<std::optional<SatelliteId>>;
    { task.imaging_opportunity_count() } -> std::convertible_to<int>;
    { task.downlink_opportunity_count() } -> std::convertible_to<int>;
};

}  // namespace constellation_planner
