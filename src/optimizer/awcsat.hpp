/**
 * @file awcsat.hpp
 * @brief Adaptive wave-controlled simulated annealing with tabu (AWCSAT).
 * @author ConstellationPlanner contributors
 *
 * Search proceeds as Initialize → {inner loop × L_k → cool down} × K.
 * The inner loop draws a neighbor with a random operator, filters it through
 * a fixed-tenure tabu list (with aspiration on the global best) and accepts
 * it with a modified Metropolis rule. Cooling mixes a damped linear decay
 * with a cos² re-heating wave driven by the iteration's acceptance counts,
 * and the inner loop length adapts to the improvement ratio.
 *
 * The run is single-threaded and reproducible for a fixed seed. A wall-clock
 * budget is checked at the start of every outer iteration; on expiry the
 * best encoding found so far is returned.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "optimizer/encoding.hpp"
#include "optimizer/neighborhood.hpp"
#include "optimizer/tabu_list.hpp"

#include <cstdint>
#include <functional>
#include <random>
#include <string_view>
#include <vector>

namespace constellation_planner {

using ObjectiveFunction = std::function<double(const Encoding&)>;
static_assert(ObjectiveLike<ObjectiveFunction>);

/**
 * @brief Counts tasks whose decoded imaging and downlink indices are both valid.
 *
 * A task with no listed count is treated as having a single opportunity, so
 * it scores whenever both selectors are non-zero.
 */
[[nodiscard]] ObjectiveFunction default_objective(std::vector<int> imaging_counts = {},
                                                  std::vector<int> downlink_counts = {});

// ─────────────────────────────────────────────
// Annealing schedule (pure)
// ─────────────────────────────────────────────

/// T0 = −ΔE / ln(q) when ΔE > 0 and 0 < q < 1, otherwise @p fallback.
[[nodiscard]] double initial_temperature(double delta_e, double q, double fallback) noexcept;

/// S = exp(−(E_avg − E_min) / T0), or 1 when T0 ≤ 0.
[[nodiscard]] double acceptance_scale(double e_avg, double e_min, double t0) noexcept;

/// 1 for non-worsening moves, else exp((E_new − E_old) / (S·T)); 0 when S·T ≤ 0.
[[nodiscard]] double acceptance_probability(double e_new, double e_old,
                                            double scale, double temperature) noexcept;

struct CoolingInputs {
    double t0;
    int k;                 ///< 0-based outer iteration just finished
    int outer_loops;       ///< K
    double c;
    double n;
    int inner_loops;       ///< L_k
    uint64_t improved;     ///< G_k
    uint64_t accepted;     ///< J_k
};

/// T_{k+1} = (T0·(K−k)/K)/(C·k+1) + (L_k/(1+G_k))·cos²(J_k/(n·T0)), clamped to @p floor.
[[nodiscard]] double next_temperature(const CoolingInputs& in, double floor) noexcept;

/// Grow by 10% (≤ 2·L0) when G/L < 0.1, shrink by 10% (≥ L0/2) when G/L > 0.5.
[[nodiscard]] int adapt_inner_loops(int current, int initial, uint64_t improved) noexcept;

// ─────────────────────────────────────────────
// Optimizer
// ─────────────────────────────────────────────

enum class StopReason : uint8_t {
    NotStarted,
    Completed,
    TimeLimit,
    NoTasks
};

[[nodiscard]] constexpr std::string_view to_string(StopReason reason) noexcept {
    switch (reason) {
        case StopReason::NotStarted: return "not_started";
        case StopReason::Completed:  return "completed";
        case StopReason::TimeLimit:  return "time_limit";
        case StopReason::NoTasks:    return "no_tasks";
    }
    return "unknown";
}

enum class MoveOutcome : uint8_t {
    Accepted,
    Rejected,
    TabuRejected,
    AspirationAccepted
};

struct AwcsatStatistics {
    double initial_temperature = 0.0;
    double final_temperature = 0.0;
    double delta_e = 0.0;
    double e_avg = 0.0;
    double e_min = 0.0;
    int iterations = 0;
    int final_inner_loops = 0;
    double elapsed_sec = 0.0;
    uint64_t evaluations = 0;
    uint64_t accepted = 0;
    uint64_t improved = 0;
    uint64_t tabu_rejections = 0;
    uint64_t aspiration_accepts = 0;
    StopReason stop_reason = StopReason::NotStarted;
};

struct AwcsatResult {
    Encoding best;
    std::vector<double> history;        ///< Best objective after each outer iteration
    std::vector<double> temperatures;   ///< Temperature after each cool-down
    AwcsatStatistics statistics;
};

class AwcsatOptimizer {
public:
    /**
     * @throws std::invalid_argument on a configuration rejected by
     *         validate_awcsat_config.
     *
     * An empty @p objective selects default_objective().
     */
    AwcsatOptimizer(AwcsatConfig config, ObjectiveFunction objective, Logger* logger = nullptr);

    /// Full run over @p task_count rows. Zero tasks returns an empty result without searching.
    [[nodiscard]] AwcsatResult optimize(size_t task_count);

    // Step-wise interface; optimize() is initialize() followed by K outer iterations.

    /// Sample N random encodings, derive T0 and seed current/best with the sample's best.
    void initialize(size_t task_count);

    /// One inner loop of L_k steps followed by cool-down and inner-loop adaptation.
    void run_outer_iteration(int k);

    /// Evaluate @p neighbor and run it through tabu filtering and acceptance.
    MoveOutcome consider(Encoding neighbor);

    [[nodiscard]] const Encoding& current() const noexcept { return current_; }
    [[nodiscard]] const Encoding& best() const noexcept { return best_; }
    [[nodiscard]] double temperature() const noexcept { return temperature_; }
    [[nodiscard]] int inner_loops() const noexcept { return inner_loops_; }
    [[nodiscard]] const TabuList& tabu_list() const noexcept { return tabu_; }
    [[nodiscard]] const AwcsatStatistics& statistics() const noexcept { return stats_; }
    [[nodiscard]] const AwcsatConfig& config() const noexcept { return config_; }

private:
    double evaluate(Encoding& encoding);
    void accept(Encoding neighbor);

    AwcsatConfig config_;
    ObjectiveFunction objective_;
    Logger* logger_;

    NeighborhoodOperatorSet operators_;
    TabuList tabu_;
    std::mt19937 rng_;

    Encoding current_;
    Encoding best_;
    double t0_ = 0.0;
    double temperature_ = 0.0;
    double scale_ = 1.0;
    int inner_loops_ = 0;
    uint64_t iteration_improved_ = 0;   // G_k
    uint64_t iteration_accepted_ = 0;   // J_k

    AwcsatStatistics stats_;
    std::vector<double> history_;
    std::vector<double> temperatures_;
};

}  // namespace constellation_planner
