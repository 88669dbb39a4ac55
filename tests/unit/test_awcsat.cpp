/**
 * @file test_awcsat.cpp
 * @brief Unit tests for the AWCSAT optimizer and the algorithm factory.
 */

#include "optimizer/awcsat.hpp"
#include "optimizer/planning_algorithm.hpp"

#include <cmath>
#include <memory>

#include <gtest/gtest.h>

using namespace constellation_planner;

namespace {

AwcsatConfig small_config() {
    AwcsatConfig config;
    config.outer_loops = 20;
    config.initial_inner_loops = 15;
    config.initial_sample_size = 5;
    config.tabu_tenure = 5;
    config.seed = 99;
    config.time_limit_sec = 60.0;
    return config;
}

/// Objective returning start, start+step, start+2*step, ... on successive calls.
ObjectiveFunction sequence_objective(double start, double step) {
    auto next = std::make_shared<double>(start);
    return [next, step](const Encoding&) {
        const double value = *next;
        *next += step;
        return value;
    };
}

double cell_sum(const Encoding& enc) {
    double sum = 0.0;
    for (const auto& row : enc.rows()) {
        for (double cell : row) sum += cell;
    }
    return sum;
}

}  // namespace

// ─────────────────────────────────────────────
// Annealing schedule
// ─────────────────────────────────────────────

TEST(AwcsatScheduleTest, InitialTemperatureFromSpread) {
    EXPECT_NEAR(initial_temperature(4.0, 0.9, 100.0), 37.965, 1e-3);
}

TEST(AwcsatScheduleTest, InitialTemperatureFallsBackWithoutSpread) {
    EXPECT_DOUBLE_EQ(initial_temperature(0.0, 0.9, 100.0), 100.0);
    EXPECT_DOUBLE_EQ(initial_temperature(4.0, 1.0, 100.0), 100.0);
}

TEST(AwcsatScheduleTest, AcceptanceScale) {
    EXPECT_NEAR(acceptance_scale(3.0, 1.0, 2.0), std::exp(-1.0), 1e-12);
    EXPECT_DOUBLE_EQ(acceptance_scale(3.0, 1.0, 0.0), 1.0);
}

TEST(AwcsatScheduleTest, AcceptanceProbability) {
    EXPECT_DOUBLE_EQ(acceptance_probability(5.0, 3.0, 1.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(acceptance_probability(3.0, 3.0, 1.0, 1.0), 1.0);
    EXPECT_NEAR(acceptance_probability(3.0, 5.0, 1.0, 2.0), std::exp(-1.0), 1e-12);
    EXPECT_DOUBLE_EQ(acceptance_probability(3.0, 5.0, 1.0, 0.0), 0.0);
}

TEST(AwcsatScheduleTest, NextTemperatureCombinesDecayAndWave) {
    CoolingInputs in{.t0 = 10.0, .k = 0, .outer_loops = 10, .c = 0.25, .n = 1.0,
                     .inner_loops = 100, .improved = 4, .accepted = 0};
    // decay = 10, wave term = 100 / 5 * cos^2(0)
    EXPECT_NEAR(next_temperature(in, 1e-10), 30.0, 1e-9);

    in.k = 5;
    in.accepted = 0;
    in.inner_loops = 0;
    // decay = 10 * 5 / 10 / (0.25 * 5 + 1)
    EXPECT_NEAR(next_temperature(in, 1e-10), 5.0 / 2.25, 1e-9);
}

TEST(AwcsatScheduleTest, NextTemperatureRespectsFloor) {
    CoolingInputs in{.t0 = 0.0, .k = 1, .outer_loops = 10, .c = 0.25, .n = 1.0,
                     .inner_loops = 0, .improved = 0, .accepted = 0};
    EXPECT_DOUBLE_EQ(next_temperature(in, 1e-3), 1e-3);
}

TEST(AwcsatScheduleTest, AdaptInnerLoops) {
    EXPECT_EQ(adapt_inner_loops(100, 100, 5), 110);    // few improvements: grow
    EXPECT_EQ(adapt_inner_loops(100, 100, 60), 90);    // many improvements: shrink
    EXPECT_EQ(adapt_inner_loops(100, 100, 30), 100);
    EXPECT_EQ(adapt_inner_loops(200, 100, 0), 200);    // capped at 2 * L0
    EXPECT_EQ(adapt_inner_loops(50, 100, 40), 50);     // floored at L0 / 2
}

// ─────────────────────────────────────────────
// Default objective
// ─────────────────────────────────────────────

TEST(AwcsatObjectiveTest, CountsTasksWithBothSelectorsInRange) {
    auto objective = default_objective({2, 2}, {3, 0});
    Encoding enc(std::vector<EncodingRow>{{0.5, 0.5, 0.0}, {0.5, 0.5, 0.0}});
    // Task 1 has no downlink opportunities.
    EXPECT_DOUBLE_EQ(objective(enc), 1.0);

    enc.set(0, kImagingColumn, 0.0);
    EXPECT_DOUBLE_EQ(objective(enc), 0.0);
}

TEST(AwcsatObjectiveTest, MissingCountsDefaultToOne) {
    auto objective = default_objective();
    Encoding enc(std::vector<EncodingRow>{{0.3, 0.9, 0.0}, {0.0, 0.9, 0.0}});
    EXPECT_DOUBLE_EQ(objective(enc), 1.0);
}

// ─────────────────────────────────────────────
// Optimizer
// ─────────────────────────────────────────────

TEST(AwcsatOptimizerTest, InvalidConfigThrows) {
    auto config = small_config();
    config.tabu_tenure = 0;
    EXPECT_THROW(AwcsatOptimizer(config, default_objective()), std::invalid_argument);

    config = small_config();
    config.q = 1.5;
    EXPECT_THROW(AwcsatOptimizer(config, default_objective()), std::invalid_argument);
}

TEST(AwcsatOptimizerTest, InitialTemperatureFromSample) {
    auto config = small_config();
    config.initial_sample_size = 3;
    AwcsatOptimizer optimizer(config, sequence_objective(1.0, 2.0));
    optimizer.initialize(4);

    EXPECT_NEAR(optimizer.temperature(), 37.965, 1e-3);
    EXPECT_NEAR(optimizer.statistics().initial_temperature, 37.965, 1e-3);
    EXPECT_DOUBLE_EQ(optimizer.statistics().delta_e, 4.0);
    EXPECT_DOUBLE_EQ(optimizer.statistics().e_avg, 3.0);
    EXPECT_DOUBLE_EQ(optimizer.statistics().e_min, 1.0);
    EXPECT_DOUBLE_EQ(optimizer.current().objective(), 5.0);
    EXPECT_DOUBLE_EQ(optimizer.best().objective(), 5.0);
    EXPECT_EQ(optimizer.current().task_count(), 4u);
    EXPECT_EQ(optimizer.statistics().evaluations, 3u);
}

TEST(AwcsatOptimizerTest, FlatSampleUsesDefaultTemperature) {
    auto config = small_config();
    config.default_temperature = 42.0;
    AwcsatOptimizer optimizer(config, [](const Encoding&) { return 1.0; });
    optimizer.initialize(3);
    EXPECT_DOUBLE_EQ(optimizer.temperature(), 42.0);
}

TEST(AwcsatOptimizerTest, TabuHitWithoutImprovementIsRejected) {
    auto config = small_config();
    config.initial_sample_size = 3;
    AwcsatOptimizer optimizer(config, sequence_objective(-1.0, -1.0));
    optimizer.initialize(2);

    const Encoding candidate(std::vector<EncodingRow>{{0.1, 0.1, 0.1}, {0.2, 0.2, 0.2}});
    const auto first = optimizer.consider(candidate);
    EXPECT_NE(first, MoveOutcome::TabuRejected);
    EXPECT_TRUE(optimizer.tabu_list().contains(candidate.fingerprint()));

    EXPECT_EQ(optimizer.consider(candidate), MoveOutcome::TabuRejected);
    EXPECT_EQ(optimizer.statistics().tabu_rejections, 1u);
}

TEST(AwcsatOptimizerTest, TabuHitBeatingBestIsAspirated) {
    auto config = small_config();
    config.initial_sample_size = 3;
    AwcsatOptimizer optimizer(config, sequence_objective(1.0, 1.0));
    optimizer.initialize(2);
    ASSERT_DOUBLE_EQ(optimizer.best().objective(), 3.0);

    const Encoding candidate(std::vector<EncodingRow>{{0.1, 0.1, 0.1}, {0.2, 0.2, 0.2}});
    EXPECT_EQ(optimizer.consider(candidate), MoveOutcome::Accepted);
    EXPECT_DOUBLE_EQ(optimizer.best().objective(), 4.0);

    EXPECT_EQ(optimizer.consider(candidate), MoveOutcome::AspirationAccepted);
    EXPECT_DOUBLE_EQ(optimizer.best().objective(), 5.0);
    EXPECT_EQ(optimizer.statistics().aspiration_accepts, 1u);
    EXPECT_EQ(optimizer.tabu_list().size(), 1u);
}

TEST(AwcsatOptimizerTest, ZeroTasksSkipsSearch) {
    AwcsatOptimizer optimizer(small_config(), default_objective());
    auto result = optimizer.optimize(0);
    EXPECT_EQ(result.statistics.stop_reason, StopReason::NoTasks);
    EXPECT_TRUE(result.best.empty());
    EXPECT_TRUE(result.history.empty());
}

TEST(AwcsatOptimizerTest, RunsAllOuterIterations) {
    auto config = small_config();
    AwcsatOptimizer optimizer(config, cell_sum);
    auto result = optimizer.optimize(6);

    EXPECT_EQ(result.statistics.stop_reason, StopReason::Completed);
    EXPECT_EQ(result.statistics.iterations, config.outer_loops);
    ASSERT_EQ(result.history.size(), static_cast<size_t>(config.outer_loops));
    ASSERT_EQ(result.temperatures.size(), static_cast<size_t>(config.outer_loops));
    for (double t : result.temperatures) EXPECT_GE(t, config.temperature_floor);

    // Best-so-far never regresses.
    for (size_t i = 1; i < result.history.size(); ++i) {
        EXPECT_GE(result.history[i], result.history[i - 1]);
    }
    EXPECT_DOUBLE_EQ(result.best.objective(), result.history.back());
    EXPECT_GE(result.best.objective(), result.statistics.e_min);
}

TEST(AwcsatOptimizerTest, SameSeedSameResult) {
    AwcsatOptimizer a(small_config(), cell_sum);
    AwcsatOptimizer b(small_config(), cell_sum);
    auto ra = a.optimize(5);
    auto rb = b.optimize(5);

    EXPECT_TRUE(ra.best.same_cells(rb.best));
    EXPECT_EQ(ra.history, rb.history);
    EXPECT_EQ(ra.statistics.accepted, rb.statistics.accepted);
}

TEST(AwcsatOptimizerTest, RerunIsReproducible) {
    AwcsatOptimizer optimizer(small_config(), cell_sum);
    auto first = optimizer.optimize(5);
    auto second = optimizer.optimize(5);
    EXPECT_TRUE(first.best.same_cells(second.best));
    EXPECT_EQ(first.history, second.history);
}

TEST(AwcsatOptimizerTest, ExpiredTimeLimitStopsBeforeFirstIteration) {
    auto config = small_config();
    config.time_limit_sec = 1e-9;
    AwcsatOptimizer optimizer(config, cell_sum);
    auto result = optimizer.optimize(3);
    EXPECT_EQ(result.statistics.stop_reason, StopReason::TimeLimit);
    EXPECT_EQ(result.statistics.iterations, 0);
}

// ─────────────────────────────────────────────
// Algorithm selection
// ─────────────────────────────────────────────

TEST(PlanningAlgorithmTest, UnknownNameIsError) {
    auto algorithm = make_planning_algorithm("ga", small_config(), nullptr);
    ASSERT_FALSE(algorithm.has_value());
    EXPECT_NE(algorithm.error().message.find("ga"), std::string::npos);
}

TEST(PlanningAlgorithmTest, AwcsatSolvesTasks) {
    auto algorithm = make_planning_algorithm("awcsat", small_config(), nullptr);
    ASSERT_TRUE(algorithm.has_value()) << algorithm.error().message;
    EXPECT_EQ((*algorithm)->name(), "awcsat");

    const Timestamp t0{};
    std::vector<PlanningTask> tasks(2);
    tasks[0].id = "TASK_0001";
    tasks[0].imaging_opportunities = {
        {.satellite_id = "SAT01", .window = {t0, add_seconds(t0, 300)}},
        {.satellite_id = "SAT02", .window = {add_seconds(t0, 600), add_seconds(t0, 900)}}};
    tasks[0].downlink_opportunities = {
        {.station_id = "BJGS", .antenna_id = "BJGS_ANT01",
         .window = {add_seconds(t0, 1000), add_seconds(t0, 1600)}}};
    tasks[1].id = "TASK_0002";
    tasks[1].assigned_satellite = "SAT03";

    const std::vector<SatelliteId> satellites{"SAT01", "SAT02", "SAT03"};
    auto solution = (*algorithm)->solve(tasks, satellites);

    EXPECT_EQ(solution.encoding.task_count(), 2u);
    EXPECT_DOUBLE_EQ(solution.objective, solution.encoding.objective());
    // Task 0 is reachable, so the search finds a row that activates it.
    EXPECT_GE(solution.objective, 1.0);
    ASSERT_TRUE(solution.assignments.contains("TASK_0001"));
    EXPECT_EQ(solution.assignments.at("TASK_0002"), "SAT03");
}

TEST(PlanningAlgorithmTest, InvalidConfigIsError) {
    auto config = small_config();
    config.initial_inner_loops = 0;
    EXPECT_FALSE(make_planning_algorithm("awcsat", config, nullptr).has_value());
}

TEST(ResolveSatelliteTest, PreassignmentWins) {
    PlanningTask task;
    task.assigned_satellite = "SAT09";
    const std::vector<SatelliteId> satellites{"SAT01"};
    EXPECT_EQ(resolve_satellite(task, EncodingRow{0.0, 0.0, 0.0}, satellites), "SAT09");
}

TEST(ResolveSatelliteTest, InactiveRowIsUnassigned) {
    PlanningTask task;
    task.imaging_opportunities = {{.satellite_id = "SAT01", .window = {}}};
    const std::vector<SatelliteId> satellites{"SAT01"};
    EXPECT_FALSE(resolve_satellite(task, EncodingRow{0.0, 0.5, 0.0}, satellites).has_value());
}

TEST(ResolveSatelliteTest, DecodedOpportunityDecides) {
    PlanningTask task;
    task.imaging_opportunities = {{.satellite_id = "SAT01", .window = {}},
                                  {.satellite_id = "SAT02", .window = {}}};
    const std::vector<SatelliteId> satellites{"SAT01", "SAT02"};
    EXPECT_EQ(resolve_satellite(task, EncodingRow{0.4, 0.0, 0.0}, satellites), "SAT01");
    EXPECT_EQ(resolve_satellite(task, EncodingRow{0.9, 0.0, 0.0}, satellites), "SAT02");
}

TEST(ResolveSatelliteTest, RawSelectorWithoutOpportunities) {
    PlanningTask task;
    const std::vector<SatelliteId> satellites{"SAT01", "SAT02", "SAT03"};
    EXPECT_EQ(resolve_satellite(task, EncodingRow{0.5, 0.0, 0.0}, satellites), "SAT02");
    EXPECT_FALSE(resolve_satellite(task, EncodingRow{0.5, 0.0, 0.0}, {}).has_value());
}
