/**
 * @file planning_algorithm.cpp
 * @brief AWCSAT behind the planning-algorithm interface, and variant selection.
 * @author ConstellationPlanner contributors
 */

#include "optimizer/planning_algorithm.hpp"

#include <stdexcept>

namespace constellation_planner {

std::optional<SatelliteId> resolve_satellite(const PlanningTask& task,
                                             const EncodingRow& row,
                                             std::span<const SatelliteId> satellites) {
    if (task.assigned_satellite) return task.assigned_satellite;

    const double v1 = row[kImagingColumn];
    if (v1 <= 0.0) return std::nullopt;

    const int count = task.imaging_opportunity_count();
    const int index = decode_opportunity(v1, count);
    if (index >= 1 && index <= count) {
        return task.imaging_opportunities[static_cast<size_t>(index - 1)].satellite_id;
    }
    if (satellites.empty()) return std::nullopt;
    const auto n = satellites.size();
    return satellites[static_cast<size_t>(v1 * static_cast<double>(n)) % n];
}

AwcsatAlgorithm::AwcsatAlgorithm(AwcsatConfig config, ObjectiveFunction objective, Logger* logger)
    : config_(std::move(config)), objective_(std::move(objective)), logger_(logger) {
    if (auto valid = validate_awcsat_config(config_); !valid) {
        throw std::invalid_argument(valid.error().message);
    }
}

PlanningSolution AwcsatAlgorithm::solve(std::span<const PlanningTask> tasks,
                                        std::span<const SatelliteId> satellites) {
    ObjectiveFunction objective = objective_;
    if (!objective) {
        std::vector<int> imaging;
        std::vector<int> downlink;
        imaging.reserve(tasks.size());
        downlink.reserve(tasks.size());
        for (const auto& task : tasks) {
            imaging.push_back(task.imaging_opportunity_count());
            downlink.push_back(task.downlink_opportunity_count());
        }
        objective = default_objective(std::move(imaging), std::move(downlink));
    }

    AwcsatOptimizer optimizer(config_, std::move(objective), logger_);
    PlanningSolution solution;
    solution.search = optimizer.optimize(tasks.size());
    solution.encoding = solution.search.best;
    solution.objective = solution.encoding.objective();
    solution.feasible = solution.encoding.feasible();
    solution.violations = solution.encoding.violations();

    for (size_t i = 0; i < tasks.size() && i < solution.encoding.task_count(); ++i) {
        if (auto sat = resolve_satellite(tasks[i], solution.encoding.row(i), satellites)) {
            solution.assignments.emplace(tasks[i].id, *sat);
        }
    }
    return solution;
}

Result<std::unique_ptr<IPlanningAlgorithm>> make_planning_algorithm(
    std::string_view name, const AwcsatConfig& config,
    ObjectiveFunction objective, Logger* logger) {

    if (name != "awcsat") {
        return Error{"Unknown planning algorithm: " + std::string{name} +
                     " (available: awcsat)"};
    }
    if (auto valid = validate_awcsat_config(config); !valid) {
        return valid.error();
    }
    std::unique_ptr<IPlanningAlgorithm> algorithm =
        std::make_unique<AwcsatAlgorithm>(config, std::move(objective), logger);
    return Result<std::unique_ptr<IPlanningAlgorithm>>(std::move(algorithm));
}

}  // namespace constellation_planner
