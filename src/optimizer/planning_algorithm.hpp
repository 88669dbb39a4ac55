/**
 * @file planning_algorithm.hpp
 * @brief Planning task model and the algorithm capability interface.
 * @author ConstellationPlanner contributors
 *
 * Search variants share one contract: solve(tasks, satellites) returns a
 * task → satellite assignment plus the winning encoding. The variant is
 * selected by name from configuration; "awcsat" is the only one provided.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "optimizer/awcsat.hpp"

#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace constellation_planner {

struct ImagingOpportunity {
    SatelliteId satellite_id;
    TimeWindow window;
    double off_nadir_deg = 0.0;
    double elevation_deg = 90.0;
};

struct PlanningTask {
    TaskId id;
    TargetId target_id;
    double priority = 1.0;
    std::vector<ImagingOpportunity> imaging_opportunities;
    std::vector<AccessWindow> downlink_opportunities;
    double imaging_duration_sec = 10.0;          ///< Base strip length
    double data_volume_gb_per_sec = 0.05;        ///< Data produced per second of imaging
    std::optional<SatelliteId> assigned_satellite;

    [[nodiscard]] int imaging_opportunity_count() const noexcept {
        return static_cast<int>(imaging_opportunities.size());
    }
    [[nodiscard]] int downlink_opportunity_count() const noexcept {
        return static_cast<int>(downlink_opportunities.size());
    }
};

static_assert(TaskLike<PlanningTask>);

struct PlanningSolution {
    std::map<TaskId, SatelliteId> assignments;
    double objective = 0.0;
    bool feasible = true;
    std::vector<std::string> violations;
    Encoding encoding;
    AwcsatResult search;
};

/**
 * @brief Satellite a task is assigned to under an encoding row.
 *
 * Pre-assignment wins; otherwise the decoded imaging opportunity's
 * satellite; otherwise (no opportunities listed) the satellite derived from
 * the raw selector. An inactive row (selector 0) is unassigned.
 */
[[nodiscard]] std::optional<SatelliteId> resolve_satellite(const PlanningTask& task,
                                                           const EncodingRow& row,
                                                           std::span<const SatelliteId> satellites);

/**
 * @brief Abstract interface for planning algorithms (runtime polymorphism).
 */
class IPlanningAlgorithm {
public:
    virtual ~IPlanningAlgorithm() = default;
    virtual PlanningSolution solve(std::span<const PlanningTask> tasks,
                                   std::span<const SatelliteId> satellites) = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

class AwcsatAlgorithm : public IPlanningAlgorithm {
public:
    /// An empty @p objective scores with default_objective over the tasks' opportunity counts.
    AwcsatAlgorithm(AwcsatConfig config, ObjectiveFunction objective, Logger* logger = nullptr);

    PlanningSolution solve(std::span<const PlanningTask> tasks,
                           std::span<const SatelliteId> satellites) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "awcsat"; }

private:
    AwcsatConfig config_;
    ObjectiveFunction objective_;
    Logger* logger_;
};

/**
 * @brief Select an algorithm variant by configured name.
 */
[[nodiscard]] Result<std::unique_ptr<IPlanningAlgorithm>> make_planning_algorithm(
    std::string_view name, const AwcsatConfig& config,
    ObjectiveFunction objective, Logger* logger = nullptr);

}  // namespace constellation_planner
