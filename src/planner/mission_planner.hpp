/**
 * @file mission_planner.hpp
 * @brief Top-level MissionPlanner facade: search, materialize, validate.
 * @author ConstellationPlanner contributors
 *
 * One call to plan() runs the whole pipeline:
 *   1. Search task → opportunity assignments with the configured algorithm
 *   2. Decode the best encoding into imaging actions
 *   3. Uplink each satellite's commands ahead of its first imaging action
 *   4. Downlink each task's data (aggregated, segmented or single-antenna)
 *   5. Validate the resulting timeline
 *
 * Scheduling failures do not abort the run; they are collected in the
 * plan and show up again as violations.
 */

#pragma once

#include "constraints/validator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "optimizer/planning_algorithm.hpp"
#include "resources/satellite_type.hpp"
#include "resources/ttc_station.hpp"
#include "scheduling/actions.hpp"
#include "scheduling/advanced_downlink.hpp"
#include "scheduling/ttc_scheduler.hpp"
#include "visibility/provider.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace constellation_planner {

struct PlanningProblem {
    std::vector<PlanningTask> tasks;
    std::vector<Satellite> satellites;
    /// Station contacts usable for uplinks, per satellite.
    std::map<SatelliteId, std::vector<AccessWindow>, std::less<>> contact_windows;
};

/// A target to be imaged, before visibility is known.
struct TargetRequest {
    TargetId id;
    double latitude_deg = 0.0;
    double longitude_deg = 0.0;
    double priority = 1.0;
    double imaging_duration_sec = 10.0;
    double data_volume_gb_per_sec = 0.05;
};

struct MissionPlan {
    PlanningSolution solution;
    std::vector<ImagingAction> imaging;
    std::vector<UplinkAction> uplinks;
    std::vector<DownlinkPlan> downlinks;
    ValidationReport report;
    std::vector<std::string> scheduling_failures;

    [[nodiscard]] std::vector<DownlinkAction> downlink_actions() const;
    [[nodiscard]] bool feasible() const noexcept { return report.feasible(); }
};

class MissionPlanner {
public:
    /// Stations come from the configuration (built-in network when none are configured).
    explicit MissionPlanner(Config config, Logger* logger = nullptr);
    MissionPlanner(Config config, std::vector<TtcStation> stations, Logger* logger = nullptr);

    /**
     * @brief Run the full pipeline over @p problem.
     *
     * Errors only on an unknown algorithm name; infeasibility is reported
     * inside the plan. Each call starts from an empty antenna schedule.
     */
    Result<MissionPlan> plan(const PlanningProblem& problem);

    /**
     * @brief Mission value of an encoding.
     *
     * Each task whose imaging and downlink selectors both decode to a
     * listed opportunity earns its priority plus extension_reward × rate;
     * every imaging transition error costs violation_penalty.
     */
    [[nodiscard]] ObjectiveFunction make_objective(const PlanningProblem& problem) const;

    /**
     * @brief Imaging actions for every task active under @p encoding.
     *
     * Strip length is base × (1 + extension rate), clipped to the
     * opportunity window.
     */
    [[nodiscard]] std::vector<ImagingAction> decode_imaging(const PlanningProblem& problem,
                                                            const Encoding& encoding) const;

    /**
     * @brief Turn targets into planning tasks using a visibility provider.
     *
     * Every satellite contributes its access windows to each target and its
     * station contacts to every task's downlink opportunities.
     */
    Result<PlanningProblem> build_problem(IVisibilityProvider& provider,
                                          std::span<const Satellite> satellites,
                                          std::span<const TargetRequest> targets,
                                          std::string_view start_iso,
                                          std::string_view end_iso) const;

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] const std::vector<TtcStation>& stations() const noexcept { return scheduler_.stations(); }
    [[nodiscard]] TtcScheduler& scheduler() noexcept { return scheduler_; }

private:
    [[nodiscard]] SatelliteTypeMap satellite_types(const PlanningProblem& problem) const;
    [[nodiscard]] const Satellite* find_satellite(const PlanningProblem& problem,
                                                  std::string_view satellite_id) const;

    void schedule_uplinks(const PlanningProblem& problem, MissionPlan& plan);
    void schedule_downlinks(const PlanningProblem& problem, const Encoding& encoding,
                            MissionPlan& plan);

    Config config_;
    Logger* logger_;
    TtcScheduler scheduler_;
    AdvancedDownlinkPlanner downlink_planner_;
    ScheduleValidator validator_;
};

}  // namespace constellation_planner
