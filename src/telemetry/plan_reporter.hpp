/**
 * @file plan_reporter.hpp
 * @brief Structured NDJSON events describing a finished mission plan.
 * @author ConstellationPlanner contributors
 */

#pragma once

#include "constraints/violation.hpp"
#include "core/logger.hpp"
#include "optimizer/awcsat.hpp"
#include "planner/mission_planner.hpp"
#include "scheduling/actions.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace constellation_planner {

/**
 * @brief Writes one JSON object per event to an ILogSink.
 *
 * Every event carries an "event" discriminator: search_summary, imaging,
 * uplink, downlink, violation or plan_summary.
 */
class PlanReporter {
public:
    explicit PlanReporter(std::unique_ptr<ILogSink> sink);

    void record_search(const AwcsatResult& search, double objective);
    void record_imaging(const ImagingAction& action);
    void record_uplink(const UplinkAction& action);
    void record_downlink(const DownlinkAction& action, std::string_view plan_id);
    void record_violation(const ConstraintViolation& violation);
    void record_custom(std::string_view event, std::string_view json_payload);

    /// Search summary, every action, every violation, then a plan summary.
    void record_plan(const MissionPlan& plan);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace constellation_planner
