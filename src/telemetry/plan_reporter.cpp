/**
 * @file plan_reporter.cpp
 * @brief PlanReporter implementation.
 * @author ConstellationPlanner contributors
 */

#include "telemetry/plan_reporter.hpp"

#include "core/time.hpp"

#include <sstream>

namespace constellation_planner {

namespace {

std::string quoted(std::string_view text) {
    return "\"" + json_escape(text) + "\"";
}

}  // anonymous namespace

PlanReporter::PlanReporter(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void PlanReporter::record_search(const AwcsatResult& search, double objective) {
    const auto& s = search.statistics;
    std::ostringstream oss;
    oss << R"({"event":"search_summary")"
        << R"(,"objective":)" << objective
        << R"(,"stop_reason":)" << quoted(to_string(s.stop_reason))
        << R"(,"iterations":)" << s.iterations
        << R"(,"evaluations":)" << s.evaluations
        << R"(,"accepted":)" << s.accepted
        << R"(,"improved":)" << s.improved
        << R"(,"tabu_rejections":)" << s.tabu_rejections
        << R"(,"aspiration_accepts":)" << s.aspiration_accepts
        << R"(,"t0":)" << s.initial_temperature
        << R"(,"t_final":)" << s.final_temperature
        << R"(,"elapsed_sec":)" << s.elapsed_sec
        << "}";
    emit(oss.str());
}

void PlanReporter::record_imaging(const ImagingAction& action) {
    std::ostringstream oss;
    oss << R"({"event":"imaging")"
        << R"(,"id":)" << quoted(action.id)
        << R"(,"satellite":)" << quoted(action.satellite_id)
        << R"(,"task":)" << quoted(action.task_id)
        << R"(,"target":)" << quoted(action.target_id)
        << R"(,"start":)" << quoted(format_iso8601(action.start))
        << R"(,"end":)" << quoted(format_iso8601(action.end))
        << R"(,"extension_rate":)" << action.extension_rate
        << "}";
    emit(oss.str());
}

void PlanReporter::record_uplink(const UplinkAction& action) {
    std::ostringstream oss;
    oss << R"({"event":"uplink")"
        << R"(,"id":)" << quoted(action.id)
        << R"(,"satellite":)" << quoted(action.satellite_id)
        << R"(,"station":)" << quoted(action.station_id)
        << R"(,"antenna":)" << quoted(action.antenna_id)
        << R"(,"start":)" << quoted(format_iso8601(action.start))
        << R"(,"end":)" << quoted(format_iso8601(action.end))
        << R"(,"tasks":[)";
    for (size_t i = 0; i < action.task_ids.size(); ++i) {
        if (i > 0) oss << ',';
        oss << quoted(action.task_ids[i]);
    }
    oss << "]}";
    emit(oss.str());
}

void PlanReporter::record_downlink(const DownlinkAction& action, std::string_view plan_id) {
    std::ostringstream oss;
    oss << R"({"event":"downlink")"
        << R"(,"id":)" << quoted(action.id)
        << R"(,"plan":)" << quoted(plan_id)
        << R"(,"satellite":)" << quoted(action.satellite_id)
        << R"(,"station":)" << quoted(action.station_id)
        << R"(,"antennas":[)";
    for (size_t i = 0; i < action.antenna_ids.size(); ++i) {
        if (i > 0) oss << ',';
        oss << quoted(action.antenna_ids[i]);
    }
    oss << "]"
        << R"(,"start":)" << quoted(format_iso8601(action.start))
        << R"(,"end":)" << quoted(format_iso8601(action.end))
        << R"(,"volume_gb":)" << action.data_volume_gb
        << R"(,"rate_mbps":)" << action.data_rate_mbps
        << R"(,"aggregated":)" << (action.aggregated ? "true" : "false");
    if (action.segment) {
        oss << R"(,"segment":)" << quoted(action.segment->segment_id)
            << R"(,"sequence":)" << action.segment->sequence_number
            << R"(,"total_segments":)" << action.segment->total_segments;
    }
    oss << "}";
    emit(oss.str());
}

void PlanReporter::record_violation(const ConstraintViolation& violation) {
    std::ostringstream oss;
    oss << R"({"event":"violation")"
        << R"(,"type":)" << quoted(to_string(violation.type))
        << R"(,"severity":)" << quoted(to_string(violation.severity))
        << R"(,"subject":)" << quoted(violation.subject)
        << R"(,"action":)" << quoted(violation.first_action_id);
    if (violation.second_action_id) {
        oss << R"(,"other_action":)" << quoted(*violation.second_action_id);
    }
    if (violation.required_gap_sec && violation.actual_gap_sec) {
        oss << R"(,"required_gap_sec":)" << *violation.required_gap_sec
            << R"(,"actual_gap_sec":)" << *violation.actual_gap_sec;
    }
    oss << R"(,"msg":)" << quoted(violation.message) << "}";
    emit(oss.str());
}

void PlanReporter::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":)" << quoted(event)
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void PlanReporter::record_plan(const MissionPlan& plan) {
    record_search(plan.solution.search, plan.solution.objective);
    for (const auto& a : plan.imaging) record_imaging(a);
    for (const auto& u : plan.uplinks) record_uplink(u);
    for (const auto& p : plan.downlinks) {
        for (const auto& a : p.actions) record_downlink(a, p.plan_id);
    }
    for (const auto& v : plan.report.violations) record_violation(v);

    std::ostringstream oss;
    oss << R"({"event":"plan_summary")"
        << R"(,"feasible":)" << (plan.feasible() ? "true" : "false")
        << R"(,"imaging":)" << plan.imaging.size()
        << R"(,"uplinks":)" << plan.uplinks.size()
        << R"(,"downlink_plans":)" << plan.downlinks.size()
        << R"(,"errors":)" << plan.report.error_count()
        << R"(,"warnings":)" << plan.report.warning_count()
        << R"(,"scheduling_failures":)" << plan.scheduling_failures.size()
        << "}";
    emit(oss.str());
}

void PlanReporter::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void PlanReporter::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace constellation_planner
