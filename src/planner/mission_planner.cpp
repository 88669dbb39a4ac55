/**
 * @file mission_planner.cpp
 * @brief MissionPlanner implementation.
 * @author ConstellationPlanner contributors
 */

#include "planner/mission_planner.hpp"

#include <algorithm>
#include <format>
#include <memory>

namespace constellation_planner {

namespace {

struct DecodedTask {
    size_t task_index;
    int downlink_index;     ///< 1-based into the task's downlink opportunities
    ImagingAction action;
};

/// Parts of @p window not covered by any of @p busy.
std::vector<TimeWindow> free_pieces(const TimeWindow& window, std::vector<TimeWindow> busy) {
    std::sort(busy.begin(), busy.end(),
        [](const TimeWindow& a, const TimeWindow& b) { return a.start < b.start; });

    std::vector<TimeWindow> pieces;
    Timestamp cursor = window.start;
    for (const auto& b : busy) {
        if (b.end <= cursor) continue;
        if (b.start >= window.end) break;
        if (b.start > cursor) pieces.push_back(TimeWindow{cursor, b.start});
        cursor = std::max(cursor, b.end);
    }
    if (cursor < window.end) pieces.push_back(TimeWindow{cursor, window.end});
    return pieces;
}

std::vector<SatelliteId> satellite_ids(const PlanningProblem& problem) {
    std::vector<SatelliteId> ids;
    ids.reserve(problem.satellites.size());
    for (const auto& s : problem.satellites) ids.push_back(s.id);
    return ids;
}

std::vector<DecodedTask> decode_tasks(const PlanningProblem& problem, const Encoding& encoding,
                                      const AwcsatConfig& awcsat) {
    const auto sats = satellite_ids(problem);
    std::vector<DecodedTask> decoded;

    const size_t rows = std::min(problem.tasks.size(), encoding.task_count());
    for (size_t i = 0; i < rows; ++i) {
        const auto& task = problem.tasks[i];
        const auto& row = encoding.row(i);

        const int n_img = task.imaging_opportunity_count();
        const int n_dl = task.downlink_opportunity_count();
        const int img = decode_opportunity(row[kImagingColumn], n_img);
        const int dl = decode_opportunity(row[kDownlinkColumn], n_dl);
        if (img < 1 || img > n_img || dl < 1 || dl > n_dl) continue;

        const auto& opportunity = task.imaging_opportunities[static_cast<size_t>(img - 1)];
        const auto satellite = resolve_satellite(task, row, sats);
        if (!satellite || *satellite != opportunity.satellite_id) continue;

        const double rate = decode_extension_rate(row[kExtensionColumn], awcsat.r_max, awcsat.r_min);
        const double duration = std::min(task.imaging_duration_sec * (1.0 + rate),
                                         opportunity.window.duration_sec());
        if (duration <= 0.0) continue;

        decoded.push_back(DecodedTask{
            .task_index = i,
            .downlink_index = dl,
            .action = ImagingAction{
                .id = std::format("IMG_{:04d}", decoded.size() + 1),
                .satellite_id = *satellite,
                .target_id = task.target_id,
                .task_id = task.id,
                .start = opportunity.window.start,
                .end = add_seconds(opportunity.window.start, duration),
                .extension_rate = rate,
            },
        });
    }
    return decoded;
}

bool same_access(const AccessWindow& a, const AccessWindow& b) {
    return a.station_id == b.station_id && a.antenna_id == b.antenna_id && a.window == b.window;
}

}  // anonymous namespace

std::vector<DownlinkAction> MissionPlan::downlink_actions() const {
    std::vector<DownlinkAction> actions;
    for (const auto& p : downlinks) {
        actions.insert(actions.end(), p.actions.begin(), p.actions.end());
    }
    return actions;
}

MissionPlanner::MissionPlanner(Config config, Logger* logger)
    : MissionPlanner(config, ttc_stations_from_config(config.stations), logger) {}

MissionPlanner::MissionPlanner(Config config, std::vector<TtcStation> stations, Logger* logger)
    : config_(std::move(config))
    , logger_(logger)
    , scheduler_(std::move(stations), logger)
    , downlink_planner_(scheduler_, config_.downlink, logger, config_.transition)
    , validator_(config_.transition, config_.planner.min_uplink_gap_sec) {}

// ─────────────────────────────────────────────
// Objective and decoding
// ─────────────────────────────────────────────

SatelliteTypeMap MissionPlanner::satellite_types(const PlanningProblem& problem) const {
    SatelliteTypeMap types;
    for (const auto& s : problem.satellites) types.emplace(s.id, s.type_id);
    return types;
}

const Satellite* MissionPlanner::find_satellite(const PlanningProblem& problem,
                                                std::string_view satellite_id) const {
    auto it = std::find_if(problem.satellites.begin(), problem.satellites.end(),
                           [satellite_id](const Satellite& s) { return s.id == satellite_id; });
    return it != problem.satellites.end() ? &*it : nullptr;
}

ObjectiveFunction MissionPlanner::make_objective(const PlanningProblem& problem) const {
    auto shared = std::make_shared<const PlanningProblem>(problem);
    return [shared, awcsat = config_.awcsat, weights = config_.objective,
            transition = validator_.transition(), types = satellite_types(problem)](const Encoding& enc) {
        const auto decoded = decode_tasks(*shared, enc, awcsat);

        double score = 0.0;
        std::vector<ImagingAction> imaging;
        imaging.reserve(decoded.size());
        for (const auto& d : decoded) {
            score += shared->tasks[d.task_index].priority +
                     weights.extension_reward * d.action.extension_rate;
            imaging.push_back(d.action);
        }

        const auto violations = transition.check_all(imaging, {}, types);
        const auto errors = std::count_if(violations.begin(), violations.end(),
            [](const ConstraintViolation& v) { return v.is_error(); });
        return score - weights.violation_penalty * static_cast<double>(errors);
    };
}

std::vector<ImagingAction> MissionPlanner::decode_imaging(const PlanningProblem& problem,
                                                          const Encoding& encoding) const {
    std::vector<ImagingAction> actions;
    for (auto& d : decode_tasks(problem, encoding, config_.awcsat)) {
        actions.push_back(std::move(d.action));
    }
    return actions;
}

// ─────────────────────────────────────────────
// Pipeline
// ─────────────────────────────────────────────

Result<MissionPlan> MissionPlanner::plan(const PlanningProblem& problem) {
    scheduler_.clear_schedule();
    downlink_planner_.clear_schedule();

    auto algorithm = make_planning_algorithm(config_.planner.algorithm, config_.awcsat,
                                             make_objective(problem), logger_);
    if (!algorithm) return algorithm.error().with_context("MissionPlanner");

    MissionPlan plan;
    const auto sats = satellite_ids(problem);
    plan.solution = (*algorithm)->solve(problem.tasks, sats);

    for (auto& d : decode_tasks(problem, plan.solution.encoding, config_.awcsat)) {
        plan.imaging.push_back(d.action);
    }

    schedule_uplinks(problem, plan);
    schedule_downlinks(problem, plan.solution.encoding, plan);

    ScheduleSnapshot snapshot{
        .imaging = plan.imaging,
        .uplinks = plan.uplinks,
        .downlinks = plan.downlink_actions(),
        .stations = scheduler_.stations(),
        .satellite_types = satellite_types(problem),
    };
    plan.report = validator_.validate(snapshot);

    plan.solution.feasible = plan.report.feasible();
    plan.solution.violations.clear();
    for (const auto& v : plan.report.violations) plan.solution.violations.push_back(v.message);

    if (logger_) {
        logger_->log(LogLevel::Info, "planner", std::format(
            "plan: tasks={} imaged={} uplinks={} downlink_plans={} failures={} errors={} warnings={} objective={:.3f}",
            problem.tasks.size(), plan.imaging.size(), plan.uplinks.size(), plan.downlinks.size(),
            plan.scheduling_failures.size(), plan.report.error_count(),
            plan.report.warning_count(), plan.solution.objective));
    }
    return plan;
}

void MissionPlanner::schedule_uplinks(const PlanningProblem& problem, MissionPlan& plan) {
    const auto requests = validator_.uplink().build_uplink_requests(
        plan.imaging, config_.planner.uplink_lead_hours);

    for (const auto& request : requests) {
        auto contacts = problem.contact_windows.find(request.satellite_id);
        if (contacts == problem.contact_windows.end() || contacts->second.empty()) {
            plan.scheduling_failures.push_back("No station contacts for uplink to " +
                                               request.satellite_id);
            continue;
        }
        auto uplink = scheduler_.schedule_uplink(request, contacts->second);
        if (uplink) {
            plan.uplinks.push_back(std::move(uplink).value());
        } else {
            plan.scheduling_failures.push_back(uplink.error().message);
        }
    }
}

void MissionPlanner::schedule_downlinks(const PlanningProblem& problem, const Encoding& encoding,
                                        MissionPlan& plan) {
    for (const auto& d : decode_tasks(problem, encoding, config_.awcsat)) {
        const auto& task = problem.tasks[d.task_index];
        const auto& imaging = d.action;

        const double volume = imaging.interval().duration_sec() * task.data_volume_gb_per_sec;
        if (volume <= kVolumeToleranceGb) continue;

        const Satellite* satellite = find_satellite(problem, imaging.satellite_id);
        const SatelliteTypeConfig* type =
            satellite ? find_satellite_type(satellite->type_id) : nullptr;
        const double settle = type ? type->imaging_to_downlink_time_sec
                                   : config_.transition.imaging_to_downlink_sec;
        const double switch_sec = type ? type->downlink_switch_time_sec
                                       : config_.transition.downlink_switch_sec;
        const Timestamp ready = add_seconds(imaging.end, settle);

        // Chosen opportunity first so its station is tried first.
        std::vector<AccessWindow> candidates;
        const auto chosen = static_cast<size_t>(d.downlink_index - 1);
        candidates.push_back(task.downlink_opportunities[chosen]);
        for (size_t i = 0; i < task.downlink_opportunities.size(); ++i) {
            if (i != chosen) candidates.push_back(task.downlink_opportunities[i]);
        }

        // Keep only this satellite's contacts when they are known.
        auto contacts = problem.contact_windows.find(imaging.satellite_id);
        if (contacts != problem.contact_windows.end() && !contacts->second.empty()) {
            std::vector<AccessWindow> own;
            for (const auto& c : candidates) {
                const bool listed = std::any_of(contacts->second.begin(), contacts->second.end(),
                    [&c](const AccessWindow& w) { return same_access(c, w); });
                if (listed) own.push_back(c);
            }
            candidates = own.empty() ? contacts->second : std::move(own);
        }

        // The satellite cannot transmit while imaging or settling, nor during
        // its earlier downlinks (plus the switch time when the station differs).
        std::vector<TimeWindow> settling;
        for (const auto& other : plan.imaging) {
            if (other.satellite_id != imaging.satellite_id) continue;
            settling.push_back(TimeWindow{other.start, add_seconds(other.end, settle)});
        }
        std::vector<const DownlinkAction*> earlier;
        for (const auto& p : plan.downlinks) {
            if (p.satellite_id != imaging.satellite_id) continue;
            for (const auto& a : p.actions) earlier.push_back(&a);
        }

        std::vector<AccessWindow> usable;
        for (const auto& c : candidates) {
            if (c.window.end <= ready) continue;
            std::vector<TimeWindow> busy = settling;
            for (const auto* a : earlier) {
                const double gap = a->station_id == c.station_id ? 0.0 : switch_sec;
                busy.push_back(TimeWindow{add_seconds(a->start, -gap), add_seconds(a->end, gap)});
            }
            for (const auto& piece : free_pieces(TimeWindow{std::max(c.window.start, ready),
                                                            c.window.end}, std::move(busy))) {
                AccessWindow w = c;
                w.window = piece;
                usable.push_back(std::move(w));
            }
        }
        if (usable.empty()) {
            plan.scheduling_failures.push_back("No downlink window after imaging for task " + task.id);
            continue;
        }

        auto downlink = downlink_planner_.plan_hybrid_downlink(imaging.satellite_id, task.id,
                                                               volume, usable, type);
        if (downlink) {
            plan.downlinks.push_back(std::move(downlink).value());
        } else {
            plan.scheduling_failures.push_back(downlink.error().message);
        }
    }
}

// ─────────────────────────────────────────────
// Problem construction from visibility
// ─────────────────────────────────────────────

Result<PlanningProblem> MissionPlanner::build_problem(IVisibilityProvider& provider,
                                                      std::span<const Satellite> satellites,
                                                      std::span<const TargetRequest> targets,
                                                      std::string_view start_iso,
                                                      std::string_view end_iso) const {
    PlanningProblem problem;
    problem.satellites.assign(satellites.begin(), satellites.end());

    for (const auto& satellite : satellites) {
        auto& contacts = problem.contact_windows[satellite.id];
        for (const auto& station : scheduler_.stations()) {
            auto passes = provider.compute_ground_station_access(satellite, station, start_iso, end_iso);
            if (!passes) return passes.error().with_context(provider.name());
            for (const auto& pass : *passes) {
                auto expanded = expand_to_antennas(pass, station);
                contacts.insert(contacts.end(), expanded.begin(), expanded.end());
            }
        }
        std::stable_sort(contacts.begin(), contacts.end(),
            [](const AccessWindow& a, const AccessWindow& b) { return a.window.start < b.window.start; });
    }

    for (const auto& target : targets) {
        PlanningTask task{
            .id = std::format("TASK_{:04d}", problem.tasks.size() + 1),
            .target_id = target.id,
            .priority = target.priority,
            .imaging_opportunities = {},
            .downlink_opportunities = {},
            .imaging_duration_sec = target.imaging_duration_sec,
            .data_volume_gb_per_sec = target.data_volume_gb_per_sec,
        };

        for (const auto& satellite : satellites) {
            auto access = provider.compute_access(satellite, target.latitude_deg,
                                                  target.longitude_deg, start_iso, end_iso);
            if (!access) return access.error().with_context(provider.name());
            if (access->empty()) continue;

            for (const auto& w : *access) {
                task.imaging_opportunities.push_back(ImagingOpportunity{
                    .satellite_id = w.satellite_id,
                    .window = w.window,
                    .off_nadir_deg = w.off_nadir_deg,
                    .elevation_deg = w.elevation_deg,
                });
            }
            const auto& contacts = problem.contact_windows[satellite.id];
            task.downlink_opportunities.insert(task.downlink_opportunities.end(),
                                               contacts.begin(), contacts.end());
        }
        problem.tasks.push_back(std::move(task));
    }

    if (logger_) {
        logger_->log(LogLevel::Info, "planner", std::format(
            "problem from {}: {} satellites, {} tasks", provider.name(),
            problem.satellites.size(), problem.tasks.size()));
    }
    return problem;
}

}  // namespace constellation_planner
