/**
 * @file test_pipeline.cpp
 * @brief Integration tests running the full planning pipeline.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/time.hpp"
#include "planner/mission_planner.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/plan_reporter.hpp"
#include "visibility/mock_provider.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace constellation_planner;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines)
        : lines_(std::move(lines)) {}

    void write(std::string_view json_line) override { lines_->emplace_back(json_line); }
    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

Config fast_config() {
    Config config = default_config();
    config.awcsat.outer_loops = 20;
    config.awcsat.initial_inner_loops = 10;
    config.awcsat.initial_sample_size = 5;
    config.awcsat.time_limit_sec = 30.0;
    return config;
}

Timestamp at_sec(double seconds) {
    static const Timestamp base = parse_iso8601("2025-01-01T00:00:00Z").value();
    return add_seconds(base, seconds);
}

AccessWindow contact(double from_sec, double to_sec) {
    return AccessWindow{.station_id = "BJGS", .antenna_id = "BJGS_ANT01",
                        .window = {at_sec(from_sec), at_sec(to_sec)}, .rate_mbps = 1200.0};
}

/// One HR_OPTICAL satellite, one target, an early contact for commands and a later one for data.
PlanningProblem single_task_problem() {
    PlanningProblem problem;
    problem.satellites.push_back(Satellite{.id = "SAT01", .name = "sat", .type_id = "HR_OPTICAL"});

    PlanningTask task;
    task.id = "TASK_0001";
    task.target_id = "TGT_A";
    task.imaging_opportunities.push_back(ImagingOpportunity{
        .satellite_id = "SAT01", .window = {at_sec(1000), at_sec(1100)}});
    task.downlink_opportunities.push_back(contact(2000, 2600));
    problem.tasks.push_back(task);

    problem.contact_windows["SAT01"] = {contact(0, 600), contact(2000, 2600)};
    return problem;
}

AccessWindow contact_at(const std::string& antenna, double from_sec, double to_sec) {
    return AccessWindow{.station_id = antenna.substr(0, antenna.find('_')), .antenna_id = antenna,
                        .window = {at_sec(from_sec), at_sec(to_sec)}, .rate_mbps = 1000.0};
}

/// "TST" with 800 and 400 Mbps antennas, "OTH" with one 800 Mbps antenna.
std::vector<TtcStation> two_station_network() {
    TtcStation tst{.id = "TST", .name = "Test station"};
    tst.antennas.push_back(Antenna{.id = "TST_A1", .name = "a1", .station_id = "TST",
                                   .max_data_rate_mbps = 800.0});
    tst.antennas.push_back(Antenna{.id = "TST_A2", .name = "a2", .station_id = "TST",
                                   .max_data_rate_mbps = 400.0});
    TtcStation oth{.id = "OTH", .name = "Other station"};
    oth.antennas.push_back(Antenna{.id = "OTH_A1", .name = "o1", .station_id = "OTH",
                                   .max_data_rate_mbps = 800.0});
    return {tst, oth};
}

}  // namespace

// ═══════════════════════════════════════════════
// Hand-built problems
// ═══════════════════════════════════════════════

TEST(PipelineIntegration, SingleTaskIsFullyPlanned) {
    MissionPlanner planner(fast_config());
    auto plan = planner.plan(single_task_problem());
    ASSERT_TRUE(plan.has_value()) << plan.error().message;

    ASSERT_EQ(plan->imaging.size(), 1u);
    const auto& img = plan->imaging.front();
    EXPECT_EQ(img.id, "IMG_0001");
    EXPECT_EQ(img.satellite_id, "SAT01");
    EXPECT_EQ(img.start, at_sec(1000));
    EXPECT_GE(img.interval().duration_sec(), 10.0 - 1e-6);
    EXPECT_LE(img.interval().duration_sec(), 20.0 + 1e-6);

    ASSERT_EQ(plan->uplinks.size(), 1u);
    EXPECT_EQ(plan->uplinks.front().id, "UL_0001");
    EXPECT_TRUE(plan->uplinks.front().contains_task("TASK_0001"));
    EXPECT_LT(plan->uplinks.front().end, img.start);

    ASSERT_EQ(plan->downlinks.size(), 1u);
    const auto& downlink = plan->downlinks.front();
    EXPECT_TRUE(downlink.is_complete());
    EXPECT_NEAR(downlink.total_data_gb, img.interval().duration_sec() * 0.05, 1e-9);
    // HR_OPTICAL needs 10 s between imaging and downlink.
    ASSERT_TRUE(downlink.earliest_start().has_value());
    EXPECT_GE(*downlink.earliest_start(), at_sec(2000));

    EXPECT_TRUE(plan->scheduling_failures.empty());
    EXPECT_TRUE(plan->report.violations.empty());
    EXPECT_TRUE(plan->feasible());
    EXPECT_TRUE(plan->solution.feasible);
    EXPECT_EQ(plan->solution.assignments.at("TASK_0001"), "SAT01");
}

TEST(PipelineIntegration, MissingContactsLeaveUplinkUnplanned) {
    auto problem = single_task_problem();
    problem.contact_windows.clear();

    MissionPlanner planner(fast_config());
    auto plan = planner.plan(problem);
    ASSERT_TRUE(plan.has_value());

    EXPECT_TRUE(plan->uplinks.empty());
    ASSERT_FALSE(plan->scheduling_failures.empty());
    EXPECT_EQ(plan->scheduling_failures.front(), "No station contacts for uplink to SAT01");
    EXPECT_EQ(plan->report.count(ViolationType::MissingUplink), 1u);
    EXPECT_FALSE(plan->feasible());
    EXPECT_FALSE(plan->solution.violations.empty());
}

TEST(PipelineIntegration, UnknownAlgorithmIsError) {
    auto config = fast_config();
    config.planner.algorithm = "ga";
    MissionPlanner planner(config);
    auto plan = planner.plan(single_task_problem());
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().message.rfind("MissionPlanner", 0), 0u);
}

TEST(PipelineIntegration, PlanningTwiceRestartsIds) {
    MissionPlanner planner(fast_config());
    auto first = planner.plan(single_task_problem());
    auto second = planner.plan(single_task_problem());
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(second->uplinks.size(), 1u);
    EXPECT_EQ(second->uplinks.front().id, "UL_0001");
    EXPECT_TRUE(second->feasible());
}

TEST(PipelineIntegration, ObjectiveRewardsTasksAndPenalizesConflicts) {
    auto problem = single_task_problem();
    PlanningTask clash = problem.tasks.front();
    clash.id = "TASK_0002";
    clash.imaging_opportunities.front().window = {at_sec(1005), at_sec(1100)};
    problem.tasks.push_back(clash);

    MissionPlanner planner(fast_config());
    auto objective = planner.make_objective(problem);

    // Extension selector 1.0 decodes to the minimum rate (0), 0.0 to the maximum (1).
    Encoding one_task(std::vector<EncodingRow>{{1.0, 1.0, 0.0}, {0.0, 0.0, 0.0}});
    EXPECT_NEAR(objective(one_task), 1.0 + 0.1 * 1.0, 1e-9);

    Encoding none(2);
    EXPECT_DOUBLE_EQ(objective(none), 0.0);

    // [1000,1010] and [1005,1015] on one satellite: one imaging-switch error.
    Encoding both(std::vector<EncodingRow>{{1.0, 1.0, 1.0}, {1.0, 1.0, 1.0}});
    EXPECT_NEAR(objective(both), 2.0 - 10.0, 1e-9);
}

TEST(PipelineIntegration, SegmentedDownlinkAcrossOverlappingPassesIsFeasible) {
    auto config = fast_config();
    config.downlink.prefer_aggregation = false;
    MissionPlanner planner(config, two_station_network());

    PlanningProblem problem;
    problem.satellites.push_back(Satellite{.id = "SAT01", .name = "sat", .type_id = "CUSTOM"});

    // 8 to 16 GB depending on the extension; one TST pass carries about 6 GB.
    PlanningTask task;
    task.id = "TASK_0001";
    task.target_id = "TGT_A";
    task.data_volume_gb_per_sec = 0.8;
    task.imaging_opportunities.push_back(ImagingOpportunity{
        .satellite_id = "SAT01", .window = {at_sec(1000), at_sec(1100)}});
    // The TST pass seen through both antennas; the OTH pass opens before it closes.
    task.downlink_opportunities = {contact_at("TST_A1", 2000, 2062), contact_at("TST_A2", 2000, 2062),
                                   contact_at("OTH_A1", 2030, 2200)};
    problem.tasks.push_back(task);
    problem.contact_windows["SAT01"] = {contact_at("TST_A1", 0, 600)};
    for (const auto& w : task.downlink_opportunities) problem.contact_windows["SAT01"].push_back(w);

    auto plan = planner.plan(problem);
    ASSERT_TRUE(plan.has_value()) << plan.error().message;
    ASSERT_EQ(plan->imaging.size(), 1u);
    ASSERT_EQ(plan->downlinks.size(), 1u);

    const auto& downlink = plan->downlinks.front();
    EXPECT_TRUE(downlink.segmented);
    EXPECT_TRUE(downlink.is_complete());
    ASSERT_EQ(downlink.actions.size(), 2u);
    EXPECT_EQ(downlink.actions[0].antenna_id, "TST_A1");
    EXPECT_EQ(downlink.actions[1].station_id, "OTH");
    EXPECT_GE(seconds_between(downlink.actions[0].end, downlink.actions[1].start), 3.0 - 1e-9);

    EXPECT_TRUE(plan->scheduling_failures.empty());
    EXPECT_EQ(plan->report.count(ViolationType::DownlinkSwitch), 0u);
    EXPECT_TRUE(plan->feasible());
}

TEST(PipelineIntegration, DecodeImagingAppliesExtension) {
    auto problem = single_task_problem();
    MissionPlanner planner(fast_config());

    auto actions = planner.decode_imaging(
        problem, Encoding(std::vector<EncodingRow>{{0.5, 1.0, 0.0}}));
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_DOUBLE_EQ(actions[0].extension_rate, 1.0);
    EXPECT_NEAR(actions[0].interval().duration_sec(), 20.0, 1e-6);

    EXPECT_TRUE(planner.decode_imaging(
        problem, Encoding(std::vector<EncodingRow>{{0.5, 0.0, 0.0}})).empty());
}

// ═══════════════════════════════════════════════
// Mock visibility end to end
// ═══════════════════════════════════════════════

TEST(PipelineIntegration, MockVisibilityProblemPlansAndReports) {
    auto log_lines = std::make_shared<std::vector<std::string>>();
    Logger logger(std::make_unique<CaptureSink>(log_lines), LogLevel::Info);

    MissionPlanner planner(fast_config(), &logger);
    MockVisibilityProvider provider;

    const std::vector<Satellite> satellites{
        {.id = "SAT01", .name = "sat 1", .type_id = "UHR_OPTICAL"},
        {.id = "SAT02", .name = "sat 2", .type_id = "HR_OPTICAL"},
        {.id = "SAT03", .name = "sat 3", .type_id = "UHR_SAR"},
    };
    const std::vector<TargetRequest> targets{
        {.id = "BEIJING", .latitude_deg = 39.9, .longitude_deg = 116.4, .priority = 2.0},
        {.id = "SHANGHAI", .latitude_deg = 31.2, .longitude_deg = 121.5},
        {.id = "URUMQI", .latitude_deg = 43.8, .longitude_deg = 87.6},
    };

    auto problem = planner.build_problem(provider, satellites, targets,
                                         "2025-01-01T00:00:00Z", "2025-01-02T00:00:00Z");
    ASSERT_TRUE(problem.has_value()) << problem.error().message;
    ASSERT_EQ(problem->tasks.size(), 3u);
    EXPECT_EQ(problem->tasks[0].id, "TASK_0001");
    EXPECT_EQ(problem->tasks[0].target_id, "BEIJING");
    EXPECT_DOUBLE_EQ(problem->tasks[0].priority, 2.0);
    for (const auto& task : problem->tasks) {
        EXPECT_FALSE(task.imaging_opportunities.empty());
        EXPECT_FALSE(task.downlink_opportunities.empty());
    }
    for (const auto& sat : satellites) {
        const auto& contacts = problem->contact_windows.at(sat.id);
        ASSERT_FALSE(contacts.empty());
        EXPECT_TRUE(std::is_sorted(contacts.begin(), contacts.end(),
            [](const AccessWindow& a, const AccessWindow& b) { return a.window.start < b.window.start; }));
    }

    auto plan = planner.plan(*problem);
    ASSERT_TRUE(plan.has_value()) << plan.error().message;
    EXPECT_EQ(plan->solution.search.statistics.iterations, 20);
    EXPECT_FALSE(plan->imaging.empty());
    EXPECT_LE(plan->imaging.size(), problem->tasks.size());

    // Every imaged task has its commands uplinked or a recorded reason why not.
    EXPECT_GE(plan->uplinks.size() + plan->scheduling_failures.size(), 1u);
    for (const auto& dl : plan->downlink_actions()) {
        EXPECT_GT(dl.data_volume_gb, 0.0);
        EXPECT_LT(dl.start, dl.end);
    }

    // Downlinks planned from antenna-split passes never collide.
    EXPECT_EQ(plan->report.count(ViolationType::DownlinkSwitch), 0u);
    EXPECT_EQ(plan->report.count(ViolationType::ImagingToDownlink), 0u);
    EXPECT_EQ(plan->report.count(ViolationType::AntennaConflict), 0u);
    EXPECT_EQ(plan->report.count(ViolationType::AntennaSwitchTime), 0u);
    if (plan->report.count(ViolationType::ImagingSwitch) == 0 &&
        plan->report.count(ViolationType::MissingUplink) == 0 &&
        plan->report.count(ViolationType::InsufficientUplinkGap) == 0) {
        EXPECT_TRUE(plan->feasible());
    }

    auto report_lines = std::make_shared<std::vector<std::string>>();
    PlanReporter reporter(std::make_unique<CaptureSink>(report_lines));
    reporter.record_plan(*plan);
    ASSERT_FALSE(report_lines->empty());
    EXPECT_NE(report_lines->front().find("search_summary"), std::string::npos);
    EXPECT_NE(report_lines->back().find("plan_summary"), std::string::npos);

    const bool logged_summary = std::any_of(log_lines->begin(), log_lines->end(),
        [](const std::string& l) { return l.find(R"("component":"planner")") != std::string::npos; });
    EXPECT_TRUE(logged_summary);
}
