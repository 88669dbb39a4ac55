/**
 * @file test_validator.cpp
 * @brief Unit tests for whole-schedule validation.
 */

#include "constraints/validator.hpp"

#include <gtest/gtest.h>

using namespace constellation_planner;

namespace {

const Timestamp kEpoch{};

Timestamp at_sec(double seconds) { return add_seconds(kEpoch, seconds); }

ScheduleSnapshot snapshot_with_one_task() {
    ScheduleSnapshot snapshot;
    snapshot.stations = default_ttc_stations();
    snapshot.imaging.push_back(ImagingAction{
        .id = "IMG_0001", .satellite_id = "SAT01", .target_id = "TGT",
        .task_id = "TASK_0001", .start = at_sec(1000), .end = at_sec(1010)});
    snapshot.satellite_types = {{"SAT01", "HR_OPTICAL"}};
    return snapshot;
}

}  // namespace

TEST(ScheduleValidatorTest, MissingUplinkMakesPlanInfeasible) {
    ScheduleValidator validator(TransitionConfig{}, 60.0);
    auto report = validator.validate(snapshot_with_one_task());

    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.violations[0].type, ViolationType::MissingUplink);
    EXPECT_EQ(report.count(ViolationType::MissingUplink), 1u);
    EXPECT_EQ(report.error_count(), 1u);
    EXPECT_EQ(report.warning_count(), 0u);
    EXPECT_FALSE(report.feasible());
}

TEST(ScheduleValidatorTest, WarningsKeepPlanFeasible) {
    auto snapshot = snapshot_with_one_task();
    snapshot.uplinks.push_back(UplinkAction{
        .id = "UL_0001", .satellite_id = "SAT01", .station_id = "BJGS",
        .antenna_id = "BJGS_ANT01", .start = at_sec(960), .end = at_sec(966),
        .duration_sec = 6.0, .task_ids = {"TASK_0001"}});

    ScheduleValidator validator(TransitionConfig{}, 60.0);
    auto report = validator.validate(snapshot);
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.count(ViolationType::InsufficientUplinkGap), 1u);
    EXPECT_EQ(report.warning_count(), 1u);
    EXPECT_TRUE(report.feasible());
}

TEST(ScheduleValidatorTest, CleanScheduleHasNoViolations) {
    auto snapshot = snapshot_with_one_task();
    snapshot.uplinks.push_back(UplinkAction{
        .id = "UL_0001", .satellite_id = "SAT01", .station_id = "BJGS",
        .antenna_id = "BJGS_ANT01", .start = at_sec(100), .end = at_sec(106),
        .duration_sec = 6.0, .task_ids = {"TASK_0001"}});
    DownlinkAction dl;
    dl.id = "DL_0002";
    dl.satellite_id = "SAT01";
    dl.station_id = "BJGS";
    dl.antenna_id = "BJGS_ANT01";
    dl.antenna_ids = {"BJGS_ANT01"};
    dl.start = at_sec(1100);
    dl.end = at_sec(1150);
    snapshot.downlinks.push_back(dl);

    ScheduleValidator validator(TransitionConfig{}, 60.0);
    auto report = validator.validate(snapshot);
    EXPECT_TRUE(report.violations.empty());
    EXPECT_TRUE(report.feasible());
}

TEST(ScheduleValidatorTest, ViolationsComeInCheckOrder) {
    auto snapshot = snapshot_with_one_task();
    snapshot.imaging.push_back(ImagingAction{
        .id = "IMG_0002", .satellite_id = "SAT01", .target_id = "TGT",
        .task_id = "TASK_0002", .start = at_sec(1012), .end = at_sec(1020)});

    ScheduleValidator validator(TransitionConfig{}, 60.0);
    auto report = validator.validate(snapshot);
    ASSERT_EQ(report.violations.size(), 3u);
    EXPECT_EQ(report.violations[0].type, ViolationType::ImagingSwitch);
    EXPECT_EQ(report.violations[1].type, ViolationType::MissingUplink);
    EXPECT_EQ(report.violations[2].type, ViolationType::MissingUplink);
    EXPECT_EQ(report.error_count(), 3u);
}

TEST(ViolationTest, Names) {
    EXPECT_EQ(to_string(ViolationType::AntennaSwitchTime), "antenna_switch_time");
    EXPECT_EQ(to_string(ViolationType::InsufficientUplinkGap), "insufficient_uplink_gap");
    EXPECT_EQ(to_string(Severity::Warning), "warning");
}
