/**
 * @file main.cpp
 * @brief ConstellationPlanner command-line entry point.
 * @author ConstellationPlanner contributors
 *
 * Wires the modules into the planning pipeline:
 *   Config → Logger → Stations → Visibility → MissionPlanner → PlanReporter
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/time.hpp"
#include "core/types.hpp"
#include "planner/mission_planner.hpp"
#include "resources/satellite_type.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/plan_reporter.hpp"
#include "visibility/mock_provider.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace constellation_planner;

namespace {

constexpr std::string_view kDemoStart = "2025-01-01T00:00:00Z";

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║       ConstellationPlanner v1.0.0         ║
  ║   Imaging, Uplink and Downlink Planning   ║
  ║   for Earth-Observation Constellations    ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    std::optional<uint64_t> seed;
    bool demo_mode = false;
};

void print_usage() {
    std::cout << "Usage: constellation_planner [OPTIONS]\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --log-dir <path>   Log output directory (empty: stdout)\n"
              << "  --seed <n>         Override the optimizer seed\n"
              << "  --demo             Plan a built-in scenario from mock visibility, then exit\n"
              << "  --help, -h         Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            auto seed = parse_seed(argv[++i]);
            if (!seed) return seed.error();
            args.seed = *seed;
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{"unknown option '" + arg + "'"};
        }
    }
    return args;
}

std::vector<Satellite> demo_satellites() {
    return {
        {.id = "SAT01", .name = "Optical-1", .type_id = "UHR_OPTICAL"},
        {.id = "SAT02", .name = "Optical-2", .type_id = "HR_OPTICAL"},
        {.id = "SAT03", .name = "Radar-1", .type_id = "UHR_SAR"},
    };
}

std::vector<TargetRequest> demo_targets() {
    return {
        {.id = "TGT_BEIJING",   .latitude_deg = 39.90, .longitude_deg = 116.40, .priority = 3.0},
        {.id = "TGT_SHANGHAI",  .latitude_deg = 31.23, .longitude_deg = 121.47, .priority = 2.0},
        {.id = "TGT_URUMQI",    .latitude_deg = 43.83, .longitude_deg = 87.62,  .priority = 1.0},
        {.id = "TGT_LHASA",     .latitude_deg = 29.65, .longitude_deg = 91.11,  .priority = 2.0,
         .imaging_duration_sec = 20.0},
        {.id = "TGT_HARBIN",    .latitude_deg = 45.80, .longitude_deg = 126.53, .priority = 1.0,
         .data_volume_gb_per_sec = 0.2},
        {.id = "TGT_SANYA",     .latitude_deg = 18.25, .longitude_deg = 109.51, .priority = 1.5},
    };
}

/**
 * @brief Build a scenario from the mock provider, plan it and report.
 */
int run_demo(const Config& config, Logger& logger, PlanReporter& reporter) {
    logger.info("=== Demo Mode ===");

    auto start = parse_iso8601(kDemoStart);
    if (!start) {
        logger.error("Demo start time: " + start.error().message);
        return 1;
    }
    const auto end_iso = format_iso8601(add_seconds(*start, config.planner.horizon_hours * 3600.0));

    MissionPlanner planner(config, &logger);
    MockVisibilityProvider provider;

    const auto satellites = demo_satellites();
    const auto targets = demo_targets();
    auto problem = planner.build_problem(provider, satellites, targets, kDemoStart, end_iso);
    if (!problem) {
        logger.error("Scenario construction failed: " + problem.error().message);
        return 1;
    }

    auto plan = planner.plan(*problem);
    if (!plan) {
        logger.error("Planning failed: " + plan.error().message);
        return 1;
    }

    reporter.record_plan(*plan);
    reporter.flush();

    for (const auto& failure : plan->scheduling_failures) {
        logger.warn("Scheduling: " + failure);
    }
    const auto& stats = plan->solution.search.statistics;
    logger.info(std::format("Search: {} iterations, {} evaluations, stop={}, T0={:.3f}, best={:.3f}",
                            stats.iterations, stats.evaluations, to_string(stats.stop_reason),
                            stats.initial_temperature, plan->solution.objective));
    logger.info(std::format("Plan: {} imaging, {} uplinks, {} downlink plans, {} errors, {} warnings",
                            plan->imaging.size(), plan->uplinks.size(), plan->downlinks.size(),
                            plan->report.error_count(), plan->report.warning_count()));
    logger.info("=== Demo Complete ===");
    return plan->feasible() ? 0 : 3;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().message << std::endl;
        print_usage();
        return 2;
    }
    const auto& args = *args_result;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args.seed) config.awcsat.seed = *args.seed;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    const auto level = parse_log_level(config.telemetry.log_level);
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> report_sink;
    if (!config.telemetry.log_dir.empty()) {
        const auto max_bytes = megabytes(config.telemetry.max_file_size_mb);
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "constellation_planner",
                                                  max_bytes, config.telemetry.rotate_count);
        report_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "plan",
                                                     max_bytes, config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
        report_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), level ? *level : LogLevel::Info);
    PlanReporter reporter(std::move(report_sink));

    logger.info("ConstellationPlanner starting...");
    logger.info("Algorithm: " + config.planner.algorithm);
    logger.info(std::format("AWCSAT: K={} L0={} tenure={} q={} seed={}",
                            config.awcsat.outer_loops, config.awcsat.initial_inner_loops,
                            config.awcsat.tabu_tenure, config.awcsat.q, config.awcsat.seed));

    const auto stations = ttc_stations_from_config(config.stations);
    for (const auto& station : stations) {
        logger.info(std::format("Station {} ({}): {} antennas, max {:.0f} Mbps", station.id,
                                station.name, station.antennas.size(), station.max_data_rate_mbps()));
    }

    // ── Demo mode ────────────────────────────
    if (args.demo_mode) {
        const int rc = run_demo(config, logger, reporter);
        logger.flush();
        return rc;
    }

    logger.info("Configuration valid. Nothing to plan without --demo.");
    logger.flush();
    return 0;
}
