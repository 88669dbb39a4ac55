/**
 * @file bench_planner.cpp
 * @brief Performance benchmarks for the search, the antenna ledger and
 *        the full planning pipeline.
 *
 * Usage: ./bench_planner [--csv]
 */

#include "constraints/transition.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/time.hpp"
#include "optimizer/awcsat.hpp"
#include "optimizer/encoding.hpp"
#include "optimizer/neighborhood.hpp"
#include "planner/mission_planner.hpp"
#include "resources/ttc_station.hpp"
#include "scheduling/resource_ledger.hpp"
#include "telemetry/json_sink.hpp"
#include "visibility/mock_provider.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <format>
#include <iomanip>
#include <iostream>
#include <memory>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace constellation_planner;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{3}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

const Timestamp kEpoch = parse_iso8601("2025-01-01T00:00:00Z").value();

AwcsatConfig bench_awcsat(int outer, int inner) {
    AwcsatConfig c;
    c.outer_loops = outer;
    c.initial_inner_loops = inner;
    c.time_limit_sec = 60.0;
    return c;
}

std::vector<ImagingAction> imaging_strip(size_t count, const std::string& satellite) {
    std::vector<ImagingAction> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const double start = static_cast<double>(i) * 12.0;
        out.push_back(ImagingAction{
            .id = std::format("IMG_{:04d}", i + 1),
            .satellite_id = satellite,
            .target_id = "TGT",
            .task_id = std::format("TASK_{:04d}", i + 1),
            .start = add_seconds(kEpoch, start),
            .end = add_seconds(kEpoch, start + 10.0),
        });
    }
    return out;
}

// ─────────────────────────────────────────────
// Search
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_search() {
    std::vector<BenchResult> R;

    for (size_t rows : {10, 100, 1000}) {
        std::mt19937 rng(7);
        auto enc = Encoding::random(rows, rng);
        NeighborhoodOperatorSet ops;
        R.push_back(run_bench(std::format("neighbor_generate_{}", rows), "Search", 2000,
            [&]{ auto n = ops.generate(enc, rng); (void)n; }, std::format("{} rows", rows)));
    }

    {
        std::mt19937 rng(11);
        auto enc = Encoding::random(500, rng);
        R.push_back(run_bench("fingerprint_500", "Search", 2000,
            [&]{ auto f = enc.fingerprint(); (void)f; }, "500 rows"));
    }

    for (size_t tasks : {10, 50}) {
        R.push_back(run_bench(std::format("awcsat_optimize_{}_tasks", tasks), "Search", 10,
            [&]{
                AwcsatOptimizer opt(bench_awcsat(50, 20), {});
                auto result = opt.optimize(tasks);
                (void)result;
            }, "K=50 L0=20"));
    }
    return R;
}

// ─────────────────────────────────────────────
// Ledger and constraints
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_ledger() {
    std::vector<BenchResult> R;
    const auto stations = default_ttc_stations();

    R.push_back(run_bench("ledger_reserve_200", "Ledger", 50, [&]{
        ResourceLedger ledger(stations);
        for (int i = 0; i < 200; ++i) {
            const double start = i * 60.0;
            auto ok = ledger.reserve("BJGS_ANT01", ScheduleSlot{
                .start = add_seconds(kEpoch, start),
                .end = add_seconds(kEpoch, start + 30.0),
                .action_id = std::format("DL_{:04d}", i + 1),
                .kind = ActionKind::Downlink,
                .satellite_id = i % 2 ? "SAT01" : "SAT02",
            });
            (void)ok;
        }
    }, "alternating satellites"));

    {
        ResourceLedger ledger(stations);
        for (int i = 0; i < 500; ++i) {
            const double start = i * 60.0;
            auto ok = ledger.reserve("KSGS_ANT01", ScheduleSlot{
                .start = add_seconds(kEpoch, start),
                .end = add_seconds(kEpoch, start + 30.0),
                .action_id = std::format("DL_{:04d}", i + 1),
                .kind = ActionKind::Downlink,
                .satellite_id = "SAT01",
            });
            (void)ok;
        }
        const TimeWindow query{add_seconds(kEpoch, 15000.0), add_seconds(kEpoch, 15020.0)};
        R.push_back(run_bench("ledger_check_500_slots", "Ledger", 5000,
            [&]{ auto r = ledger.check("KSGS_ANT01", query, "SAT02"); (void)r; }, "500 slots"));
    }

    TransitionConstraint transition;
    for (size_t count : {100, 1000}) {
        auto imaging = imaging_strip(count, "SAT01");
        SatelliteTypeMap types{{"SAT01", "HR_OPTICAL"}};
        R.push_back(run_bench(std::format("transition_check_{}", count), "Constraints", 200,
            [&]{ auto v = transition.check_all(imaging, {}, types); (void)v; },
            std::format("{} imaging", count)));
    }
    return R;
}

// ─────────────────────────────────────────────
// Pipeline
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_pipeline() {
    std::vector<BenchResult> R;

    Config config = default_config();
    config.awcsat = bench_awcsat(30, 20);
    // Debug records are rendered and dropped, so formatting cost is included.
    Logger logger(std::make_unique<NullSink>(), LogLevel::Debug);
    MissionPlanner planner(config, &logger);
    MockVisibilityProvider provider;

    const std::vector<Satellite> satellites{
        {.id = "SAT01", .name = "sat 1", .type_id = "HR_OPTICAL"},
        {.id = "SAT02", .name = "sat 2", .type_id = "UHR_SAR"},
    };
    std::vector<TargetRequest> targets;
    for (int i = 0; i < 8; ++i) {
        targets.push_back(TargetRequest{
            .id = std::format("TGT_{:02d}", i + 1),
            .latitude_deg = 20.0 + 3.0 * i,
            .longitude_deg = 80.0 + 5.0 * i,
        });
    }

    R.push_back(run_bench("build_problem_2x8", "Pipeline", 20, [&]{
        auto p = planner.build_problem(provider, satellites, targets,
                                       "2025-01-01T00:00:00Z", "2025-01-02T00:00:00Z");
        (void)p;
    }, "2 satellites, 8 targets"));

    auto problem = planner.build_problem(provider, satellites, targets,
                                         "2025-01-01T00:00:00Z", "2025-01-02T00:00:00Z");
    if (problem) {
        R.push_back(run_bench("plan_2x8", "Pipeline", 5,
            [&]{ auto plan = planner.plan(*problem); (void)plan; }, "K=30 L0=20"));
    } else {
        std::cerr << "build_problem failed: " << problem.error().message << "\n";
    }
    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  Constellation Planner Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_search());
    append(bench_ledger());
    append(bench_pipeline());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
