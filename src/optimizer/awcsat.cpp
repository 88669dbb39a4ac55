/**
 * @file awcsat.cpp
 * @brief AWCSAT optimizer: initialization, inner loop, wave cooling.
 * @author ConstellationPlanner contributors
 *
 * Acceptance (modified Metropolis):
 *   E_new ≥ E_old           → accept
 *   otherwise               → accept with p = exp((E_new − E_old) / (S·T))
 *   S = exp(−(E_avg − E_min) / T0), from the initial sample.
 *
 * A tabu hit is accepted only when it beats the global best (aspiration);
 * otherwise it is discarded without touching the tabu list.
 */

#include "optimizer/awcsat.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>
#include <numeric>
#include <stdexcept>

namespace constellation_planner {

namespace {

const AwcsatConfig& checked(const AwcsatConfig& config) {
    if (auto valid = validate_awcsat_config(config); !valid) {
        throw std::invalid_argument(valid.error().message);
    }
    return config;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Default objective
// ─────────────────────────────────────────────

ObjectiveFunction default_objective(std::vector<int> imaging_counts,
                                    std::vector<int> downlink_counts) {
    return [imaging = std::move(imaging_counts),
            downlink = std::move(downlink_counts)](const Encoding& enc) {
        double score = 0.0;
        for (size_t i = 0; i < enc.task_count(); ++i) {
            const int n_img = i < imaging.size() ? imaging[i] : 1;
            const int n_dl = i < downlink.size() ? downlink[i] : 1;
            const int img = decode_opportunity(enc.at(i, kImagingColumn), n_img);
            const int dl = decode_opportunity(enc.at(i, kDownlinkColumn), n_dl);
            if (img >= 1 && img <= n_img && dl >= 1 && dl <= n_dl) score += 1.0;
        }
        return score;
    };
}

// ─────────────────────────────────────────────
// Annealing schedule
// ─────────────────────────────────────────────

double initial_temperature(double delta_e, double q, double fallback) noexcept {
    if (delta_e > 0.0 && q > 0.0 && q < 1.0) {
        return -delta_e / std::log(q);
    }
    return fallback;
}

double acceptance_scale(double e_avg, double e_min, double t0) noexcept {
    if (t0 <= 0.0) return 1.0;
    return std::exp(-(e_avg - e_min) / t0);
}

double acceptance_probability(double e_new, double e_old,
                              double scale, double temperature) noexcept {
    if (e_new >= e_old) return 1.0;
    const double denom = scale * temperature;
    if (denom <= 0.0 || !std::isfinite(denom)) return 0.0;
    return std::exp((e_new - e_old) / denom);
}

double next_temperature(const CoolingInputs& in, double floor) noexcept {
    const double K = static_cast<double>(in.outer_loops);
    const double k = static_cast<double>(in.k);

    const double decay = (in.t0 * (K - k) / K) / (in.c * k + 1.0);

    double wave = 1.0;
    if (in.n * in.t0 > 0.0) {
        const double c = std::cos(static_cast<double>(in.accepted) / (in.n * in.t0));
        wave = c * c;
    }
    const double reheat = (static_cast<double>(in.inner_loops) /
                           (1.0 + static_cast<double>(in.improved))) * wave;

    const double t = decay + reheat;
    if (!std::isfinite(t)) return floor;
    return std::max(t, floor);
}

int adapt_inner_loops(int current, int initial, uint64_t improved) noexcept {
    const double ratio = static_cast<double>(improved) / static_cast<double>(std::max(current, 1));
    if (ratio < 0.1) {
        return std::min(static_cast<int>(current * 1.1), initial * 2);
    }
    if (ratio > 0.5) {
        return std::max(static_cast<int>(current * 0.9), initial / 2);
    }
    return current;
}

// ─────────────────────────────────────────────
// AwcsatOptimizer
// ─────────────────────────────────────────────

AwcsatOptimizer::AwcsatOptimizer(AwcsatConfig config, ObjectiveFunction objective, Logger* logger)
    : config_(checked(config))
    , objective_(objective ? std::move(objective) : default_objective())
    , logger_(logger)
    , tabu_(static_cast<size_t>(config_.tabu_tenure))
    , rng_(static_cast<std::mt19937::result_type>(config_.seed))
    , inner_loops_(config_.initial_inner_loops) {}

AwcsatResult AwcsatOptimizer::optimize(size_t task_count) {
    const auto started = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    };

    if (task_count == 0) {
        stats_ = AwcsatStatistics{};
        stats_.stop_reason = StopReason::NoTasks;
        if (logger_) logger_->log(LogLevel::Info, "awcsat", "no tasks, search skipped");
        return AwcsatResult{.best = Encoding{}, .history = {}, .temperatures = {},
                            .statistics = stats_};
    }

    initialize(task_count);
    if (logger_) {
        logger_->log(LogLevel::Info, "awcsat", std::format(
            "start tasks={} K={} L0={} T0={:.4f} best={:.4f}",
            task_count, config_.outer_loops, config_.initial_inner_loops, t0_, best_.objective()));
    }

    stats_.stop_reason = StopReason::Completed;
    for (int k = 0; k < config_.outer_loops; ++k) {
        if (elapsed() >= config_.time_limit_sec) {
            stats_.stop_reason = StopReason::TimeLimit;
            break;
        }
        run_outer_iteration(k);
    }

    stats_.elapsed_sec = elapsed();
    stats_.final_temperature = temperature_;
    stats_.final_inner_loops = inner_loops_;

    if (logger_) {
        logger_->log(LogLevel::Info, "awcsat", std::format(
            "finish reason={} iterations={} best={:.4f} accepted={} improved={} elapsed={:.3f}s",
            to_string(stats_.stop_reason), stats_.iterations, best_.objective(),
            stats_.accepted, stats_.improved, stats_.elapsed_sec));
    }

    return AwcsatResult{.best = best_, .history = history_, .temperatures = temperatures_,
                        .statistics = stats_};
}

void AwcsatOptimizer::initialize(size_t task_count) {
    rng_.seed(static_cast<std::mt19937::result_type>(config_.seed));
    tabu_.clear();
    history_.clear();
    temperatures_.clear();
    stats_ = AwcsatStatistics{};
    inner_loops_ = config_.initial_inner_loops;

    std::vector<Encoding> sample;
    sample.reserve(static_cast<size_t>(config_.initial_sample_size));
    for (int i = 0; i < config_.initial_sample_size; ++i) {
        sample.push_back(Encoding::random(task_count, rng_));
        evaluate(sample.back());
    }

    auto by_objective = [](const Encoding& a, const Encoding& b) {
        return a.objective() < b.objective();
    };
    const auto [lowest, highest] = std::minmax_element(sample.begin(), sample.end(), by_objective);

    const double e_min = lowest->objective();
    const double e_max = highest->objective();
    const double e_avg = std::accumulate(sample.begin(), sample.end(), 0.0,
        [](double acc, const Encoding& e) { return acc + e.objective(); }) /
        static_cast<double>(sample.size());

    t0_ = initial_temperature(e_max - e_min, config_.q, config_.default_temperature);
    temperature_ = t0_;
    scale_ = acceptance_scale(e_avg, e_min, t0_);

    stats_.delta_e = e_max - e_min;
    stats_.e_avg = e_avg;
    stats_.e_min = e_min;
    stats_.initial_temperature = t0_;
    stats_.final_temperature = t0_;

    // max_element keeps the first of equal maxima.
    current_ = *std::max_element(sample.begin(), sample.end(), by_objective);
    best_ = current_;
}

void AwcsatOptimizer::run_outer_iteration(int k) {
    iteration_improved_ = 0;
    iteration_accepted_ = 0;

    for (int step = 0; step < inner_loops_; ++step) {
        auto neighbor = operators_.generate(current_, rng_);
        consider(std::move(neighbor.encoding));
    }

    const int finished_loops = inner_loops_;
    temperature_ = next_temperature(CoolingInputs{
        .t0 = t0_,
        .k = k,
        .outer_loops = config_.outer_loops,
        .c = config_.c,
        .n = config_.n,
        .inner_loops = finished_loops,
        .improved = iteration_improved_,
        .accepted = iteration_accepted_,
    }, config_.temperature_floor);

    if (k + 1 < config_.outer_loops) {
        inner_loops_ = adapt_inner_loops(inner_loops_, config_.initial_inner_loops,
                                         iteration_improved_);
    }

    stats_.iterations = k + 1;
    stats_.final_temperature = temperature_;
    history_.push_back(best_.objective());
    temperatures_.push_back(temperature_);

    if (logger_ && logger_->enabled(LogLevel::Debug)) {
        logger_->log(LogLevel::Debug, "awcsat", std::format(
            "k={} L={} G={} J={} T={:.6g} best={:.4f}",
            k, finished_loops, iteration_improved_, iteration_accepted_,
            temperature_, best_.objective()));
    }
}

MoveOutcome AwcsatOptimizer::consider(Encoding neighbor) {
    evaluate(neighbor);
    const uint64_t fingerprint = neighbor.fingerprint();

    if (tabu_.contains(fingerprint)) {
        if (neighbor.objective() > best_.objective()) {
            ++stats_.aspiration_accepts;
            accept(std::move(neighbor));
            return MoveOutcome::AspirationAccepted;
        }
        ++stats_.tabu_rejections;
        return MoveOutcome::TabuRejected;
    }

    tabu_.push(fingerprint);

    const double p = acceptance_probability(neighbor.objective(), current_.objective(),
                                            scale_, temperature_);
    bool take = p >= 1.0;
    if (!take && p > 0.0) {
        std::uniform_real_distribution<double> coin(0.0, 1.0);
        take = coin(rng_) < p;
    }
    if (!take) return MoveOutcome::Rejected;

    accept(std::move(neighbor));
    return MoveOutcome::Accepted;
}

double AwcsatOptimizer::evaluate(Encoding& encoding) {
    const double value = objective_(encoding);
    encoding.set_objective(std::isfinite(value) ? value : 0.0);
    ++stats_.evaluations;
    return encoding.objective();
}

void AwcsatOptimizer::accept(Encoding neighbor) {
    if (neighbor.objective() > current_.objective()) {
        ++iteration_improved_;
        ++stats_.improved;
    }
    ++iteration_accepted_;
    ++stats_.accepted;

    current_ = std::move(neighbor);
    if (current_.objective() > best_.objective()) {
        best_ = current_;
    }
}

}  // namespace constellation_planner
