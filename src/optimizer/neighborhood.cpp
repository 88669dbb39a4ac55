/**
 * @file neighborhood.cpp
 * @brief Neighborhood operator implementations.
 * @author ConstellationPlanner contributors
 */

#include "optimizer/neighborhood.hpp"

#include <utility>

namespace constellation_planner {

namespace {

size_t random_index(size_t bound, std::mt19937& rng) {
    std::uniform_int_distribution<size_t> dist(0, bound - 1);
    return dist(rng);
}

/// Two distinct row indices; requires at least two rows.
std::pair<size_t, size_t> random_pair(size_t rows, std::mt19937& rng) {
    size_t first = random_index(rows, rng);
    size_t second = random_index(rows - 1, rng);
    if (second >= first) ++second;
    return {first, second};
}

}  // anonymous namespace

Encoding MoveOperator::apply(const Encoding& source, std::mt19937& rng) const {
    Encoding neighbor = source;
    if (neighbor.empty()) return neighbor;

    size_t task = random_index(neighbor.task_count(), rng);
    size_t column = random_index(kEncodingColumns, rng);
    std::uniform_real_distribution<double> value(0.0, 1.0);
    neighbor.set(task, column, value(rng));
    return neighbor;
}

Encoding SamePositionExchangeOperator::apply(const Encoding& source, std::mt19937& rng) const {
    Encoding neighbor = source;
    if (neighbor.task_count() < 2) return neighbor;

    auto [a, b] = random_pair(neighbor.task_count(), rng);
    size_t column = random_index(kEncodingColumns, rng);
    neighbor.swap_cells(a, column, b, column);
    return neighbor;
}

Encoding RandomExchangeOperator::apply(const Encoding& source, std::mt19937& rng) const {
    Encoding neighbor = source;
    if (neighbor.task_count() < 2) return neighbor;

    auto [a, b] = random_pair(neighbor.task_count(), rng);
    size_t column_a = random_index(kEncodingColumns, rng);
    size_t column_b = random_index(kEncodingColumns, rng);
    neighbor.swap_cells(a, column_a, b, column_b);
    return neighbor;
}

Encoding WholeRowExchangeOperator::apply(const Encoding& source, std::mt19937& rng) const {
    Encoding neighbor = source;
    if (neighbor.task_count() < 2) return neighbor;

    auto [a, b] = random_pair(neighbor.task_count(), rng);
    neighbor.swap_rows(a, b);
    return neighbor;
}

// ─────────────────────────────────────────────
// NeighborhoodOperatorSet
// ─────────────────────────────────────────────

NeighborhoodOperatorSet::NeighborhoodOperatorSet() {
    operators_.push_back(std::make_unique<MoveOperator>());
    operators_.push_back(std::make_unique<SamePositionExchangeOperator>());
    operators_.push_back(std::make_unique<RandomExchangeOperator>());
    operators_.push_back(std::make_unique<WholeRowExchangeOperator>());
}

NeighborhoodOperatorSet::Neighbor NeighborhoodOperatorSet::generate(
    const Encoding& source, std::mt19937& rng) const {
    const auto& op = *operators_[random_index(operators_.size(), rng)];
    return Neighbor{.encoding = op.apply(source, rng), .operator_name = op.name()};
}

}  // namespace constellation_planner
