/**
 * @file neighborhood.hpp
 * @brief The four perturbation operators used by the inner loop.
 * @author ConstellationPlanner contributors
 *
 * Operators are stateless and draw all randomness from the caller's engine,
 * so a seeded optimizer run is reproducible. Every operator returns a fresh
 * copy and leaves its input untouched.
 */

#pragma once

#include "optimizer/encoding.hpp"

#include <memory>
#include <random>
#include <string_view>
#include <vector>

namespace constellation_planner {

class INeighborhoodOperator {
public:
    virtual ~INeighborhoodOperator() = default;
    [[nodiscard]] virtual Encoding apply(const Encoding& source, std::mt19937& rng) const = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// Re-draws one random cell.
class MoveOperator : public INeighborhoodOperator {
public:
    [[nodiscard]] Encoding apply(const Encoding& source, std::mt19937& rng) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "move"; }
};

/// Swaps one column between two distinct rows.
class SamePositionExchangeOperator : public INeighborhoodOperator {
public:
    [[nodiscard]] Encoding apply(const Encoding& source, std::mt19937& rng) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "same_position_exchange"; }
};

/// Swaps two cells of distinct rows, columns drawn independently.
class RandomExchangeOperator : public INeighborhoodOperator {
public:
    [[nodiscard]] Encoding apply(const Encoding& source, std::mt19937& rng) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "random_exchange"; }
};

/// Swaps two whole rows.
class WholeRowExchangeOperator : public INeighborhoodOperator {
public:
    [[nodiscard]] Encoding apply(const Encoding& source, std::mt19937& rng) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "whole_row_exchange"; }
};

/**
 * @brief Uniform selection over the four operators.
 */
class NeighborhoodOperatorSet {
public:
    struct Neighbor {
        Encoding encoding;
        std::string_view operator_name;
    };

    NeighborhoodOperatorSet();

    [[nodiscard]] Neighbor generate(const Encoding& source, std::mt19937& rng) const;

    [[nodiscard]] size_t size() const noexcept { return operators_.size(); }
    [[nodiscard]] const INeighborhoodOperator& at(size_t index) const { return *operators_.at(index); }

private:
    std::vector<std::unique_ptr<INeighborhoodOperator>> operators_;
};

}  // namespace constellation_planner
