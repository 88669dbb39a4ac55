/**
 * @file encoding.hpp
 * @brief Continuous task-to-opportunity encoding searched by the optimizer.
 * @author ConstellationPlanner contributors
 *
 * One row per task, three selectors in [0,1]:
 *   v1 → imaging opportunity, v2 → downlink opportunity, v3 → strip extension.
 * Encodings have value semantics; copies never share cells.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <vector>

namespace constellation_planner {

inline constexpr size_t kImagingColumn = 0;
inline constexpr size_t kDownlinkColumn = 1;
inline constexpr size_t kExtensionColumn = 2;
inline constexpr size_t kEncodingColumns = 3;

using EncodingRow = std::array<double, kEncodingColumns>;

class Encoding {
public:
    Encoding() = default;

    /// All-zero encoding (every task inactive).
    explicit Encoding(size_t task_count);
    explicit Encoding(std::vector<EncodingRow> rows);

    [[nodiscard]] static Encoding random(size_t task_count, std::mt19937& rng);

    [[nodiscard]] size_t task_count() const noexcept { return rows_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

    [[nodiscard]] const EncodingRow& row(size_t task) const { return rows_.at(task); }
    [[nodiscard]] const std::vector<EncodingRow>& rows() const noexcept { return rows_; }

    [[nodiscard]] double at(size_t task, size_t column) const { return rows_.at(task).at(column); }

    /// Values are clamped into [0,1].
    void set(size_t task, size_t column, double value);
    void swap_cells(size_t task_a, size_t column_a, size_t task_b, size_t column_b);
    void swap_rows(size_t task_a, size_t task_b);

    // Evaluation state
    [[nodiscard]] double objective() const noexcept { return objective_; }
    void set_objective(double value) noexcept { objective_ = value; }

    [[nodiscard]] bool feasible() const noexcept { return feasible_; }
    void set_feasible(bool value) noexcept { feasible_ = value; }

    [[nodiscard]] const std::vector<std::string>& violations() const noexcept { return violations_; }
    void set_violations(std::vector<std::string> violations) { violations_ = std::move(violations); }

    /// Stable hash of the cells rounded to two decimals.
    [[nodiscard]] uint64_t fingerprint() const noexcept;

    /// Cell-wise equality; evaluation state is ignored.
    [[nodiscard]] bool same_cells(const Encoding& other) const noexcept { return rows_ == other.rows_; }

private:
    std::vector<EncodingRow> rows_;
    double objective_ = 0.0;
    bool feasible_ = true;
    std::vector<std::string> violations_;
};

// ─────────────────────────────────────────────
// Decode rules
// ─────────────────────────────────────────────

/**
 * @brief Opportunity index = ceil(v × count), 1-indexed.
 *
 * Returns 0 ("inactive") when v is 0 or count ≤ 0.
 */
[[nodiscard]] int decode_opportunity(double value, int count) noexcept;

/// Strip extension rate = r_max − v × (r_max − r_min).
[[nodiscard]] double decode_extension_rate(double value, double r_max, double r_min) noexcept;

/// FNV-1a 64 over a sequence of 64-bit integers (little-endian byte order).
[[nodiscard]] uint64_t fnv1a_64(const int64_t* values, size_t count) noexcept;

}  // namespace constellation_planner
