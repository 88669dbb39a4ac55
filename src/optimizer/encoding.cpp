/**
 * @file encoding.cpp
 * @brief Encoding storage, fingerprinting and decode rules.
 * @author ConstellationPlanner contributors
 */

#include "optimizer/encoding.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace constellation_planner {

namespace {

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;
constexpr double kFingerprintScale = 100.0;

/// Folds the eight little-endian bytes of @p value into @p hash.
uint64_t fnv1a_mix(uint64_t hash, int64_t value) noexcept {
    auto bits = static_cast<uint64_t>(value);
    for (int byte = 0; byte < 8; ++byte) {
        hash ^= (bits >> (byte * 8)) & 0xFFU;
        hash *= kFnvPrime;
    }
    return hash;
}

}  // anonymous namespace

Encoding::Encoding(size_t task_count)
    : rows_(task_count, EncodingRow{0.0, 0.0, 0.0}) {}

Encoding::Encoding(std::vector<EncodingRow> rows) : rows_(std::move(rows)) {
    for (auto& row : rows_) {
        for (auto& cell : row) cell = std::clamp(cell, 0.0, 1.0);
    }
}

Encoding Encoding::random(size_t task_count, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    std::vector<EncodingRow> rows(task_count);
    for (auto& row : rows) {
        for (auto& cell : row) cell = dist(rng);
    }
    return Encoding{std::move(rows)};
}

void Encoding::set(size_t task, size_t column, double value) {
    rows_.at(task).at(column) = std::clamp(value, 0.0, 1.0);
}

void Encoding::swap_cells(size_t task_a, size_t column_a, size_t task_b, size_t column_b) {
    std::swap(rows_.at(task_a).at(column_a), rows_.at(task_b).at(column_b));
}

void Encoding::swap_rows(size_t task_a, size_t task_b) {
    std::swap(rows_.at(task_a), rows_.at(task_b));
}

uint64_t Encoding::fingerprint() const noexcept {
    uint64_t hash = fnv1a_mix(kFnvOffsetBasis, static_cast<int64_t>(rows_.size()));
    for (const auto& row : rows_) {
        for (double cell : row) hash = fnv1a_mix(hash, std::llround(cell * kFingerprintScale));
    }
    return hash;
}

uint64_t fnv1a_64(const int64_t* values, size_t count) noexcept {
    uint64_t hash = kFnvOffsetBasis;
    for (size_t i = 0; i < count; ++i) hash = fnv1a_mix(hash, values[i]);
    return hash;
}

int decode_opportunity(double value, int count) noexcept {
    if (count <= 0) return 0;
    auto index = static_cast<int>(std::ceil(std::clamp(value, 0.0, 1.0) * count));
    return std::clamp(index, 0, count);
}

double decode_extension_rate(double value, double r_max, double r_min) noexcept {
    return r_max - std::clamp(value, 0.0, 1.0) * (r_max - r_min);
}

}  // namespace constellation_planner
