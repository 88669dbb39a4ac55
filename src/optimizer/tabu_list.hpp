/**
 * @file tabu_list.hpp
 * @brief Fixed-capacity FIFO of recently visited encoding fingerprints.
 * @author ConstellationPlanner contributors
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <stdexcept>
#include <unordered_set>

namespace constellation_planner {

/**
 * @brief Pushing onto a full list evicts the oldest fingerprint.
 *
 * The deque keeps insertion order for eviction; the multiset answers
 * membership in constant time.
 */
class TabuList {
public:
    explicit TabuList(size_t tenure) : tenure_(tenure) {
        if (tenure_ == 0) throw std::invalid_argument("tabu tenure must be positive");
    }

    void push(uint64_t fingerprint) {
        if (entries_.size() == tenure_) {
            index_.erase(index_.find(entries_.front()));
            entries_.pop_front();
        }
        entries_.push_back(fingerprint);
        index_.insert(fingerprint);
    }

    [[nodiscard]] bool contains(uint64_t fingerprint) const {
        return index_.contains(fingerprint);
    }

    void clear() noexcept {
        entries_.clear();
        index_.clear();
    }

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] size_t tenure() const noexcept { return tenure_; }

private:
    size_t tenure_;
    std::deque<uint64_t> entries_;
    std::unordered_multiset<uint64_t> index_;
};

}  // namespace constellation_planner
