#pragma once

#include "dqv/rules/outcome.h"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

namespace dqv::engine {

// BoundedSample keeps at most `capacity` Outcomes: the ones with the smallest
// (partition_index, sequence) among everything offered or merged in.
// Contents are independent of offer order and of merge grouping, so merging
// partition samples in any order reproduces the same final sample.
// Outcomes are held sorted by position.
class BoundedSample {
 public:
  explicit BoundedSample(std::size_t capacity = 0) : capacity_(capacity) {}

  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  [[nodiscard]] std::size_t size() const noexcept { return outcomes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return outcomes_.empty(); }
  [[nodiscard]] const std::vector<rules::Outcome>& outcomes() const noexcept { return outcomes_; }

  void offer(rules::Outcome outcome) {
    if (capacity_ == 0) {
      return;
    }
    if (outcomes_.size() == capacity_ && !rules::position_less(outcome, outcomes_.back())) {
      return;
    }
    const auto at =
        std::upper_bound(outcomes_.begin(), outcomes_.end(), outcome, rules::position_less);
    outcomes_.insert(at, std::move(outcome));
    if (outcomes_.size() > capacity_) {
      outcomes_.pop_back();
    }
  }

  void merge(const BoundedSample& other) {
    std::vector<rules::Outcome> merged;
    merged.reserve(outcomes_.size() + other.outcomes_.size());
    std::merge(outcomes_.begin(), outcomes_.end(), other.outcomes_.begin(), other.outcomes_.end(),
               std::back_inserter(merged), rules::position_less);
    if (merged.size() > capacity_) {
      merged.resize(capacity_);
    }
    outcomes_ = std::move(merged);
  }

 private:
  std::size_t capacity_;
  std::vector<rules::Outcome> outcomes_;
};

}  // namespace dqv::engine
