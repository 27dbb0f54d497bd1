#pragma once

#include "dqv/data/record.h"
#include "dqv/engine/partial_result.h"
#include "dqv/reference/reference_lookup.h"
#include "dqv/rules/rule_set.h"

#include <cstddef>
#include <optional>
#include <stop_token>

namespace dqv::engine {

// PartitionEvaluator applies a RuleSet to one partition at a time.
//
// Every record yields exactly one outcome per rule: passed, failed, or error.
// Rules are isolated from each other: an exception thrown by a rule for one record
// becomes an error outcome and evaluation continues with the next record.
// Failures are sampled in partition-local order up to sample_capacity.
//
// Unique rules are evaluated in two phases. Here, a key seen more than once inside
// the partition fails every record carrying it; a key seen once is a provisional pass
// reported in RuleTally::key_observations for the Aggregator's cross-partition pass.
//
// The evaluator holds no mutable state; one instance may serve all worker threads.
class PartitionEvaluator {
 public:
  PartitionEvaluator(const rules::RuleSet& rule_set, const reference::ReferenceHandles& references,
                     std::size_t sample_capacity);

  // Returns nullopt when stop was requested before the partition finished.
  [[nodiscard]] std::optional<PartialResult> evaluate(const data::Partition& partition,
                                                      std::stop_token stop = {}) const;

 private:
  const rules::RuleSet& rule_set_;
  const reference::ReferenceHandles& references_;
  std::size_t sample_capacity_;
};

}  // namespace dqv::engine
