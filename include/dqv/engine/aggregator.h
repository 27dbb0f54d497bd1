#pragma once

#include "dqv/engine/partial_result.h"
#include "dqv/rules/outcome.h"
#include "dqv/rules/rule_set.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dqv::engine {

// RuleMetrics is one rule's dataset-wide result after the Unique second pass.
struct RuleMetrics {
  std::string rule_name;                       // NOLINT(readability-identifier-naming)
  std::uint64_t pass_count{0};                 // NOLINT(readability-identifier-naming)
  std::uint64_t fail_count{0};                 // NOLINT(readability-identifier-naming)
  std::uint64_t error_count{0};                // NOLINT(readability-identifier-naming)
  std::vector<rules::Outcome> failure_sample;  // ordered by (partition_index, sequence)
  std::vector<rules::Outcome> error_sample;    // ordered by (partition_index, sequence)
};

struct AggregatedMetrics {
  std::size_t partition_count{0};  // NOLINT(readability-identifier-naming)
  std::uint64_t record_count{0};   // NOLINT(readability-identifier-naming)
  std::vector<RuleMetrics> rules;  // rule set order
};

// Identity element of merge() for a rule set: zero counts, empty samples.
[[nodiscard]] PartialResult empty_partial_result(const rules::RuleSet& rule_set,
                                                 std::size_t sample_capacity);

// merge folds b into a. Counts and key observations are summed, samples are merged by
// position and truncated. Commutative and associative: any merge tree over the same
// partials yields the same result.
// Throws std::invalid_argument if a and b do not tally the same rules in the same order.
[[nodiscard]] PartialResult merge(PartialResult a, const PartialResult& b);

// finalize runs the Unique second pass over a fully merged result: every key observed
// more than once dataset-wide turns its provisional passes into failures.
[[nodiscard]] AggregatedMetrics finalize(PartialResult merged);

// aggregate = finalize(fold of merge over partials, starting from the identity).
[[nodiscard]] AggregatedMetrics aggregate(const rules::RuleSet& rule_set,
                                          std::size_t sample_capacity,
                                          const std::vector<PartialResult>& partials);

}  // namespace dqv::engine
