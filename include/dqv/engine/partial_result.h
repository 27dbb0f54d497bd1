#pragma once

#include "dqv/engine/bounded_sample.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace dqv::engine {

// KeyObservation is what one or more partitions saw of a Unique key.
// occurrences:        records carrying the key
// provisional_passes: records counted as passed because the key was not duplicated
//                     inside their own partition; they turn into failures if the key
//                     turns out to be duplicated dataset-wide
// provisional_sample: positions of those records, for the failure sample
struct KeyObservation {
  std::uint64_t occurrences{0};         // NOLINT(readability-identifier-naming)
  std::uint64_t provisional_passes{0};  // NOLINT(readability-identifier-naming)
  BoundedSample provisional_sample;     // NOLINT(readability-identifier-naming)
};

// RuleTally holds one rule's local counts and samples.
// key_observations is only populated for keyed (Unique) rules.
struct RuleTally {
  std::string rule_name;                                            // NOLINT(readability-identifier-naming)
  std::uint64_t pass_count{0};                                      // NOLINT(readability-identifier-naming)
  std::uint64_t fail_count{0};                                      // NOLINT(readability-identifier-naming)
  std::uint64_t error_count{0};                                     // NOLINT(readability-identifier-naming)
  BoundedSample failure_sample;                                     // NOLINT(readability-identifier-naming)
  BoundedSample error_sample;                                       // NOLINT(readability-identifier-naming)
  std::unordered_map<std::string, KeyObservation> key_observations;  // NOLINT(readability-identifier-naming)
};

// PartialResult is the output of one Partition Evaluator invocation, or of merging
// several. rules follows the rule set's evaluation order.
struct PartialResult {
  std::size_t partition_count{0};  // partitions folded into this result
  std::uint64_t record_count{0};   // NOLINT(readability-identifier-naming)
  std::vector<RuleTally> rules;    // NOLINT(readability-identifier-naming)
};

}  // namespace dqv::engine
