#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace dqv::rules {

enum class OutcomeStatus {
  kPassed,
  kFailed,  // data-quality failure
  kError,   // the rule itself failed to evaluate (RuleEvaluationError)
};

enum class FailureReason {
  kNone,
  kNullValue,
  kOutOfRange,
  kNotComparable,
  kPatternMismatch,
  kNotString,
  kDuplicateKey,
  kMissingReference,
  kPredicateRejected,
  kEvaluationError,
};

[[nodiscard]] std::string_view to_string(OutcomeStatus status) noexcept;
[[nodiscard]] std::string_view to_string(FailureReason reason) noexcept;
[[nodiscard]] std::optional<OutcomeStatus> parse_outcome_status(std::string_view text) noexcept;
[[nodiscard]] std::optional<FailureReason> parse_failure_reason(std::string_view text) noexcept;

// Verdict is what a rule returns for one record; the Partition Evaluator turns it into
// an Outcome by adding identity and position.
// key is set by keyed rules (Unique): a passing keyed verdict is provisional until the
// key's dataset-wide count is known.
struct Verdict {
  bool passed{true};                           // NOLINT(readability-identifier-naming)
  FailureReason reason{FailureReason::kNone};  // NOLINT(readability-identifier-naming)
  std::string observed_value;                  // NOLINT(readability-identifier-naming)
  std::optional<std::string> key;              // NOLINT(readability-identifier-naming)

  [[nodiscard]] static Verdict pass() { return Verdict{}; }
  [[nodiscard]] static Verdict fail(FailureReason reason, std::string observed_value) {
    return Verdict{false, reason, std::move(observed_value), std::nullopt};
  }
  [[nodiscard]] static Verdict keyed(std::string key, std::string observed_value) {
    return Verdict{true, FailureReason::kNone, std::move(observed_value), std::move(key)};
  }
};

// Outcome is the verdict of one rule applied to one record.
// (partition_index, sequence) locates the record: sequence is the record's position in
// its partition's iteration order. All sample orderings use this pair.
struct Outcome {
  std::string rule_name;                         // NOLINT(readability-identifier-naming)
  std::string record_id;                         // NOLINT(readability-identifier-naming)
  OutcomeStatus status{OutcomeStatus::kPassed};  // NOLINT(readability-identifier-naming)
  FailureReason reason{FailureReason::kNone};    // NOLINT(readability-identifier-naming)
  std::string observed_value;                    // NOLINT(readability-identifier-naming)
  std::string message;                           // NOLINT(readability-identifier-naming)
  std::size_t partition_index{0};                // NOLINT(readability-identifier-naming)
  std::uint64_t sequence{0};                     // NOLINT(readability-identifier-naming)
};

// Strict weak ordering by record position.
[[nodiscard]] inline bool position_less(const Outcome& a, const Outcome& b) noexcept {
  if (a.partition_index != b.partition_index) {
    return a.partition_index < b.partition_index;
  }
  return a.sequence < b.sequence;
}

}  // namespace dqv::rules
