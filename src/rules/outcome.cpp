#include "dqv/rules/outcome.h"

#include <array>
#include <utility>

namespace dqv::rules {

namespace {

constexpr std::array<std::pair<FailureReason, std::string_view>, 10> kReasonNames = {{
    {FailureReason::kNone, "none"},
    {FailureReason::kNullValue, "null value"},
    {FailureReason::kOutOfRange, "out of range"},
    {FailureReason::kNotComparable, "not comparable"},
    {FailureReason::kPatternMismatch, "pattern mismatch"},
    {FailureReason::kNotString, "not a string"},
    {FailureReason::kDuplicateKey, "duplicate key"},
    {FailureReason::kMissingReference, "missing reference"},
    {FailureReason::kPredicateRejected, "predicate rejected"},
    {FailureReason::kEvaluationError, "evaluation error"},
}};

}  // namespace

std::string_view to_string(const OutcomeStatus status) noexcept {
  switch (status) {
    case OutcomeStatus::kPassed:
      return "passed";
    case OutcomeStatus::kFailed:
      return "failed";
    case OutcomeStatus::kError:
      return "error";
  }
  return "unknown";
}

std::string_view to_string(const FailureReason reason) noexcept {
  for (const auto& [value, name] : kReasonNames) {
    if (value == reason) {
      return name;
    }
  }
  return "unknown";
}

std::optional<OutcomeStatus> parse_outcome_status(const std::string_view text) noexcept {
  if (text == "passed") {
    return OutcomeStatus::kPassed;
  }
  if (text == "failed") {
    return OutcomeStatus::kFailed;
  }
  if (text == "error") {
    return OutcomeStatus::kError;
  }
  return std::nullopt;
}

std::optional<FailureReason> parse_failure_reason(const std::string_view text) noexcept {
  for (const auto& [value, name] : kReasonNames) {
    if (name == text) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace dqv::rules
