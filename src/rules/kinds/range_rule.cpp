#include "dqv/rules/kinds/range_rule.h"

#include <cmath>

namespace dqv::rules {

bool RangeRule::within_bounds(const double value) const noexcept {
  const auto& params = spec().params;
  if (std::isnan(value)) {
    return false;
  }
  if (params.min.has_value()) {
    if (params.inclusive ? value < *params.min : value <= *params.min) {
      return false;
    }
  }
  if (params.max.has_value()) {
    if (params.inclusive ? value > *params.max : value >= *params.max) {
      return false;
    }
  }
  return true;
}

Verdict RangeRule::evaluate(const data::Record& record, const RuleContext& /*context*/) const {
  const auto& value = record.get(columns().front());
  if (data::is_null(value)) {
    return null_verdict();
  }

  const auto number = data::as_number(value);
  if (!number.has_value()) {
    return Verdict::fail(FailureReason::kNotComparable, data::value_to_string(value));
  }

  if (!within_bounds(*number)) {
    return Verdict::fail(FailureReason::kOutOfRange, data::value_to_string(value));
  }
  return Verdict::pass();
}

}  // namespace dqv::rules
