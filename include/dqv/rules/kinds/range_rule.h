#pragma once

#include "dqv/rules/validation_rule.h"

namespace dqv::rules {

// Range: the target value is numeric and within [min, max].
// A missing bound is unbounded; params.inclusive == false makes both bounds exclusive.
// Booleans and strings fail as "not comparable".
class RangeRule final : public ValidationRule {
 public:
  explicit RangeRule(RuleSpec spec) : ValidationRule(std::move(spec)) {}

  [[nodiscard]] Verdict evaluate(const data::Record& record,
                                 const RuleContext& context) const override;

 private:
  [[nodiscard]] bool within_bounds(double value) const noexcept;
};

}  // namespace dqv::rules
