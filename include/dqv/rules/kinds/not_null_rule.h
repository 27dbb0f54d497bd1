#pragma once

#include "dqv/rules/validation_rule.h"

namespace dqv::rules {

// NotNull: every target column is present and not null.
// On failure the observed value lists the null columns.
class NotNullRule final : public ValidationRule {
 public:
  explicit NotNullRule(RuleSpec spec) : ValidationRule(std::move(spec)) {}

  [[nodiscard]] Verdict evaluate(const data::Record& record,
                                 const RuleContext& context) const override;
};

}  // namespace dqv::rules
