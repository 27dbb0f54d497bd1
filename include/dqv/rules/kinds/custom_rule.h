#pragma once

#include "dqv/rules/custom_predicate_registry.h"
#include "dqv/rules/validation_rule.h"

namespace dqv::rules {

// Custom: a registered predicate over the whole record. The null policy does not apply.
// Target columns are optional and only feed the observed value on failure.
class CustomRule final : public ValidationRule {
 public:
  CustomRule(RuleSpec spec, CustomPredicate predicate)
      : ValidationRule(std::move(spec)), predicate_(std::move(predicate)) {}

  [[nodiscard]] Verdict evaluate(const data::Record& record,
                                 const RuleContext& context) const override;

 private:
  CustomPredicate predicate_;
};

}  // namespace dqv::rules
