#pragma once

#include "dqv/rules/validation_rule.h"

#include <string>

namespace dqv::rules {

// ReferentialIntegrity: the foreign-key value exists in the reference key set named by
// params.reference. The key set is looked up in the RuleContext; evaluate() throws
// std::logic_error when the engine did not resolve it.
class ReferentialIntegrityRule final : public ValidationRule {
 public:
  explicit ReferentialIntegrityRule(RuleSpec spec) : ValidationRule(std::move(spec)) {}

  [[nodiscard]] const std::string& reference_id() const { return *spec().params.reference; }

  [[nodiscard]] Verdict evaluate(const data::Record& record,
                                 const RuleContext& context) const override;
};

}  // namespace dqv::rules
