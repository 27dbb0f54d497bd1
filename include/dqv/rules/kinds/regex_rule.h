#pragma once

#include "dqv/rules/validation_rule.h"

#include <cstddef>
#include <regex>

namespace dqv::rules {

// Regex: the target value is a string fully matching params.pattern (ECMAScript grammar).
// Non-string values fail with "not a string".
// The pattern is compiled once at construction; std::regex_error propagates to the caller.
//
// The std::regex matcher recurses per input character, so strings longer than
// kMaxInputLength are not matched: evaluate() throws std::length_error and the record is
// tallied as a rule evaluation error.
class RegexRule final : public ValidationRule {
 public:
  static constexpr std::size_t kMaxInputLength = 4096;

  explicit RegexRule(RuleSpec spec);

  [[nodiscard]] Verdict evaluate(const data::Record& record,
                                 const RuleContext& context) const override;

 private:
  std::regex pattern_;
};

}  // namespace dqv::rules
