#include "dqv/rules/kinds/custom_rule.h"

namespace dqv::rules {

Verdict CustomRule::evaluate(const data::Record& record, const RuleContext& /*context*/) const {
  if (predicate_(record)) {
    return Verdict::pass();
  }

  std::string observed;
  for (const auto& column : columns()) {
    if (!observed.empty()) {
      observed += ",";
    }
    observed += data::value_to_string(record.get(column));
  }
  return Verdict::fail(FailureReason::kPredicateRejected, observed);
}

}  // namespace dqv::rules
