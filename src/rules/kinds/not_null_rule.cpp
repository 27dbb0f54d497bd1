#include "dqv/rules/kinds/not_null_rule.h"

namespace dqv::rules {

Verdict NotNullRule::evaluate(const data::Record& record, const RuleContext& /*context*/) const {
  std::string null_columns;
  for (const auto& column : columns()) {
    if (!data::is_null(record.get(column))) {
      continue;
    }
    if (!null_columns.empty()) {
      null_columns += ",";
    }
    null_columns += column;
  }

  if (null_columns.empty()) {
    return Verdict::pass();
  }
  return Verdict::fail(FailureReason::kNullValue, null_columns);
}

}  // namespace dqv::rules
