#include "dqv/rules/kinds/unique_rule.h"

namespace dqv::rules {

std::string composite_key(const data::Record& record, const std::vector<std::string>& columns) {
  std::string key;
  for (const auto& column : columns) {
    const std::string part = data::value_to_key(record.get(column));
    key += std::to_string(part.size());
    key += ':';
    key += part;
  }
  return key;
}

Verdict UniqueRule::evaluate(const data::Record& record, const RuleContext& /*context*/) const {
  std::string observed;
  for (const auto& column : columns()) {
    const auto& value = record.get(column);
    if (data::is_null(value)) {
      return null_verdict();
    }
    if (!observed.empty()) {
      observed += ",";
    }
    observed += data::value_to_string(value);
  }

  return Verdict::keyed(composite_key(record, columns()), observed);
}

}  // namespace dqv::rules
