#include "dqv/rules/kinds/regex_rule.h"

#include <stdexcept>
#include <string>

namespace dqv::rules {

RegexRule::RegexRule(RuleSpec spec)
    : ValidationRule(std::move(spec)),
      pattern_(this->spec().params.pattern.value_or(""), std::regex::ECMAScript) {}

Verdict RegexRule::evaluate(const data::Record& record, const RuleContext& /*context*/) const {
  const auto& value = record.get(columns().front());
  if (data::is_null(value)) {
    return null_verdict();
  }

  const auto* text = data::as_string(value);
  if (text == nullptr) {
    return Verdict::fail(FailureReason::kNotString, data::value_to_string(value));
  }

  if (text->size() > kMaxInputLength) {
    throw std::length_error("value of " + std::to_string(text->size()) +
                            " characters exceeds the regex input limit of " +
                            std::to_string(kMaxInputLength));
  }

  if (!std::regex_match(*text, pattern_)) {
    return Verdict::fail(FailureReason::kPatternMismatch, *text);
  }
  return Verdict::pass();
}

}  // namespace dqv::rules
