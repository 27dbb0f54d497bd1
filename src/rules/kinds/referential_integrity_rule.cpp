#include "dqv/rules/kinds/referential_integrity_rule.h"

#include <stdexcept>

namespace dqv::rules {

Verdict ReferentialIntegrityRule::evaluate(const data::Record& record,
                                           const RuleContext& context) const {
  const auto& value = record.get(columns().front());
  if (data::is_null(value)) {
    return null_verdict();
  }

  const auto* lookup = context.reference(reference_id());
  if (lookup == nullptr) {
    throw std::logic_error("reference '" + reference_id() + "' was not resolved");
  }

  if (!lookup->contains(data::value_to_key(value))) {
    return Verdict::fail(FailureReason::kMissingReference, data::value_to_string(value));
  }
  return Verdict::pass();
}

}  // namespace dqv::rules
