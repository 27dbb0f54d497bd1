#pragma once

#include "dqv/rules/validation_rule.h"

#include <string>

namespace dqv::rules {

// Unique: no other record in the whole dataset shares the composite key over the
// target columns.
//
// evaluate() only derives the key; duplicate detection is two-phase:
// - the Partition Evaluator counts keys within its partition
// - the Aggregator merges key counts across partitions and fails every record whose
//   key appears more than once dataset-wide
// A record with any null key column follows the null policy and is never keyed.
class UniqueRule final : public ValidationRule {
 public:
  explicit UniqueRule(RuleSpec spec) : ValidationRule(std::move(spec)) {}

  [[nodiscard]] bool is_keyed() const noexcept override { return true; }

  [[nodiscard]] Verdict evaluate(const data::Record& record,
                                 const RuleContext& context) const override;
};

// Composite key: each column's canonical key text, length-prefixed so that
// ("a,b", "c") and ("a", "b,c") never collide.
[[nodiscard]] std::string composite_key(const data::Record& record,
                                        const std::vector<std::string>& columns);

}  // namespace dqv::rules
