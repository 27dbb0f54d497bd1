#pragma once

#include "dqv/data/record.h"
#include "dqv/reference/reference_lookup.h"
#include "dqv/rules/outcome.h"
#include "dqv/rules/rule_spec.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dqv::rules {

// RuleContext carries the explicit dependencies a rule may need beyond the record.
// Only ReferentialIntegrity rules read it today.
struct RuleContext {
  const reference::ReferenceHandles& references;  // NOLINT(readability-identifier-naming)

  // Returns the resolved lookup for reference_id, or nullptr when it was not resolved.
  [[nodiscard]] const reference::IReferenceLookup* reference(const std::string& reference_id) const;
};

// ValidationRule is the abstract base class for all rule kinds.
// Each kind is a flat final subclass; the engine only ever calls evaluate().
//
// Contract for evaluate():
// - pure and deterministic given (record, context); safe to call concurrently
// - returns exactly one Verdict per record so pass/fail counts stay exact
// - may throw; the Partition Evaluator records a thrown exception as an Error outcome
class ValidationRule {
 public:
  virtual ~ValidationRule() = default;

  [[nodiscard]] const RuleSpec& spec() const noexcept { return spec_; }
  [[nodiscard]] std::string_view name() const noexcept { return spec_.name; }
  [[nodiscard]] RuleKind kind() const noexcept { return spec_.kind; }
  [[nodiscard]] Severity severity() const noexcept { return spec_.severity; }
  [[nodiscard]] const std::vector<std::string>& columns() const noexcept { return spec_.columns; }

  // Keyed rules return Verdict::keyed(); their passes are resolved by aggregation.
  [[nodiscard]] virtual bool is_keyed() const noexcept { return false; }

  [[nodiscard]] virtual Verdict evaluate(const data::Record& record,
                                         const RuleContext& context) const = 0;

 protected:
  explicit ValidationRule(RuleSpec spec) : spec_(std::move(spec)) {}

  ValidationRule(const ValidationRule&) = default;
  ValidationRule& operator=(const ValidationRule&) = default;
  ValidationRule(ValidationRule&&) = default;
  ValidationRule& operator=(ValidationRule&&) = default;

  // Verdict for a null target value under this rule's null policy.
  [[nodiscard]] Verdict null_verdict() const {
    return spec_.null_policy == NullPolicy::kExempt
               ? Verdict::pass()
               : Verdict::fail(FailureReason::kNullValue, "null");
  }

 private:
  RuleSpec spec_;
};

}  // namespace dqv::rules
