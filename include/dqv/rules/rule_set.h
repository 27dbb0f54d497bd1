#pragma once

#include "dqv/core/result.h"
#include "dqv/rules/custom_predicate_registry.h"
#include "dqv/rules/rule_spec.h"
#include "dqv/rules/validation_rule.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dqv::rules {

class RuleSet;

// build_rule_set validates a definition eagerly and instantiates one rule per spec.
// Any of the following is a ConfigurationError naming the offending rule:
// - duplicate or empty rule name
// - empty column list (every kind except Custom)
// - more than one column for Range, Regex, ReferentialIntegrity
// - Range without min and max, or min > max
// - Regex without a pattern, or a pattern that does not compile
// - ReferentialIntegrity without a reference identifier
// - Custom without a predicate, or with a predicate not in the registry
// - sample_capacity of zero
[[nodiscard]] core::Result<RuleSet, ConfigurationError> build_rule_set(
    const RuleSetDefinition& definition,
    const CustomPredicateRegistry& predicates = CustomPredicateRegistry{});

// RuleSet is a validated, immutable, ordered collection of rules.
// Invariants established by build_rule_set():
// - rule names are unique
// - every rule has the parameters its kind requires
// Evaluation order is the definition order. A RuleSet is shared read-only by all
// Partition Evaluators of a run.
class RuleSet {
 public:
  RuleSet(RuleSet&&) = default;
  RuleSet& operator=(RuleSet&&) = default;
  RuleSet(const RuleSet&) = delete;
  RuleSet& operator=(const RuleSet&) = delete;
  ~RuleSet() = default;

  [[nodiscard]] const std::string& rule_set_id() const noexcept { return rule_set_id_; }
  [[nodiscard]] const std::string& version() const noexcept { return version_; }

  // stable_hash64_hex of the canonical definition JSON; identical definitions share it.
  [[nodiscard]] const std::string& fingerprint() const noexcept { return fingerprint_; }

  [[nodiscard]] std::optional<std::size_t> sample_capacity() const noexcept {
    return sample_capacity_;
  }

  [[nodiscard]] const std::vector<std::unique_ptr<const ValidationRule>>& rules() const noexcept {
    return rules_;
  }
  [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }
  [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }

  // Returns nullptr when no rule has that name.
  [[nodiscard]] const ValidationRule* find(const std::string& name) const;

  // Distinct reference identifiers used by ReferentialIntegrity rules, sorted.
  [[nodiscard]] std::vector<std::string> reference_ids() const;

 private:
  friend core::Result<RuleSet, ConfigurationError> build_rule_set(
      const RuleSetDefinition& definition, const CustomPredicateRegistry& predicates);

  RuleSet() = default;

  std::string rule_set_id_;
  std::string version_;
  std::string fingerprint_;
  std::optional<std::size_t> sample_capacity_;
  std::vector<std::unique_ptr<const ValidationRule>> rules_;
};

}  // namespace dqv::rules
