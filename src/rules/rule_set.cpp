#include "dqv/rules/rule_set.h"

#include "dqv/core/hashing.h"
#include "dqv/rules/kinds/custom_rule.h"
#include "dqv/rules/kinds/not_null_rule.h"
#include "dqv/rules/kinds/range_rule.h"
#include "dqv/rules/kinds/referential_integrity_rule.h"
#include "dqv/rules/kinds/regex_rule.h"
#include "dqv/rules/kinds/unique_rule.h"

#include <algorithm>
#include <regex>
#include <set>
#include <utility>

namespace dqv::rules {

namespace {

// Returns an empty message when the rule spec is well-formed for its kind.
std::string check_spec(const RuleSpec& spec) {
  if (spec.columns.empty() && spec.kind != RuleKind::kCustom) {
    return "at least one target column is required";
  }
  for (const auto& column : spec.columns) {
    if (column.empty()) {
      return "column names must not be empty";
    }
  }

  const bool single_column = spec.kind == RuleKind::kRange || spec.kind == RuleKind::kRegex ||
                             spec.kind == RuleKind::kReferentialIntegrity;
  if (single_column && spec.columns.size() != 1) {
    return std::string(to_string(spec.kind)) + " rules take exactly one column";
  }

  switch (spec.kind) {
    case RuleKind::kNotNull:
    case RuleKind::kUnique:
      break;
    case RuleKind::kRange:
      if (!spec.params.min.has_value() && !spec.params.max.has_value()) {
        return "range rules require 'min' and/or 'max'";
      }
      if (spec.params.min.has_value() && spec.params.max.has_value() &&
          *spec.params.min > *spec.params.max) {
        return "'min' must not exceed 'max'";
      }
      break;
    case RuleKind::kRegex:
      if (!spec.params.pattern.has_value()) {
        return "regex rules require 'pattern'";
      }
      break;
    case RuleKind::kReferentialIntegrity:
      if (!spec.params.reference.has_value() || spec.params.reference->empty()) {
        return "referential_integrity rules require 'reference'";
      }
      break;
    case RuleKind::kCustom:
      if (!spec.params.predicate.has_value() || spec.params.predicate->empty()) {
        return "custom rules require 'predicate'";
      }
      break;
  }
  return {};
}

}  // namespace

const ValidationRule* RuleSet::find(const std::string& name) const {
  const auto it = std::find_if(rules_.begin(), rules_.end(),
                               [&name](const auto& rule) { return rule->name() == name; });
  return it == rules_.end() ? nullptr : it->get();
}

std::vector<std::string> RuleSet::reference_ids() const {
  std::set<std::string> ids;
  for (const auto& rule : rules_) {
    if (rule->kind() == RuleKind::kReferentialIntegrity) {
      ids.insert(*rule->spec().params.reference);
    }
  }
  return {ids.begin(), ids.end()};
}

core::Result<RuleSet, ConfigurationError> build_rule_set(
    const RuleSetDefinition& definition, const CustomPredicateRegistry& predicates) {
  using BuildResult = core::Result<RuleSet, ConfigurationError>;

  if (definition.sample_capacity.has_value() && *definition.sample_capacity == 0) {
    return BuildResult::err({"", "sample_capacity must be positive"});
  }

  RuleSet rule_set;
  rule_set.rule_set_id_ = definition.rule_set_id;
  rule_set.version_ = definition.version;
  rule_set.sample_capacity_ = definition.sample_capacity;
  rule_set.fingerprint_ =
      core::stable_hash64_hex(rule_set_definition_to_json(definition).dump());

  std::set<std::string> seen_names;
  for (const auto& spec : definition.rules) {
    if (spec.name.empty()) {
      return BuildResult::err({"", "rule name must not be empty"});
    }
    if (!seen_names.insert(spec.name).second) {
      return BuildResult::err({spec.name, "duplicate rule name '" + spec.name + "'"});
    }

    const std::string problem = check_spec(spec);
    if (!problem.empty()) {
      return BuildResult::err({spec.name, problem});
    }

    switch (spec.kind) {
      case RuleKind::kNotNull:
        rule_set.rules_.push_back(std::make_unique<NotNullRule>(spec));
        break;
      case RuleKind::kUnique:
        rule_set.rules_.push_back(std::make_unique<UniqueRule>(spec));
        break;
      case RuleKind::kRange:
        rule_set.rules_.push_back(std::make_unique<RangeRule>(spec));
        break;
      case RuleKind::kRegex:
        try {
          rule_set.rules_.push_back(std::make_unique<RegexRule>(spec));
        } catch (const std::regex_error& e) {
          return BuildResult::err(
              {spec.name, "invalid pattern '" + *spec.params.pattern + "': " + e.what()});
        }
        break;
      case RuleKind::kReferentialIntegrity:
        rule_set.rules_.push_back(std::make_unique<ReferentialIntegrityRule>(spec));
        break;
      case RuleKind::kCustom: {
        const auto* predicate = predicates.find(*spec.params.predicate);
        if (predicate == nullptr) {
          return BuildResult::err(
              {spec.name, "unknown custom predicate '" + *spec.params.predicate + "'"});
        }
        rule_set.rules_.push_back(std::make_unique<CustomRule>(spec, *predicate));
        break;
      }
    }
  }

  return BuildResult::ok(std::move(rule_set));
}

}  // namespace dqv::rules
