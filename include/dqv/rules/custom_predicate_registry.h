#pragma once

#include "dqv/data/record.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace dqv::rules {

// A custom predicate returns true when the record passes. It may throw; a thrown
// exception is recorded as a rule evaluation error for that record.
// Predicates are invoked concurrently from several partitions and must not mutate shared state.
using CustomPredicate = std::function<bool(const data::Record&)>;

// CustomPredicateRegistry maps predicate names used in rule set documents to code.
class CustomPredicateRegistry {
 public:
  // Registers or replaces the predicate for name.
  void register_predicate(const std::string& name, CustomPredicate predicate);

  // Returns nullptr when no predicate is registered under name.
  [[nodiscard]] const CustomPredicate* find(const std::string& name) const;

  [[nodiscard]] std::vector<std::string> names() const;

 private:
  std::map<std::string, CustomPredicate> predicates_;
};

}  // namespace dqv::rules
