#include "dqv/rules/custom_predicate_registry.h"

#include <utility>

namespace dqv::rules {

void CustomPredicateRegistry::register_predicate(const std::string& name,
                                                 CustomPredicate predicate) {
  predicates_[name] = std::move(predicate);
}

const CustomPredicate* CustomPredicateRegistry::find(const std::string& name) const {
  const auto it = predicates_.find(name);
  if (it == predicates_.end()) {
    return nullptr;
  }
  return &it->second;
}

std::vector<std::string> CustomPredicateRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(predicates_.size());
  for (const auto& [name, predicate] : predicates_) {
    out.push_back(name);
  }
  return out;
}

}  // namespace dqv::rules
