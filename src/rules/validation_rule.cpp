#include "dqv/rules/validation_rule.h"

namespace dqv::rules {

const reference::IReferenceLookup* RuleContext::reference(const std::string& reference_id) const {
  const auto it = references.find(reference_id);
  if (it == references.end()) {
    return nullptr;
  }
  return it->second.get();
}

}  // namespace dqv::rules
