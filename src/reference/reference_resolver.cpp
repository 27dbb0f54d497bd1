#include "dqv/reference/reference_resolver.h"

#include "dqv/data/value.h"

#include <exception>
#include <utility>

namespace dqv::reference {

std::optional<ReferenceTarget> parse_reference_target(const std::string& reference_id) {
  const auto dot = reference_id.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == reference_id.size()) {
    return std::nullopt;
  }
  return ReferenceTarget{reference_id.substr(0, dot), reference_id.substr(dot + 1)};
}

void InMemoryReferenceResolver::add(const std::string& reference_id,
                                    std::unordered_set<std::string> keys) {
  lookups_[reference_id] = std::make_shared<HashSetReferenceLookup>(std::move(keys));
}

LookupResult InMemoryReferenceResolver::resolve(const std::string& reference_id) const {
  const auto it = lookups_.find(reference_id);
  if (it == lookups_.end()) {
    return LookupResult::err("no in-memory reference set registered as '" + reference_id + "'");
  }
  return LookupResult::ok(it->second);
}

void DatasetReferenceResolver::add_dataset(
    const std::string& name, std::shared_ptr<const data::IPartitionedDataset> dataset) {
  datasets_[name] = std::move(dataset);
}

LookupResult DatasetReferenceResolver::resolve(const std::string& reference_id) const {
  const auto target = parse_reference_target(reference_id);
  if (!target.has_value()) {
    return LookupResult::err("reference '" + reference_id + "' is not of the form dataset.column");
  }

  const auto it = datasets_.find(target->source);
  if (it == datasets_.end()) {
    return LookupResult::err("no reference dataset registered as '" + target->source + "'");
  }

  std::unordered_set<std::string> keys;
  try {
    const auto& dataset = *it->second;
    for (std::size_t i = 0; i < dataset.partition_count(); ++i) {
      const auto partition = dataset.load_partition(i);
      for (const auto& record : partition.records) {
        const auto& value = record.get(target->column);
        if (!data::is_null(value)) {
          keys.insert(data::value_to_key(value));
        }
      }
    }
  } catch (const std::exception& e) {
    return LookupResult::err("failed to load reference dataset '" + target->source +
                             "': " + e.what());
  }

  return LookupResult::ok(std::make_shared<HashSetReferenceLookup>(std::move(keys)));
}

ChainedReferenceResolver::ChainedReferenceResolver(
    std::vector<std::shared_ptr<const IReferenceResolver>> chain)
    : chain_(std::move(chain)) {}

LookupResult ChainedReferenceResolver::resolve(const std::string& reference_id) const {
  std::string errors;
  for (const auto& resolver : chain_) {
    auto result = resolver->resolve(reference_id);
    if (result.has_value()) {
      return result;
    }
    if (!errors.empty()) {
      errors += "; ";
    }
    errors += result.error();
  }
  if (errors.empty()) {
    errors = "no reference resolver configured for '" + reference_id + "'";
  }
  return LookupResult::err(errors);
}

}  // namespace dqv::reference
