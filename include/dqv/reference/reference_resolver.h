#pragma once

#include "dqv/core/result.h"
#include "dqv/data/partitioned_dataset.h"
#include "dqv/reference/reference_lookup.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace dqv::reference {

using LookupResult = core::Result<std::shared_ptr<const IReferenceLookup>, std::string>;

// IReferenceResolver turns a reference identifier (as written in a ReferentialIntegrity
// rule, e.g. "customers.id") into a materialized lookup.
// The engine calls resolve() once per distinct identifier before any partition is
// evaluated; an error result is a ReferenceUnavailableError for the whole run.
class IReferenceResolver {
 public:
  virtual ~IReferenceResolver() = default;

  [[nodiscard]] virtual LookupResult resolve(const std::string& reference_id) const = 0;

 protected:
  IReferenceResolver() = default;
  IReferenceResolver(const IReferenceResolver&) = default;
  IReferenceResolver& operator=(const IReferenceResolver&) = default;
  IReferenceResolver(IReferenceResolver&&) = default;
  IReferenceResolver& operator=(IReferenceResolver&&) = default;
};

// ReferenceTarget is the "<source>.<column>" form of a reference identifier.
struct ReferenceTarget {
  std::string source;  // NOLINT(readability-identifier-naming)
  std::string column;  // NOLINT(readability-identifier-naming)
};

// Splits on the last '.'; nullopt when either side would be empty.
[[nodiscard]] std::optional<ReferenceTarget> parse_reference_target(const std::string& reference_id);

// Key sets registered directly in memory. Keys must already be canonical
// (data::value_to_key form).
class InMemoryReferenceResolver final : public IReferenceResolver {
 public:
  void add(const std::string& reference_id, std::unordered_set<std::string> keys);

  [[nodiscard]] LookupResult resolve(const std::string& reference_id) const override;

 private:
  std::map<std::string, std::shared_ptr<const IReferenceLookup>> lookups_;
};

// Materializes "<dataset>.<column>" from a registered partitioned dataset by scanning
// every partition and collecting the non-null values of the column.
class DatasetReferenceResolver final : public IReferenceResolver {
 public:
  void add_dataset(const std::string& name, std::shared_ptr<const data::IPartitionedDataset> dataset);

  [[nodiscard]] LookupResult resolve(const std::string& reference_id) const override;

 private:
  std::map<std::string, std::shared_ptr<const data::IPartitionedDataset>> datasets_;
};

// Tries each resolver in order and returns the first success. When all fail, the
// error lists every resolver's message.
class ChainedReferenceResolver final : public IReferenceResolver {
 public:
  explicit ChainedReferenceResolver(std::vector<std::shared_ptr<const IReferenceResolver>> chain);

  [[nodiscard]] LookupResult resolve(const std::string& reference_id) const override;

 private:
  std::vector<std::shared_ptr<const IReferenceResolver>> chain_;
};

}  // namespace dqv::reference
