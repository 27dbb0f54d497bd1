#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace dqv::reference {

// IReferenceLookup is the only contract ReferentialIntegrity rules depend on:
// membership of a canonical key (data::value_to_key) in a reference key set.
// Implementations must be safe for concurrent contains() calls.
class IReferenceLookup {
 public:
  virtual ~IReferenceLookup() = default;

  [[nodiscard]] virtual bool contains(std::string_view key) const = 0;
  [[nodiscard]] virtual std::size_t size() const = 0;

 protected:
  IReferenceLookup() = default;
  IReferenceLookup(const IReferenceLookup&) = default;
  IReferenceLookup& operator=(const IReferenceLookup&) = default;
  IReferenceLookup(IReferenceLookup&&) = default;
  IReferenceLookup& operator=(IReferenceLookup&&) = default;
};

// Materialized key set with O(1) amortized membership. Immutable after construction.
class HashSetReferenceLookup final : public IReferenceLookup {
 public:
  explicit HashSetReferenceLookup(std::unordered_set<std::string> keys) : keys_(std::move(keys)) {}

  [[nodiscard]] bool contains(std::string_view key) const override {
    return keys_.find(std::string(key)) != keys_.end();
  }
  [[nodiscard]] std::size_t size() const override { return keys_.size(); }

 private:
  std::unordered_set<std::string> keys_;
};

// Resolved lookups keyed by reference identifier, handed to every Partition Evaluator.
using ReferenceHandles = std::map<std::string, std::shared_ptr<const IReferenceLookup>>;

}  // namespace dqv::reference
