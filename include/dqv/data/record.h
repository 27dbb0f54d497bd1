#pragma once

#include "dqv/data/value.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace dqv::data {

// Record is one row of a dataset with named-column access.
// record_id is a logical row locator (an id column value or a substrate row number);
// it is carried into outcomes for diagnostics and never interpreted by the engine.
struct Record {
  std::string record_id;
  std::map<std::string, Value> columns;

  // Returns the cell for column, or a null Value when the column is absent.
  [[nodiscard]] const Value& get(const std::string& column) const;
};

// Partition is a disjoint, substrate-defined subset of a dataset's records.
// Record order inside a partition is the partition-local iteration order.
struct Partition {
  std::size_t index{0};
  std::vector<Record> records;
};

}  // namespace dqv::data
