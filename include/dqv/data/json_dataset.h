#pragma once

#include "dqv/core/result.h"
#include "dqv/data/partitioned_dataset.h"
#include "dqv/data/value.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dqv::data {

struct JsonLoadOptions {
  // Column whose value becomes Record::record_id. When absent (or the cell is null),
  // the record's 0-based position in the input is used.
  std::optional<std::string> id_column;  // NOLINT(readability-identifier-naming)
  std::size_t partition_count{1};        // NOLINT(readability-identifier-naming)
};

// value_from_json maps a JSON scalar to a Value.
// Nested arrays/objects are kept as their compact JSON text.
[[nodiscard]] Value value_from_json(const nlohmann::json& j);

// parse_json_records accepts either a JSON array of objects or JSON Lines
// (one object per non-empty line). Returns an error message on malformed input or
// when an element is not an object.
[[nodiscard]] core::Result<std::vector<Record>, std::string> parse_json_records(
    const std::string& text, const std::optional<std::string>& id_column);

// load_json_dataset reads `path`, parses it with parse_json_records and partitions the
// records with partition_records(). The dataset is named after the file stem.
[[nodiscard]] core::Result<std::shared_ptr<InMemoryDataset>, std::string> load_json_dataset(
    const std::string& path, const JsonLoadOptions& options);

}  // namespace dqv::data
