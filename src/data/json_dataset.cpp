#include "dqv/data/json_dataset.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace dqv::data {

namespace {

using RecordsResult = core::Result<std::vector<Record>, std::string>;

core::Result<Record, std::string> record_from_json(const nlohmann::json& j, std::size_t position,
                                                   const std::optional<std::string>& id_column) {
  if (!j.is_object()) {
    return core::Result<Record, std::string>::err("record " + std::to_string(position) +
                                                  " is not a JSON object");
  }

  Record record;
  for (const auto& [key, cell] : j.items()) {
    record.columns.emplace(key, value_from_json(cell));
  }

  record.record_id = std::to_string(position);
  if (id_column.has_value()) {
    const Value& id = record.get(id_column.value());
    if (!is_null(id)) {
      record.record_id = value_to_string(id);
    }
  }

  return core::Result<Record, std::string>::ok(std::move(record));
}

bool looks_like_array(const std::string& text) {
  for (const char ch : text) {
    if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r') {
      continue;
    }
    return ch == '[';
  }
  return false;
}

}  // namespace

Value value_from_json(const nlohmann::json& j) {
  if (j.is_null()) {
    return Value{};
  }
  if (j.is_boolean()) {
    return Value{j.get<bool>()};
  }
  if (j.is_number_unsigned()) {
    // Values past int64 keep their magnitude as a double instead of wrapping negative.
    const auto u = j.get<std::uint64_t>();
    if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return Value{static_cast<double>(u)};
    }
    return Value{static_cast<std::int64_t>(u)};
  }
  if (j.is_number_integer()) {
    return Value{j.get<std::int64_t>()};
  }
  if (j.is_number_float()) {
    return Value{j.get<double>()};
  }
  if (j.is_string()) {
    return Value{j.get<std::string>()};
  }
  return Value{j.dump()};
}

core::Result<std::vector<Record>, std::string> parse_json_records(
    const std::string& text, const std::optional<std::string>& id_column) {
  std::vector<Record> records;

  try {
    if (looks_like_array(text)) {
      const auto doc = nlohmann::json::parse(text);
      records.reserve(doc.size());
      for (std::size_t i = 0; i < doc.size(); ++i) {
        auto record = record_from_json(doc[i], i, id_column);
        if (!record.has_value()) {
          return RecordsResult::err(record.error());
        }
        records.push_back(std::move(record.value()));
      }
      return RecordsResult::ok(std::move(records));
    }

    // JSON Lines
    std::istringstream lines(text);
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(lines, line)) {
      ++line_number;
      if (line.find_first_not_of(" \t\r") == std::string::npos) {
        continue;
      }
      const auto doc = nlohmann::json::parse(line);
      auto record = record_from_json(doc, records.size(), id_column);
      if (!record.has_value()) {
        return RecordsResult::err("line " + std::to_string(line_number) + ": " + record.error());
      }
      records.push_back(std::move(record.value()));
    }
  } catch (const nlohmann::json::exception& e) {
    return RecordsResult::err(std::string("malformed JSON: ") + e.what());
  }

  return RecordsResult::ok(std::move(records));
}

core::Result<std::shared_ptr<InMemoryDataset>, std::string> load_json_dataset(
    const std::string& path, const JsonLoadOptions& options) {
  using DatasetResult = core::Result<std::shared_ptr<InMemoryDataset>, std::string>;

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return DatasetResult::err("cannot open dataset file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  auto records = parse_json_records(buffer.str(), options.id_column);
  if (!records.has_value()) {
    return DatasetResult::err(path + ": " + records.error());
  }

  auto partitions = partition_records(std::move(records.value()), options.partition_count);
  return DatasetResult::ok(std::make_shared<InMemoryDataset>(
      std::filesystem::path(path).stem().string(), std::move(partitions)));
}

}  // namespace dqv::data
