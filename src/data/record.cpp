#include "dqv/data/record.h"

namespace dqv::data {

const Value& Record::get(const std::string& column) const {
  static const Value kNull{};
  const auto it = columns.find(column);
  return it != columns.end() ? it->second : kNull;
}

}  // namespace dqv::data
