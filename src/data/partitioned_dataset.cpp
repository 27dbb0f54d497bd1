#include "dqv/data/partitioned_dataset.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace dqv::data {

InMemoryDataset::InMemoryDataset(std::string name, std::vector<Partition> partitions)
    : name_(std::move(name)), partitions_(std::move(partitions)) {
  for (std::size_t i = 0; i < partitions_.size(); ++i) {
    partitions_[i].index = i;
  }
}

Partition InMemoryDataset::load_partition(std::size_t index) const {
  if (index >= partitions_.size()) {
    throw std::out_of_range("partition index " + std::to_string(index) + " out of range");
  }
  return partitions_[index];
}

std::vector<Partition> partition_records(std::vector<Record> records,
                                         std::size_t partition_count) {
  std::vector<Partition> partitions;
  if (records.empty()) {
    return partitions;
  }

  const std::size_t count = std::min(std::max<std::size_t>(partition_count, 1), records.size());
  const std::size_t base = records.size() / count;
  const std::size_t remainder = records.size() % count;

  partitions.reserve(count);
  std::size_t offset = 0;
  for (std::size_t i = 0; i < count; ++i) {
    // The first `remainder` partitions take one extra record.
    const std::size_t size = base + (i < remainder ? 1 : 0);
    Partition partition;
    partition.index = i;
    partition.records.reserve(size);
    for (std::size_t j = 0; j < size; ++j) {
      partition.records.push_back(std::move(records[offset + j]));
    }
    offset += size;
    partitions.push_back(std::move(partition));
  }

  return partitions;
}

}  // namespace dqv::data
