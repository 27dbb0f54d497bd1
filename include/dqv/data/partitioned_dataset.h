#pragma once

#include "dqv/data/record.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace dqv::data {

// IPartitionedDataset is the substrate input contract: the engine only ever
// enumerates partitions and iterates their records.
//
// Thread-safety contract: load_partition() may be called concurrently for
// distinct indices from multiple worker threads.
class IPartitionedDataset {
 public:
  virtual ~IPartitionedDataset() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
  [[nodiscard]] virtual std::size_t partition_count() const = 0;

  // Materialize partition `index` (0 <= index < partition_count()).
  [[nodiscard]] virtual Partition load_partition(std::size_t index) const = 0;

 protected:
  IPartitionedDataset() = default;
  IPartitionedDataset(const IPartitionedDataset&) = default;
  IPartitionedDataset& operator=(const IPartitionedDataset&) = default;
  IPartitionedDataset(IPartitionedDataset&&) = default;
  IPartitionedDataset& operator=(IPartitionedDataset&&) = default;
};

// InMemoryDataset holds already-partitioned records.
class InMemoryDataset final : public IPartitionedDataset {
 public:
  // Partition indices are reassigned to match vector positions.
  InMemoryDataset(std::string name, std::vector<Partition> partitions);

  [[nodiscard]] std::string_view name() const noexcept override { return name_; }
  [[nodiscard]] std::size_t partition_count() const override { return partitions_.size(); }
  [[nodiscard]] Partition load_partition(std::size_t index) const override;

 private:
  std::string name_;
  std::vector<Partition> partitions_;
};

// partition_records splits records into `partition_count` contiguous chunks.
// Every chunk is non-empty: the effective count is min(partition_count, records.size()),
// and an empty input yields zero partitions. partition_count == 0 is treated as 1.
[[nodiscard]] std::vector<Partition> partition_records(std::vector<Record> records,
                                                       std::size_t partition_count);

}  // namespace dqv::data
