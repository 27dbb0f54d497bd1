#pragma once

#include "dqv/core/result.h"
#include "dqv/data/partitioned_dataset.h"
#include "dqv/storage/sqlite/sqlite_db.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace dqv::data::sqlite {

// SqliteDataset exposes one rowid table of a SQLite database as a partitioned dataset.
//
// Partitioning: partition i holds the rows whose rowid is congruent to i modulo
// partition_count (negative rowids included), in rowid order.
// Record ids are the rowid unless id_column names a column with a non-null value.
// Column affinity maps INTEGER -> int64, REAL -> double, TEXT/BLOB -> string, NULL -> null.
//
// Thread-safe: load_partition() holds the connection mutex while stepping.
class SqliteDataset final : public IPartitionedDataset {
 public:
  // Fails if the table does not exist or has no rowid.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDataset>, std::string> open(
      std::shared_ptr<storage::sqlite::SqliteDb> db, const std::string& table,
      std::size_t partition_count, std::optional<std::string> id_column = std::nullopt);

  [[nodiscard]] std::string_view name() const noexcept override { return table_; }
  [[nodiscard]] std::size_t partition_count() const override { return partition_count_; }
  [[nodiscard]] Partition load_partition(std::size_t index) const override;

 private:
  SqliteDataset(std::shared_ptr<storage::sqlite::SqliteDb> db, std::string table,
                std::size_t partition_count, std::optional<std::string> id_column);

  std::shared_ptr<storage::sqlite::SqliteDb> db_;
  std::string table_;
  std::size_t partition_count_;
  std::optional<std::string> id_column_;
};

}  // namespace dqv::data::sqlite
