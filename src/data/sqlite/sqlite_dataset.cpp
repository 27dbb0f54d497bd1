#include "dqv/data/sqlite/sqlite_dataset.h"

#include <sqlite3.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace dqv::data::sqlite {

namespace {

using storage::sqlite::PreparedStatement;
using storage::sqlite::quote_identifier;

Value column_value(sqlite3_stmt* stmt, int col) {
  switch (sqlite3_column_type(stmt, col)) {
    case SQLITE_INTEGER:
      return Value{static_cast<std::int64_t>(sqlite3_column_int64(stmt, col))};
    case SQLITE_FLOAT:
      return Value{sqlite3_column_double(stmt, col)};
    case SQLITE_TEXT: {
      const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));  // NOLINT
      return Value{std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)))};
    }
    case SQLITE_BLOB: {
      const auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt, col));
      return Value{std::string(blob, static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)))};
    }
    default:
      return Value{};
  }
}

}  // namespace

SqliteDataset::SqliteDataset(std::shared_ptr<storage::sqlite::SqliteDb> db, std::string table,
                             std::size_t partition_count, std::optional<std::string> id_column)
    : db_(std::move(db)),
      table_(std::move(table)),
      partition_count_(partition_count),
      id_column_(std::move(id_column)) {}

core::Result<std::shared_ptr<SqliteDataset>, std::string> SqliteDataset::open(
    std::shared_ptr<storage::sqlite::SqliteDb> db, const std::string& table,
    std::size_t partition_count, std::optional<std::string> id_column) {
  using OpenResult = core::Result<std::shared_ptr<SqliteDataset>, std::string>;

  std::size_t row_count = 0;
  {
    std::lock_guard<std::mutex> lock(db->mutex());
    PreparedStatement probe(db->connection(),
                            "SELECT COUNT(rowid) FROM " + quote_identifier(table));
    if (!probe.is_valid()) {
      return OpenResult::err("cannot read table '" + table + "': " + probe.error());
    }
    if (sqlite3_step(probe.get()) == SQLITE_ROW) {
      row_count = static_cast<std::size_t>(sqlite3_column_int64(probe.get(), 0));
    }
  }

  // An empty table gets zero partitions, otherwise never more partitions than rows.
  const std::size_t effective =
      row_count == 0 ? 0 : std::min(std::max<std::size_t>(partition_count, 1), row_count);

  return OpenResult::ok(std::shared_ptr<SqliteDataset>(
      new SqliteDataset(std::move(db), table, effective, std::move(id_column))));
}

Partition SqliteDataset::load_partition(std::size_t index) const {
  if (index >= partition_count_) {
    throw std::out_of_range("partition index " + std::to_string(index) + " out of range");
  }

  // SQLite's % truncates toward zero; the outer fold keeps negative rowids in [0, n).
  const std::string sql = "SELECT rowid, * FROM " + quote_identifier(table_) +
                          " WHERE ((rowid % ?1) + ?1) % ?1 = ?2 ORDER BY rowid";

  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("failed to read partition of '" + table_ + "': " + stmt.error());
  }

  sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(partition_count_));
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(index));

  Partition partition;
  partition.index = index;

  const int column_count = sqlite3_column_count(stmt.get());
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    Record record;
    record.record_id = std::to_string(sqlite3_column_int64(stmt.get(), 0));
    // Column 0 is the rowid; user columns start at 1.
    for (int col = 1; col < column_count; ++col) {
      record.columns.insert_or_assign(sqlite3_column_name(stmt.get(), col),
                                      column_value(stmt.get(), col));
    }
    if (id_column_.has_value()) {
      const Value& id = record.get(id_column_.value());
      if (!is_null(id)) {
        record.record_id = value_to_string(id);
      }
    }
    partition.records.push_back(std::move(record));
  }

  if (rc != SQLITE_DONE) {
    throw std::runtime_error("failed to read partition of '" + table_ +
                             "': " + sqlite3_errmsg(db_->connection()));
  }

  return partition;
}

}  // namespace dqv::data::sqlite
