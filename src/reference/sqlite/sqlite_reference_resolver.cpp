#include "dqv/reference/sqlite/sqlite_reference_resolver.h"

#include "dqv/data/value.h"

#include <sqlite3.h>

#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>

namespace dqv::reference::sqlite {

using storage::sqlite::PreparedStatement;
using storage::sqlite::quote_identifier;

namespace {

// SQLite reads an unknown double-quoted identifier as a string literal, so the column
// is checked against the table's schema before it is selected.
bool column_exists(sqlite3* db, const std::string& table, const std::string& column) {
  PreparedStatement stmt(db, "SELECT 1 FROM pragma_table_info(?) WHERE name = ?");
  if (!stmt.is_valid()) {
    return false;
  }
  sqlite3_bind_text(stmt.get(), 1, table.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, column.c_str(), -1, SQLITE_TRANSIENT);
  return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

}  // namespace

SqliteReferenceResolver::SqliteReferenceResolver(std::shared_ptr<storage::sqlite::SqliteDb> db)
    : db_(std::move(db)) {}

LookupResult SqliteReferenceResolver::resolve(const std::string& reference_id) const {
  const auto target = parse_reference_target(reference_id);
  if (!target.has_value()) {
    return LookupResult::err("reference '" + reference_id + "' is not of the form table.column");
  }

  const std::string column = quote_identifier(target->column);
  const std::string sql = "SELECT DISTINCT " + column + " FROM " +
                          quote_identifier(target->source) + " WHERE " + column +
                          " IS NOT NULL";

  std::lock_guard<std::mutex> lock(db_->mutex());
  if (!column_exists(db_->connection(), target->source, target->column)) {
    return LookupResult::err("no column '" + target->column + "' in table '" + target->source +
                             "'");
  }
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return LookupResult::err("cannot read reference '" + reference_id + "': " + stmt.error());
  }

  // Keys use the same canonical spelling as record values so 5 and 5.0 match.
  std::unordered_set<std::string> keys;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    switch (sqlite3_column_type(stmt.get(), 0)) {
      case SQLITE_INTEGER:
        keys.insert(data::value_to_key(
            data::Value{static_cast<std::int64_t>(sqlite3_column_int64(stmt.get(), 0))}));
        break;
      case SQLITE_FLOAT:
        keys.insert(data::value_to_key(data::Value{sqlite3_column_double(stmt.get(), 0)}));
        break;
      default: {
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));  // NOLINT
        keys.emplace(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt.get(), 0)));
        break;
      }
    }
  }

  if (rc != SQLITE_DONE) {
    return LookupResult::err("failed reading reference '" + reference_id +
                             "': " + sqlite3_errmsg(db_->connection()));
  }

  return LookupResult::ok(std::make_shared<HashSetReferenceLookup>(std::move(keys)));
}

}  // namespace dqv::reference::sqlite
