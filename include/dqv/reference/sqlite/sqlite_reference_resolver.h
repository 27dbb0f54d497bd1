#pragma once

#include "dqv/reference/reference_resolver.h"
#include "dqv/storage/sqlite/sqlite_db.h"

#include <memory>
#include <string>

namespace dqv::reference::sqlite {

// SqliteReferenceResolver materializes "<table>.<column>" from a SQLite database with
// SELECT DISTINCT over the non-null values of the column.
class SqliteReferenceResolver final : public IReferenceResolver {
 public:
  explicit SqliteReferenceResolver(std::shared_ptr<storage::sqlite::SqliteDb> db);

  [[nodiscard]] LookupResult resolve(const std::string& reference_id) const override;

 private:
  std::shared_ptr<storage::sqlite::SqliteDb> db_;
};

}  // namespace dqv::reference::sqlite
