#pragma once

#include "dqv/storage/report_store.h"
#include "dqv/storage/sqlite/sqlite_db.h"

#include <memory>

struct sqlite3_stmt;

namespace dqv::storage::sqlite {

// SqliteReportStore keeps each report as its JSON document in validation_reports,
// with report_id, run_id, dataset_name, rule_set_id and overall_passed as indexed
// columns. Requires schema v2 (SqliteDb::ensure_schema_v2).
// upsert() throws std::runtime_error when the row cannot be written.
class SqliteReportStore final : public IReportStore {
 public:
  explicit SqliteReportStore(std::shared_ptr<SqliteDb> db);

  void upsert(const engine::Report& report) override;

  [[nodiscard]] std::optional<engine::Report> get(const std::string& report_id) const override;

  [[nodiscard]] std::vector<engine::Report> list_by_dataset(
      const std::string& dataset_name) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace dqv::storage::sqlite
