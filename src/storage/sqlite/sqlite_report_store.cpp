#include "dqv/storage/sqlite/sqlite_report_store.h"

#include "dqv/engine/report_json.h"

#include <sqlite3.h>

#include <mutex>
#include <stdexcept>
#include <utility>

namespace dqv::storage::sqlite {

namespace {

// Column 0 holds the report JSON blob.
std::optional<engine::Report> row_to_report(sqlite3_stmt* stmt) {
  const auto* raw = sqlite3_column_text(stmt, 0);
  if (raw == nullptr) {
    return std::nullopt;
  }
  auto parsed = engine::parse_report_json(reinterpret_cast<const char*>(raw));  // NOLINT
  if (!parsed.has_value()) {
    return std::nullopt;
  }
  return std::move(parsed.value());
}

}  // namespace

SqliteReportStore::SqliteReportStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteReportStore::upsert(const engine::Report& report) {
  const char* sql = R"(
    INSERT INTO validation_reports
      (report_id, run_id, dataset_name, rule_set_id, overall_passed, report_json, created_at)
    VALUES (?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(report_id) DO UPDATE SET
      run_id         = excluded.run_id,
      dataset_name   = excluded.dataset_name,
      rule_set_id    = excluded.rule_set_id,
      overall_passed = excluded.overall_passed,
      report_json    = excluded.report_json,
      created_at     = excluded.created_at
  )";

  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("report store: failed to prepare upsert: " + stmt.error());
  }

  const std::string json_str = engine::report_to_json_string(report);

  sqlite3_bind_text(stmt.get(), 1, report.report_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, report.run_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, report.dataset_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, report.rule_set_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 5, report.overall_passed ? 1 : 0);
  sqlite3_bind_text(stmt.get(), 6, json_str.c_str(), -1, SQLITE_TRANSIENT);
  if (report.created_at.empty()) {
    sqlite3_bind_null(stmt.get(), 7);
  } else {
    sqlite3_bind_text(stmt.get(), 7, report.created_at.c_str(), -1, SQLITE_TRANSIENT);
  }

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error("report store: failed to save report '" + report.report_id +
                             "': " + sqlite3_errmsg(db_->connection()));
  }
}

std::optional<engine::Report> SqliteReportStore::get(const std::string& report_id) const {
  const char* sql = "SELECT report_json FROM validation_reports WHERE report_id = ?";

  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  sqlite3_bind_text(stmt.get(), 1, report_id.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return row_to_report(stmt.get());
  }
  return std::nullopt;
}

std::vector<engine::Report> SqliteReportStore::list_by_dataset(
    const std::string& dataset_name) const {
  const char* sql =
      "SELECT report_json FROM validation_reports WHERE dataset_name = ? ORDER BY report_id";

  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }

  sqlite3_bind_text(stmt.get(), 1, dataset_name.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<engine::Report> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    auto report = row_to_report(stmt.get());
    if (report.has_value()) {
      result.push_back(std::move(*report));
    }
  }
  return result;
}

}  // namespace dqv::storage::sqlite
