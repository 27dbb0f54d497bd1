#pragma once

#include "dqv/storage/audit_log.h"
#include "dqv/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace dqv::storage::sqlite {

// SqliteAuditLog implements IAuditLog with SQLite backend.
// Maintains append-only log with deterministic ordering via the per-trace idx column.
// Requires schema v1 (SqliteDb::ensure_schema_v1).
// append() throws std::runtime_error when the row cannot be written.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  [[nodiscard]] int next_index(const std::string& trace_id);

  std::shared_ptr<SqliteDb> db_;

  // Next idx per trace; seeded from MAX(idx) the first time a trace is seen.
  std::map<std::string, int> trace_indices_;
};

}  // namespace dqv::storage::sqlite
