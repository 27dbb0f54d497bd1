#pragma once

#include "dqv/core/result.h"

#include <memory>
#include <mutex>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace dqv::storage::sqlite {

// SqliteDb manages a SQLite database connection and schema versioning.
// Responsibilities:
// - Open/close database connection
// - Initialize the dqv schema (audit events, stored reports)
// - Provide a connection-wide mutex for callers that share one connection across threads
//
// Datasets and reference tables read by dqv live in ordinary user databases; those are
// opened with open() and never have the dqv schema applied.
class SqliteDb {
 public:
  // Open or create database at path.
  // If path is ":memory:", creates in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Get current schema version (0 if no schema applied)
  [[nodiscard]] int get_schema_version() const;

  // v1: audit_events
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();
  // v2: validation_reports (applies v1 first)
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v2();

  // Execute SQL statement (for non-query operations)
  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Get raw connection (for prepared statements)
  // Should be used only by storage and adapter implementations
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

  // Serializes multi-statement sequences issued on this connection.
  [[nodiscard]] std::mutex& mutex() const { return mutex_; }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  [[nodiscard]] core::Result<bool, std::string> apply_schema(int version, const char* sql);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
  mutable std::mutex mutex_;
};

// RAII wrapper for prepared statements
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  // Returns true if statement was prepared successfully
  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }

  // Get error message if preparation failed
  [[nodiscard]] std::string error() const { return error_; }

  // Get raw statement (for binding/stepping)
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  // Reset statement for reuse
  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

// quote_identifier wraps a table or column name in double quotes, doubling embedded quotes,
// so user-supplied names can be spliced into SQL text safely.
[[nodiscard]] std::string quote_identifier(const std::string& name);

}  // namespace dqv::storage::sqlite
