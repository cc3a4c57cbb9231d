#pragma once

#include "ulidkit/core/result.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace ulidkit::storage::sqlite {

// SqliteErrorKind collapses SQLite's result codes into the four cases callers act on.
enum class SqliteErrorKind {
  kError,      // any other failure
  kStepError,  // sqlite3_step failed for a reason other than contention
  kDone,       // a row was required but the statement finished
  kBusy,       // SQLITE_BUSY or SQLITE_LOCKED (any extended variant)
};

struct SqliteError {
  SqliteErrorKind kind{SqliteErrorKind::kError};  // NOLINT(readability-identifier-naming)
  int code{0};                                    // NOLINT(readability-identifier-naming) extended result code
  std::string message;                            // NOLINT(readability-identifier-naming)
};

// True when the primary class of rc (low byte) is SQLITE_BUSY or SQLITE_LOCKED.
[[nodiscard]] bool is_busy_code(int rc);

// kBusy for contention codes, fallback otherwise.
[[nodiscard]] SqliteErrorKind classify(int rc, SqliteErrorKind fallback);

[[nodiscard]] const char* to_string(SqliteErrorKind kind);

class PreparedStatement;

// SqliteDb manages a SQLite database connection and schema versioning.
// Responsibilities:
// - Open/close database connection
// - Initialize schema (migrations)
// - Provide prepared statement helpers
// - Report rowid and error message of the last operation
//
// Design principles:
// - RAII: connection managed via unique_ptr with custom deleter
// - Explicit error handling via Result<T,E>
// - One connection per instance; not shared across threads
class SqliteDb {
 public:
  // Open or create database at path (read-write, create if missing).
  // If path is ":memory:", creates in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  // Disable copy/move (unique ownership)
  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Get current schema version (0 if no schema applied)
  [[nodiscard]] int get_schema_version() const;

  // Apply schema v1 (records table) if not already applied
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  // Execute SQL statement (for non-query operations)
  [[nodiscard]] core::Result<bool, SqliteError> exec(const std::string& sql);

  // Compile sql. The text is passed with its length; no terminator is required.
  [[nodiscard]] core::Result<std::unique_ptr<PreparedStatement>, SqliteError> prepare(
      std::string_view sql) const;

  // Rowid of the most recent successful INSERT on this connection.
  [[nodiscard]] std::int64_t last_insert_rowid() const;

  // Error message of the most recent failed call on this connection.
  [[nodiscard]] std::string errmsg() const;

  // Get raw connection (for prepared statements)
  // Should be used only by repository implementations
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// RAII wrapper for prepared statements
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, std::string_view sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  // Returns true if statement was prepared successfully
  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }

  // Get error message if preparation failed
  [[nodiscard]] std::string error() const { return error_; }

  // Result code of the failed preparation (SQLITE_OK when valid)
  [[nodiscard]] int error_code() const { return error_code_; }

  // Get raw statement (for binding/stepping)
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  // Advance the statement. true: a row is available. false: finished.
  [[nodiscard]] core::Result<bool, SqliteError> step();

  // Advance and require a row; a finished statement is reported as kDone.
  [[nodiscard]] core::Result<bool, SqliteError> step_row();

  // Parameter indices are 1-based, as in the C API.
  // Text is bound by pointer and length and copied by SQLite.
  [[nodiscard]] core::Result<bool, SqliteError> bind_text(int idx, std::string_view text);
  [[nodiscard]] core::Result<bool, SqliteError> bind_int64(int idx, std::int64_t value);
  [[nodiscard]] core::Result<bool, SqliteError> bind_int(int idx, int value);
  [[nodiscard]] core::Result<bool, SqliteError> bind_null(int idx);

  // Column indices are 0-based. NULL text reads as an empty string.
  [[nodiscard]] std::string column_text(int idx) const;
  [[nodiscard]] std::int64_t column_int64(int idx) const;
  [[nodiscard]] int column_int(int idx) const;
  [[nodiscard]] bool column_is_null(int idx) const;

  // Reset statement for reuse
  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  [[nodiscard]] core::Result<bool, SqliteError> check_bind(int rc) const;

  sqlite3* db_;
  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
  int error_code_{0};
};

}  // namespace ulidkit::storage::sqlite
