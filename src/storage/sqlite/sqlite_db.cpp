#include "ulidkit/storage/sqlite/sqlite_db.h"

#include "ulidkit/core/logging.h"

#include <sqlite3.h>

namespace ulidkit::storage::sqlite {

// Deleter implementations
void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close_v2(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

bool is_busy_code(int rc) {
  const int primary = rc & 0xff;
  return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

SqliteErrorKind classify(int rc, SqliteErrorKind fallback) {
  return is_busy_code(rc) ? SqliteErrorKind::kBusy : fallback;
}

const char* to_string(SqliteErrorKind kind) {
  switch (kind) {
    case SqliteErrorKind::kError:
      return "error";
    case SqliteErrorKind::kStepError:
      return "step_error";
    case SqliteErrorKind::kDone:
      return "done";
    case SqliteErrorKind::kBusy:
      return "busy";
  }
  return "error";
}

namespace {

SqliteError make_error(sqlite3* db, int rc, SqliteErrorKind fallback) {
  SqliteError error{classify(rc, fallback), rc, sqlite3_errmsg(db)};
  if (error.kind == SqliteErrorKind::kBusy) {
    core::logger()->warn("sqlite busy/locked (code {}): {}", rc, error.message);
  } else {
    core::logger()->debug("sqlite {} (code {}): {}", to_string(error.kind), rc, error.message);
  }
  return error;
}

}  // namespace

// Embedded schema v1 SQL
// record_id holds "<prefix>-<ULID>"; ordering by it is creation order.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS records (
  record_id TEXT PRIMARY KEY,
  kind TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_records_kind ON records(kind, record_id);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  sqlite3* db = nullptr;
  const int rc =
      sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    // sqlite3_open_v2 may hand back a handle even on failure; it must still be closed.
    std::string error = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    sqlite3_close_v2(db);
    core::logger()->debug("sqlite open failed for '{}': {}", path, error);
    return core::Result<std::shared_ptr<SqliteDb>, std::string>::err("Failed to open database: " +
                                                                     error);
  }

  core::logger()->debug("sqlite database opened: {}", path);
  return core::Result<std::shared_ptr<SqliteDb>, std::string>::ok(
      std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

int SqliteDb::get_schema_version() const {
  // Check if schema_version table exists
  sqlite3_stmt* stmt = nullptr;
  const char* sql = "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1";
  int rc = sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return 0;  // Table doesn't exist yet
  }

  int version = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    version = sqlite3_column_int(stmt, 0);
  }

  sqlite3_finalize(stmt);
  return version;
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  if (get_schema_version() >= 1) {
    return core::Result<bool, std::string>::ok(true);
  }

  auto result = exec(kSchemaV1);
  if (!result.has_value()) {
    return core::Result<bool, std::string>::err("Failed to apply schema v1: " +
                                                result.error().message);
  }

  core::logger()->debug("sqlite schema v1 applied");
  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, SqliteError> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    SqliteError error = make_error(db_.get(), rc, SqliteErrorKind::kError);
    if (err_msg != nullptr) {
      error.message = err_msg;
    }
    sqlite3_free(err_msg);
    return core::Result<bool, SqliteError>::err(std::move(error));
  }

  return core::Result<bool, SqliteError>::ok(true);
}

core::Result<std::unique_ptr<PreparedStatement>, SqliteError> SqliteDb::prepare(
    std::string_view sql) const {
  auto stmt = std::make_unique<PreparedStatement>(db_.get(), sql);
  if (!stmt->is_valid()) {
    SqliteError error = make_error(db_.get(), stmt->error_code(), SqliteErrorKind::kError);
    error.message = stmt->error();
    return core::Result<std::unique_ptr<PreparedStatement>, SqliteError>::err(std::move(error));
  }
  return core::Result<std::unique_ptr<PreparedStatement>, SqliteError>::ok(std::move(stmt));
}

std::int64_t SqliteDb::last_insert_rowid() const {
  return sqlite3_last_insert_rowid(db_.get());
}

std::string SqliteDb::errmsg() const {
  return sqlite3_errmsg(db_.get());
}

PreparedStatement::PreparedStatement(sqlite3* db, std::string_view sql) : db_(db) {
  sqlite3_stmt* raw_stmt = nullptr;
  const int rc =
      sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    error_code_ = rc;
    sqlite3_finalize(raw_stmt);
  } else if (raw_stmt == nullptr) {
    // Whitespace or comments only: SQLite reports success but compiles nothing.
    error_ = "empty SQL statement";
    error_code_ = SQLITE_MISUSE;
  } else {
    stmt_.reset(raw_stmt);
  }
}

core::Result<bool, SqliteError> PreparedStatement::step() {
  const int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW) {
    return core::Result<bool, SqliteError>::ok(true);
  }
  if (rc == SQLITE_DONE) {
    return core::Result<bool, SqliteError>::ok(false);
  }
  return core::Result<bool, SqliteError>::err(make_error(db_, rc, SqliteErrorKind::kStepError));
}

core::Result<bool, SqliteError> PreparedStatement::step_row() {
  auto stepped = step();
  if (stepped.has_value() && !stepped.value()) {
    return core::Result<bool, SqliteError>::err(
        SqliteError{SqliteErrorKind::kDone, SQLITE_DONE, "no row available"});
  }
  return stepped;
}

core::Result<bool, SqliteError> PreparedStatement::bind_text(int idx, std::string_view text) {
  return check_bind(sqlite3_bind_text(stmt_.get(), idx, text.data(),
                                      static_cast<int>(text.size()), SQLITE_TRANSIENT));
}

core::Result<bool, SqliteError> PreparedStatement::bind_int64(int idx, std::int64_t value) {
  return check_bind(sqlite3_bind_int64(stmt_.get(), idx, static_cast<sqlite3_int64>(value)));
}

core::Result<bool, SqliteError> PreparedStatement::bind_int(int idx, int value) {
  return check_bind(sqlite3_bind_int(stmt_.get(), idx, value));
}

core::Result<bool, SqliteError> PreparedStatement::bind_null(int idx) {
  return check_bind(sqlite3_bind_null(stmt_.get(), idx));
}

std::string PreparedStatement::column_text(int idx) const {
  const auto* raw = sqlite3_column_text(stmt_.get(), idx);
  if (raw == nullptr) {
    return {};
  }
  const int len = sqlite3_column_bytes(stmt_.get(), idx);
  return std::string(reinterpret_cast<const char*>(raw),  // NOLINT
                     static_cast<std::size_t>(len));
}

std::int64_t PreparedStatement::column_int64(int idx) const {
  return sqlite3_column_int64(stmt_.get(), idx);
}

int PreparedStatement::column_int(int idx) const {
  return sqlite3_column_int(stmt_.get(), idx);
}

bool PreparedStatement::column_is_null(int idx) const {
  return sqlite3_column_type(stmt_.get(), idx) == SQLITE_NULL;
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

core::Result<bool, SqliteError> PreparedStatement::check_bind(int rc) const {
  if (rc != SQLITE_OK) {
    return core::Result<bool, SqliteError>::err(make_error(db_, rc, SqliteErrorKind::kError));
  }
  return core::Result<bool, SqliteError>::ok(true);
}

}  // namespace ulidkit::storage::sqlite
