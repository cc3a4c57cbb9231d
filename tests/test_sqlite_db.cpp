#include "ulidkit/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include <sqlite3.h>

#include <filesystem>
#include <string>

using namespace ulidkit::storage::sqlite;

TEST_CASE("SqliteDb open and schema", "[storage][sqlite]") {
  auto db_result = SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();

  CHECK(db->get_schema_version() == 0);
  REQUIRE(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);

  // Idempotent
  REQUIRE(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);
}

TEST_CASE("SqliteDb open reports unusable paths", "[storage][sqlite]") {
  auto db_result = SqliteDb::open("/nonexistent-dir/for/ulidkit/test.db");
  REQUIRE_FALSE(db_result.has_value());
  CHECK(db_result.error().rfind("Failed to open database: ", 0) == 0);
}

TEST_CASE("SqliteDb exec reports errors", "[storage][sqlite]") {
  auto db = SqliteDb::open(":memory:").value();

  REQUIRE(db->exec("CREATE TABLE t (id TEXT PRIMARY KEY, n INTEGER)").has_value());

  auto bad = db->exec("CREATE TABLE t (id TEXT)");
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().kind == SqliteErrorKind::kError);
  CHECK(bad.error().message.find("already exists") != std::string::npos);
}

TEST_CASE("PreparedStatement binds, steps and reads columns", "[storage][sqlite]") {
  auto db = SqliteDb::open(":memory:").value();
  REQUIRE(db->exec("CREATE TABLE t (id TEXT PRIMARY KEY, n INTEGER, big INTEGER, note TEXT)")
              .has_value());

  {
    auto prepared = db->prepare("INSERT INTO t (id, n, big, note) VALUES (?, ?, ?, ?)");
    REQUIRE(prepared.has_value());
    auto& stmt = *prepared.value();

    // Bind only the first 26 bytes of a longer buffer: no terminator is needed.
    const std::string buffer = "01ARYZ6S41TSV4RRFFQ69G5FAVtrailing";
    REQUIRE(stmt.bind_text(1, std::string_view(buffer).substr(0, 26)).has_value());
    REQUIRE(stmt.bind_int(2, 7).has_value());
    REQUIRE(stmt.bind_int64(3, 1LL << 40).has_value());
    REQUIRE(stmt.bind_null(4).has_value());

    auto stepped = stmt.step();
    REQUIRE(stepped.has_value());
    CHECK_FALSE(stepped.value());
  }
  CHECK(db->last_insert_rowid() == 1);

  auto prepared = db->prepare("SELECT id, n, big, note FROM t");
  REQUIRE(prepared.has_value());
  auto& stmt = *prepared.value();

  auto row = stmt.step_row();
  REQUIRE(row.has_value());
  CHECK(stmt.column_text(0) == "01ARYZ6S41TSV4RRFFQ69G5FAV");
  CHECK(stmt.column_int(1) == 7);
  CHECK(stmt.column_int64(2) == (1LL << 40));
  CHECK(stmt.column_is_null(3));
  CHECK(stmt.column_text(3).empty());

  auto done = stmt.step_row();
  REQUIRE_FALSE(done.has_value());
  CHECK(done.error().kind == SqliteErrorKind::kDone);
}

TEST_CASE("PreparedStatement accepts SQL without a terminator", "[storage][sqlite]") {
  auto db = SqliteDb::open(":memory:").value();
  const std::string sql = "SELECT 41 + 1;garbage after the statement";

  auto prepared = db->prepare(std::string_view(sql).substr(0, 13));
  REQUIRE(prepared.has_value());
  auto& stmt = *prepared.value();
  REQUIRE(stmt.step_row().has_value());
  CHECK(stmt.column_int(0) == 42);
}

TEST_CASE("SqliteDb prepare reports syntax errors", "[storage][sqlite]") {
  auto db = SqliteDb::open(":memory:").value();

  auto prepared = db->prepare("SELEKT nothing");
  REQUIRE_FALSE(prepared.has_value());
  CHECK(prepared.error().kind == SqliteErrorKind::kError);
  CHECK(prepared.error().code == SQLITE_ERROR);
  CHECK_FALSE(prepared.error().message.empty());
  CHECK(db->errmsg() == prepared.error().message);
}

TEST_CASE("SqliteDb prepare rejects SQL with no statement", "[storage][sqlite]") {
  auto db = SqliteDb::open(":memory:").value();

  for (const char* sql : {"", "   \n\t", "-- only a comment"}) {
    auto prepared = db->prepare(sql);
    REQUIRE_FALSE(prepared.has_value());
    CHECK(prepared.error().kind == SqliteErrorKind::kError);
    CHECK(prepared.error().code == SQLITE_MISUSE);
    CHECK(prepared.error().message == "empty SQL statement");
  }
}

TEST_CASE("PreparedStatement step failures are step errors", "[storage][sqlite]") {
  auto db = SqliteDb::open(":memory:").value();
  REQUIRE(db->exec("CREATE TABLE t (id TEXT PRIMARY KEY)").has_value());
  REQUIRE(db->exec("INSERT INTO t VALUES ('a')").has_value());

  auto prepared = db->prepare("INSERT INTO t VALUES (?)");
  REQUIRE(prepared.has_value());
  auto& stmt = *prepared.value();
  REQUIRE(stmt.bind_text(1, "a").has_value());

  auto stepped = stmt.step();
  REQUIRE_FALSE(stepped.has_value());
  CHECK(stepped.error().kind == SqliteErrorKind::kStepError);
  CHECK((stepped.error().code & 0xff) == SQLITE_CONSTRAINT);
}

TEST_CASE("PreparedStatement bind out of range is an error", "[storage][sqlite]") {
  auto db = SqliteDb::open(":memory:").value();
  auto prepared = db->prepare("SELECT ?");
  REQUIRE(prepared.has_value());

  auto bound = prepared.value()->bind_int(5, 1);
  REQUIRE_FALSE(bound.has_value());
  CHECK(bound.error().code == SQLITE_RANGE);
}

TEST_CASE("PreparedStatement reset allows reuse", "[storage][sqlite]") {
  auto db = SqliteDb::open(":memory:").value();
  auto prepared = db->prepare("SELECT ?");
  REQUIRE(prepared.has_value());
  auto& stmt = *prepared.value();

  REQUIRE(stmt.bind_int(1, 1).has_value());
  REQUIRE(stmt.step_row().has_value());
  CHECK(stmt.column_int(0) == 1);

  stmt.reset();
  REQUIRE(stmt.bind_int(1, 2).has_value());
  REQUIRE(stmt.step_row().has_value());
  CHECK(stmt.column_int(0) == 2);
}

TEST_CASE("Busy and locked codes classify as busy", "[storage][sqlite]") {
  CHECK(is_busy_code(SQLITE_BUSY));
  CHECK(is_busy_code(SQLITE_LOCKED));
  CHECK(is_busy_code(SQLITE_BUSY_SNAPSHOT));
  CHECK(is_busy_code(SQLITE_LOCKED_SHAREDCACHE));
  CHECK_FALSE(is_busy_code(SQLITE_ERROR));
  CHECK_FALSE(is_busy_code(SQLITE_CONSTRAINT_PRIMARYKEY));

  CHECK(classify(SQLITE_BUSY_RECOVERY, SqliteErrorKind::kStepError) == SqliteErrorKind::kBusy);
  CHECK(classify(SQLITE_MISUSE, SqliteErrorKind::kStepError) == SqliteErrorKind::kStepError);
  CHECK(std::string(to_string(SqliteErrorKind::kDone)) == "done");
}

TEST_CASE("Write lock held by another connection surfaces as busy", "[storage][sqlite]") {
  const auto path = std::filesystem::temp_directory_path() / "ulidkit_busy_test.db";
  std::filesystem::remove(path);

  {
    auto first = SqliteDb::open(path.string()).value();
    auto second = SqliteDb::open(path.string()).value();
    REQUIRE(first->exec("CREATE TABLE t (id TEXT)").has_value());

    REQUIRE(first->exec("BEGIN IMMEDIATE").has_value());
    REQUIRE(first->exec("INSERT INTO t VALUES ('x')").has_value());

    // No busy timeout is configured, so the second writer fails immediately.
    auto blocked = second->exec("INSERT INTO t VALUES ('y')");
    REQUIRE_FALSE(blocked.has_value());
    CHECK(blocked.error().kind == SqliteErrorKind::kBusy);

    REQUIRE(first->exec("COMMIT").has_value());
  }

  std::filesystem::remove(path);
}
