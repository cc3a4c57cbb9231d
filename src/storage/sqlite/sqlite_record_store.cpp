#include "ulidkit/storage/sqlite/sqlite_record_store.h"

#include "ulidkit/core/logging.h"

#include <array>
#include <string_view>

namespace ulidkit::storage::sqlite {

SqliteRecordStore::SqliteRecordStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<bool, std::string> SqliteRecordStore::insert(const domain::Record& record) {
  using InsertResult = core::Result<bool, std::string>;

  const char* sql = R"(
    INSERT INTO records (record_id, kind, payload, created_at)
    VALUES (?, ?, ?, ?)
  )";

  auto prepared = db_->prepare(sql);
  if (!prepared.has_value()) {
    return InsertResult::err("Failed to prepare insert: " + prepared.error().message);
  }
  auto& stmt = *prepared.value();

  const std::array<std::string_view, 4> values{record.record_id.value, record.kind, record.payload,
                                               record.created_at};
  for (std::size_t i = 0; i < values.size(); ++i) {
    auto bound = stmt.bind_text(static_cast<int>(i) + 1, values[i]);
    if (!bound.has_value()) {
      return InsertResult::err("Failed to bind record: " + bound.error().message);
    }
  }

  auto stepped = stmt.step();
  if (!stepped.has_value()) {
    const auto& error = stepped.error();
    return InsertResult::err(std::string("Insert failed (") + to_string(error.kind) +
                             "): " + error.message);
  }

  core::logger()->debug("record inserted: {} (rowid {})", record.record_id.value,
                        db_->last_insert_rowid());
  return InsertResult::ok(true);
}

std::optional<domain::Record> SqliteRecordStore::get(const core::RecordId& id) const {
  const char* sql =
      "SELECT record_id, kind, payload, created_at FROM records WHERE record_id = ?";

  auto prepared = db_->prepare(sql);
  if (!prepared.has_value()) {
    core::logger()->warn("record lookup for {} failed ({}): {}", id.value,
                         to_string(prepared.error().kind), prepared.error().message);
    return std::nullopt;
  }
  auto& stmt = *prepared.value();

  if (!stmt.bind_text(1, id.value).has_value()) {
    return std::nullopt;
  }

  auto stepped = stmt.step_row();
  if (!stepped.has_value()) {
    const auto& error = stepped.error();
    if (error.kind != SqliteErrorKind::kDone) {
      core::logger()->warn("record lookup for {} failed ({}): {}", id.value, to_string(error.kind),
                           error.message);
    }
    return std::nullopt;
  }
  return row_to_record(stmt);
}

std::vector<domain::Record> SqliteRecordStore::list_all() const {
  const char* sql = "SELECT record_id, kind, payload, created_at FROM records ORDER BY record_id";

  auto prepared = db_->prepare(sql);
  if (!prepared.has_value()) {
    return {};
  }
  return collect(*prepared.value());
}

std::vector<domain::Record> SqliteRecordStore::list_by_kind(const std::string& kind) const {
  const char* sql =
      "SELECT record_id, kind, payload, created_at FROM records WHERE kind = ?"
      " ORDER BY record_id";

  auto prepared = db_->prepare(sql);
  if (!prepared.has_value()) {
    return {};
  }
  auto& stmt = *prepared.value();
  if (!stmt.bind_text(1, kind).has_value()) {
    return {};
  }
  return collect(stmt);
}

domain::Record SqliteRecordStore::row_to_record(const PreparedStatement& stmt) {
  domain::Record record;
  record.record_id = core::RecordId{stmt.column_text(0)};
  record.kind = stmt.column_text(1);
  record.payload = stmt.column_text(2);
  record.created_at = stmt.column_text(3);
  return record;
}

std::vector<domain::Record> SqliteRecordStore::collect(PreparedStatement& stmt) {
  std::vector<domain::Record> result;
  while (true) {
    auto stepped = stmt.step();
    if (!stepped.has_value()) {
      core::logger()->warn("record listing stopped early: {}", stepped.error().message);
      break;
    }
    if (!stepped.value()) {
      break;
    }
    result.push_back(row_to_record(stmt));
  }
  return result;
}

}  // namespace ulidkit::storage::sqlite
