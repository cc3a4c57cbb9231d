#pragma once

#ifdef ULIDKIT_STORAGE_BOUNDARY_GUARD
#error "Concrete storage header included in a guarded translation unit; use interfaces only."
#endif

#include "ulidkit/storage/record_store.h"
#include "ulidkit/storage/sqlite/sqlite_db.h"

#include <memory>

namespace ulidkit::storage::sqlite {

// SqliteRecordStore implements IRecordStore with SQLite backend.
// Requires schema v1. Ids are bound as length-delimited text.
// Guarantees deterministic ordering (ORDER BY record_id).
class SqliteRecordStore final : public IRecordStore {
 public:
  explicit SqliteRecordStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> insert(const domain::Record& record) override;
  [[nodiscard]] std::optional<domain::Record> get(const core::RecordId& id) const override;
  [[nodiscard]] std::vector<domain::Record> list_all() const override;
  [[nodiscard]] std::vector<domain::Record> list_by_kind(const std::string& kind) const override;

  // Rowid assigned to the most recent insert on the underlying connection.
  [[nodiscard]] std::int64_t last_rowid() const { return db_->last_insert_rowid(); }

 private:
  std::shared_ptr<SqliteDb> db_;

  [[nodiscard]] static domain::Record row_to_record(const PreparedStatement& stmt);
  [[nodiscard]] static std::vector<domain::Record> collect(PreparedStatement& stmt);
};

}  // namespace ulidkit::storage::sqlite
