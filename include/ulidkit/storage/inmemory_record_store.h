#pragma once

#include "ulidkit/storage/record_store.h"

#include <map>

namespace ulidkit::storage {

// InMemoryRecordStore stores Records in-memory using std::map.
// std::map guarantees deterministic iteration order (sorted by RecordId).
class InMemoryRecordStore final : public IRecordStore {
 public:
  [[nodiscard]] core::Result<bool, std::string> insert(const domain::Record& record) override;
  [[nodiscard]] std::optional<domain::Record> get(const core::RecordId& id) const override;
  [[nodiscard]] std::vector<domain::Record> list_all() const override;
  [[nodiscard]] std::vector<domain::Record> list_by_kind(const std::string& kind) const override;

 private:
  std::map<core::RecordId, domain::Record> records_;
};

}  // namespace ulidkit::storage
