#include "ulidkit/storage/inmemory_record_store.h"

namespace ulidkit::storage {

core::Result<bool, std::string> InMemoryRecordStore::insert(const domain::Record& record) {
  if (!records_.emplace(record.record_id, record).second) {
    return core::Result<bool, std::string>::err("Duplicate record_id: " + record.record_id.value);
  }
  return core::Result<bool, std::string>::ok(true);
}

std::optional<domain::Record> InMemoryRecordStore::get(const core::RecordId& id) const {
  auto it = records_.find(id);
  if (it != records_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<domain::Record> InMemoryRecordStore::list_all() const {
  std::vector<domain::Record> result;
  for (const auto& [id, record] : records_) {
    result.push_back(record);
  }
  return result;
}

std::vector<domain::Record> InMemoryRecordStore::list_by_kind(const std::string& kind) const {
  std::vector<domain::Record> result;
  for (const auto& [id, record] : records_) {
    if (record.kind == kind) {
      result.push_back(record);
    }
  }
  return result;
}

}  // namespace ulidkit::storage
