#pragma once

#include "ulidkit/core/result.h"
#include "ulidkit/domain/record.h"

#include <optional>
#include <string>
#include <vector>

namespace ulidkit::storage {

// Record store interface isolates persistence for deterministic testing.
// Listings are ordered by record_id, which for ULID keys is creation order.
class IRecordStore {
 public:
  virtual ~IRecordStore() = default;

  // Insert a new record. A record_id that already exists is an error.
  [[nodiscard]] virtual core::Result<bool, std::string> insert(const domain::Record& record) = 0;
  [[nodiscard]] virtual std::optional<domain::Record> get(const core::RecordId& id) const = 0;
  [[nodiscard]] virtual std::vector<domain::Record> list_all() const = 0;
  [[nodiscard]] virtual std::vector<domain::Record> list_by_kind(const std::string& kind) const = 0;
};

}  // namespace ulidkit::storage
