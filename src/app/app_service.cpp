#include "ulidkit/app/app_service.h"

#include "ulidkit/core/ids.h"
#include "ulidkit/core/logging.h"

#include <string>
#include <utility>

namespace ulidkit::app {

core::Result<std::vector<std::string>, std::string> mint_ids(const MintRequest& req,
                                                             core::UlidGenerator& gen,
                                                             core::IClock& clock) {
  if (req.count > kMaxMintCount) {
    return core::Result<std::vector<std::string>, std::string>::err(
        "Count " + std::to_string(req.count) + " exceeds the limit of " +
        std::to_string(kMaxMintCount));
  }

  std::vector<std::string> ids;
  ids.reserve(req.count);
  for (std::size_t i = 0; i < req.count; ++i) {
    const std::uint64_t ts =
        req.timestamp_ms.has_value() ? req.timestamp_ms.value() : clock.now_unix_millis();
    std::string ulid = gen.next(ts);
    if (req.prefix.has_value()) {
      ids.push_back(req.prefix.value() + "-" + ulid);
    } else {
      ids.push_back(std::move(ulid));
    }
  }
  return core::Result<std::vector<std::string>, std::string>::ok(std::move(ids));
}

core::Result<domain::Record, std::string> create_record(const CreateRecordRequest& req,
                                                        storage::IRecordStore& store,
                                                        core::IIdGenerator& id_gen,
                                                        core::IClock& clock) {
  if (req.kind.empty()) {
    return core::Result<domain::Record, std::string>::err("Record kind must not be empty");
  }

  domain::Record record;
  record.record_id = core::new_record_id(id_gen);
  record.kind = req.kind;
  record.payload = req.payload;
  record.created_at = clock.now_iso8601();

  auto inserted = store.insert(record);
  if (!inserted.has_value()) {
    return core::Result<domain::Record, std::string>::err(inserted.error());
  }

  core::logger()->debug("created record {} (kind={})", record.record_id.value, record.kind);
  return core::Result<domain::Record, std::string>::ok(std::move(record));
}

std::vector<domain::Record> list_records(const std::optional<std::string>& kind,
                                         const storage::IRecordStore& store) {
  if (kind.has_value()) {
    return store.list_by_kind(kind.value());
  }
  return store.list_all();
}

}  // namespace ulidkit::app
