#define ULIDKIT_STORAGE_BOUNDARY_GUARD
#include "record_logic.h"

#include "ulidkit/domain/record.h"

#include <nlohmann/json.hpp>

#include <iostream>

int execute_record_add(const ulidkit::app::CreateRecordRequest& req,
                       ulidkit::storage::IRecordStore& store,
                       ulidkit::core::IIdGenerator& id_gen, ulidkit::core::IClock& clock) {
  auto result = ulidkit::app::create_record(req, store, id_gen, clock);
  if (!result.has_value()) {
    std::cerr << "Failed to add record: " << result.error() << "\n";
    return 1;
  }

  std::cout << ulidkit::domain::record_to_json(result.value()).dump(2) << "\n";
  return 0;
}

int execute_record_list(const std::optional<std::string>& kind,
                        const ulidkit::storage::IRecordStore& store) {
  const auto records = ulidkit::app::list_records(kind, store);

  nlohmann::json out;
  if (kind.has_value()) {
    out["kind"] = kind.value();
  }
  out["records"] = nlohmann::json::array();
  for (const auto& rec : records) {
    out["records"].push_back(ulidkit::domain::record_to_json(rec));
  }

  std::cout << out.dump(2) << "\n";
  return 0;
}
