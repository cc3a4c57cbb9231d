#include "ulidkit/domain/record.h"

namespace ulidkit::domain {

nlohmann::json record_to_json(const Record& record) {
  nlohmann::json j;
  j["created_at"] = record.created_at;
  j["kind"] = record.kind;
  j["payload"] = record.payload;
  j["record_id"] = record.record_id.value;
  return j;
}

Record record_from_json(const nlohmann::json& j) {
  Record record;
  record.record_id = core::RecordId{j.at("record_id").get<std::string>()};
  record.kind = j.at("kind").get<std::string>();
  record.payload = j.at("payload").get<std::string>();
  record.created_at = j.at("created_at").get<std::string>();
  return record;
}

}  // namespace ulidkit::domain
