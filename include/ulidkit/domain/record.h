#pragma once

#include "ulidkit/core/ids.h"

#include <nlohmann/json.hpp>

#include <string>

namespace ulidkit::domain {

// Record is one row keyed by a ULID-bearing id.
// The id is opaque text to storage; sorting by it sorts by creation time.
struct Record {
  core::RecordId record_id;  // NOLINT(readability-identifier-naming)
  std::string kind;          // NOLINT(readability-identifier-naming)
  std::string payload;       // NOLINT(readability-identifier-naming)
  std::string created_at;    // ISO 8601 UTC
};

// Keys are sorted alphabetically (nlohmann::json uses std::map internally).
[[nodiscard]] nlohmann::json record_to_json(const Record& record);

// Throws nlohmann::json::exception on missing or mistyped fields.
[[nodiscard]] Record record_from_json(const nlohmann::json& j);

}  // namespace ulidkit::domain
