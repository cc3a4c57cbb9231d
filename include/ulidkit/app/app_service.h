#pragma once

#include "ulidkit/core/clock.h"
#include "ulidkit/core/id_generator.h"
#include "ulidkit/core/result.h"
#include "ulidkit/core/ulid_generator.h"
#include "ulidkit/domain/record.h"
#include "ulidkit/storage/record_store.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ulidkit::app {

// ────────────────────────────────────────────────────────────────
// Identifier Minting
// ────────────────────────────────────────────────────────────────

struct MintRequest {
  std::size_t count{1};                       // NOLINT(readability-identifier-naming)
  std::optional<std::uint64_t> timestamp_ms;  // nullopt: read the clock once per id
  std::optional<std::string> prefix;          // emits "<prefix>-<ULID>" when set
};

// Upper bound on MintRequest::count.
constexpr std::size_t kMaxMintCount = 1'000'000;

// Mint req.count identifiers from gen, in generation order.
// With a fixed timestamp every id after the first increments the payload.
// A count above kMaxMintCount is rejected before anything is generated.
[[nodiscard]] core::Result<std::vector<std::string>, std::string> mint_ids(
    const MintRequest& req, core::UlidGenerator& gen, core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Records
// ────────────────────────────────────────────────────────────────

struct CreateRecordRequest {
  std::string kind;     // NOLINT(readability-identifier-naming)
  std::string payload;  // NOLINT(readability-identifier-naming)
};

// Mint a "rec-<ULID>" id and a created_at timestamp, then insert.
// Returns the stored record, or the store's error message.
[[nodiscard]] core::Result<domain::Record, std::string> create_record(
    const CreateRecordRequest& req, storage::IRecordStore& store, core::IIdGenerator& id_gen,
    core::IClock& clock);

// All records, or only those of one kind, in creation order.
[[nodiscard]] std::vector<domain::Record> list_records(const std::optional<std::string>& kind,
                                                       const storage::IRecordStore& store);

}  // namespace ulidkit::app
