#include "record.h"

#include "ulidkit/core/clock.h"
#include "ulidkit/core/id_generator.h"
#include "ulidkit/core/logging.h"
#include "ulidkit/storage/sqlite/sqlite_db.h"
#include "ulidkit/storage/sqlite/sqlite_record_store.h"

#include "record_logic.h"
#include "shared/arg_parser.h"
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {

struct RecordCliConfig {
  std::string db_path{"data/ulidkit.db"};
  std::optional<std::string> kind;
  std::string payload;
  std::optional<std::uint64_t> seed;
};

ulidkit::apps::Option<RecordCliConfig> db_option() {
  return {"--db", true, "Path to SQLite database file (default data/ulidkit.db)",
          [](RecordCliConfig& c, const std::string& v) {
            c.db_path = v;
            return true;
          }};
}

ulidkit::apps::Option<RecordCliConfig> kind_option() {
  return {"--kind", true, "Record kind",
          [](RecordCliConfig& c, const std::string& v) {
            c.kind = v;
            return true;
          }};
}

ulidkit::apps::Option<RecordCliConfig> log_level_option() {
  return {"--log-level", true, "trace|debug|info|warn|error|critical|off",
          [](RecordCliConfig&, const std::string& v) {
            if (!ulidkit::core::set_log_level(v)) {
              std::cerr << "Invalid --log-level: " << v << "\n";
              return false;
            }
            return true;
          }};
}

// Open DB and apply schema v1. Prints the error and returns nullptr on failure.
std::shared_ptr<ulidkit::storage::sqlite::SqliteDb> open_db(const std::string& path) {
  const std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty() && path != ":memory:") {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      std::cerr << "Failed to create directory " << parent << ": " << ec.message() << "\n";
      return nullptr;
    }
  }

  auto db_result = ulidkit::storage::sqlite::SqliteDb::open(path);
  if (!db_result.has_value()) {
    std::cerr << "Error: " << db_result.error() << "\n";
    return nullptr;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Error: " << schema_result.error() << "\n";
    return nullptr;
  }
  return db;
}

}  // namespace

int cmd_record_add(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<ulidkit::apps::Option<RecordCliConfig>> options = {
      db_option(),
      kind_option(),
      {"--payload", true, "Record payload text",
       [](RecordCliConfig& c, const std::string& v) {
         c.payload = v;
         return true;
       }},
      {"--seed", true, "PRNG seed for the id generator (default: random)",
       [](RecordCliConfig& c, const std::string& v) {
         c.seed = ulidkit::apps::parse_u64(v);
         if (!c.seed.has_value()) {
           std::cerr << "Invalid --seed: " << v << " (expected an unsigned 64-bit integer)\n";
           return false;
         }
         return true;
       }},
      log_level_option(),
  };
  auto parsed = ulidkit::apps::parse_options(argc, argv, options, 3);
  if (!parsed.ok) {
    return 1;
  }
  const auto& config = parsed.config;

  if (!config.kind.has_value()) {
    std::cerr << "Error: --kind <kind> is required\n";
    return 1;
  }

  auto db = open_db(config.db_path);
  if (!db) {
    return 1;
  }

  ulidkit::storage::sqlite::SqliteRecordStore store(db);
  ulidkit::core::SystemClock clock;
  const std::uint64_t seed =
      config.seed.has_value() ? config.seed.value() : ulidkit::core::random_seed();
  ulidkit::core::SystemIdGenerator id_gen(seed, clock);

  return execute_record_add({config.kind.value(), config.payload}, store, id_gen, clock);
}

int cmd_record_list(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<ulidkit::apps::Option<RecordCliConfig>> options = {
      db_option(),
      kind_option(),
      log_level_option(),
  };
  auto parsed = ulidkit::apps::parse_options(argc, argv, options, 3);
  if (!parsed.ok) {
    return 1;
  }
  const auto& config = parsed.config;

  auto db = open_db(config.db_path);
  if (!db) {
    return 1;
  }

  ulidkit::storage::sqlite::SqliteRecordStore store(db);
  return execute_record_list(config.kind, store);
}
