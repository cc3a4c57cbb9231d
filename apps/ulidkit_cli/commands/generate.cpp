#include "generate.h"

#include "ulidkit/app/app_service.h"
#include "ulidkit/core/clock.h"
#include "ulidkit/core/id_generator.h"
#include "ulidkit/core/logging.h"
#include "ulidkit/core/ulid_generator.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct GenerateCliConfig {
  std::uint64_t count{1};
  std::optional<std::uint64_t> seed;
  std::optional<std::uint64_t> timestamp_ms;
  std::optional<std::string> prefix;
  bool json{false};
  bool help{false};
};

std::vector<ulidkit::apps::Option<GenerateCliConfig>> generate_options() {
  return {
      {"--count", true, "Number of ids to print (default 1, at most 1000000)",
       [](GenerateCliConfig& c, const std::string& v) {
         auto n = ulidkit::apps::parse_u64(v);
         if (!n.has_value() || n.value() == 0 || n.value() > ulidkit::app::kMaxMintCount) {
           std::cerr << "Invalid --count: " << v << " (expected 1.." << ulidkit::app::kMaxMintCount
                     << ")\n";
           return false;
         }
         c.count = n.value();
         return true;
       }},
      {"--seed", true, "PRNG seed; equal seeds and timestamps reproduce the same ids",
       [](GenerateCliConfig& c, const std::string& v) {
         c.seed = ulidkit::apps::parse_u64(v);
         if (!c.seed.has_value()) {
           std::cerr << "Invalid --seed: " << v << " (expected an unsigned 64-bit integer)\n";
           return false;
         }
         return true;
       }},
      {"--timestamp", true, "Milliseconds since the Unix epoch to use for every id",
       [](GenerateCliConfig& c, const std::string& v) {
         c.timestamp_ms = ulidkit::apps::parse_u64(v);
         if (!c.timestamp_ms.has_value()) {
           std::cerr << "Invalid --timestamp: " << v << " (expected milliseconds)\n";
           return false;
         }
         return true;
       }},
      {"--prefix", true, "Emit <prefix>-<ULID> instead of the bare ULID",
       [](GenerateCliConfig& c, const std::string& v) {
         c.prefix = v;
         return true;
       }},
      {"--json", false, "Print a JSON document instead of one id per line",
       [](GenerateCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
      {"--log-level", true, "trace|debug|info|warn|error|critical|off",
       [](GenerateCliConfig&, const std::string& v) {
         if (!ulidkit::core::set_log_level(v)) {
           std::cerr << "Invalid --log-level: " << v << "\n";
           return false;
         }
         return true;
       }},
      {"--help", false, "Show this help",
       [](GenerateCliConfig& c, const std::string&) {
         c.help = true;
         return true;
       }},
  };
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = generate_options();
  auto parsed = ulidkit::apps::parse_options(argc, argv, options, 2);
  const auto& config = parsed.config;

  if (config.help) {
    std::cout << "Usage: ulidkit_cli generate [options]\n";
    ulidkit::apps::print_options(std::cout, options);
    return 0;
  }
  if (!parsed.ok) {
    return 1;
  }

  const std::uint64_t seed =
      config.seed.has_value() ? config.seed.value() : ulidkit::core::random_seed();
  ulidkit::core::UlidGenerator gen(seed);
  ulidkit::core::SystemClock clock;

  ulidkit::app::MintRequest req;
  req.count = static_cast<std::size_t>(config.count);
  req.timestamp_ms = config.timestamp_ms;
  req.prefix = config.prefix;

  ulidkit::core::logger()->debug("generating {} id(s) with seed {}", req.count, seed);
  return execute_generate(req, gen, clock, config.json);
}
