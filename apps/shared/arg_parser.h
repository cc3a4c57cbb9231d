#pragma once

#include <charconv>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ulidkit::apps {

// Option describes a single command-line flag accepted by an app or subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. Any failure
// is reflected in ParseOutcome::ok so the caller can refuse to run.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParseOutcome {
  Config config;   // NOLINT(readability-identifier-naming)
  bool ok{true};   // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and returns the populated config.
// Unknown flags and missing values are reported to stderr and mark the outcome
// as failed. Unknown non-flag tokens are silently skipped (to allow callers to
// handle positional arguments separately).
template <typename Config>
ParseOutcome<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                   const std::vector<Option<Config>>& options, int start = 1,
                                   Config default_config = {}) {
  ParseOutcome<Config> outcome{std::move(default_config), true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          outcome.ok &= opt->handler(
              outcome.config,
              argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          outcome.ok = false;
        }
      } else {
        outcome.ok &= opt->handler(outcome.config, "");
      }
    } else if (!arg.empty() && arg[0] == '-') {
      // Only flag-like tokens are reported as unknown.
      std::cerr << "Unknown option: " << arg << "\n";
      outcome.ok = false;
    }
  }

  return outcome;
}

// print_options writes one "  <name> <description>" line per option.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

// parse_u64 accepts a plain decimal number that fits in 64 bits.
inline std::optional<std::uint64_t> parse_u64(const std::string& text) {
  std::uint64_t value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

}  // namespace ulidkit::apps
