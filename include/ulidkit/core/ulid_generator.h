#pragma once

#include "ulidkit/core/random_source.h"
#include "ulidkit/core/uint128.h"

#include <cstdint>
#include <string>

namespace ulidkit::core {

// GeneratorState is the memory of the last identifier minted.
// Zero in both fields means nothing has been generated yet.
// After every call both fields hold the values that call used.
struct GeneratorState {
  std::uint64_t last_timestamp{0};  // NOLINT(readability-identifier-naming) 48 significant bits
  Uint128 last_random{};            // NOLINT(readability-identifier-naming) 80 significant bits

  bool operator==(const GeneratorState&) const = default;
};

// UlidGenerator mints 26-character, lexicographically sortable identifiers:
// a 48-bit millisecond timestamp over an 80-bit payload, Crockford Base32 encoded.
//
// Ordering: for calls next(t1) then next(t2) with t1 <= t2 the second id sorts
// after the first. Within one millisecond (or when the clock goes backwards)
// the previous payload is incremented instead of drawing a new one.
//
// Payload exhaustion: if the incremented payload reaches 2^80 it wraps to 0.
// The id minted right after the wrap sorts BEFORE its predecessor with the same
// timestamp. No error is raised. Callers that need strict ordering under that
// load must detect it themselves (for example by advancing the timestamp).
//
// Thread safety: none. One instance must be used by one thread at a time;
// give each thread its own generator or serialise calls externally
// (SystemIdGenerator does the latter with a mutex).
class UlidGenerator {
 public:
  explicit UlidGenerator(std::uint64_t seed) : random_(seed) {}

  // Copying would fork the sequence and mint duplicate payloads.
  UlidGenerator(const UlidGenerator&) = delete;
  UlidGenerator& operator=(const UlidGenerator&) = delete;
  UlidGenerator(UlidGenerator&&) = default;
  UlidGenerator& operator=(UlidGenerator&&) = default;
  ~UlidGenerator() = default;

  // Mint an id for timestamp_ms. Bits above 48 are discarded.
  // Throws std::bad_alloc if the result string cannot be allocated.
  [[nodiscard]] std::string next(std::uint64_t timestamp_ms);

  // Mint an id for the current wall-clock millisecond.
  [[nodiscard]] std::string next_now();

  // Same algorithm as next() but returns the raw 128-bit value.
  [[nodiscard]] Uint128 next_value(std::uint64_t timestamp_ms);

  [[nodiscard]] const GeneratorState& state() const { return state_; }

  // Overwrite the in-process state. Intended for exercising edge cases,
  // not for persisting a generator across restarts.
  void restore(const GeneratorState& state) { state_ = state; }

 private:
  [[nodiscard]] Uint128 random80();

  RandomSource random_;
  GeneratorState state_{};
};

}  // namespace ulidkit::core
