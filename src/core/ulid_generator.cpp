#include "ulidkit/core/ulid_generator.h"

#include "ulidkit/core/encoder.h"
#include "ulidkit/core/logging.h"
#include "ulidkit/core/time.h"

namespace ulidkit::core {

namespace {

// payload + 1 within 80 bits; 2^80 wraps to 0.
Uint128 increment_payload(const Uint128& payload) {
  Uint128 next{payload.hi & kPayloadHiMask, payload.lo + 1};
  if (next.lo == 0) {
    next.hi = (next.hi + 1) & kPayloadHiMask;
  }
  return next;
}

}  // namespace

std::string UlidGenerator::next(std::uint64_t timestamp_ms) {
  return encode_ulid(next_value(timestamp_ms));
}

std::string UlidGenerator::next_now() {
  return next(to_unix_millis(now_utc()));
}

Uint128 UlidGenerator::next_value(std::uint64_t timestamp_ms) {
  const std::uint64_t ts = timestamp_ms & kTimestampMask;

  Uint128 payload;
  if (ts > state_.last_timestamp) {
    payload = random80();
  } else {
    // Same millisecond, or the clock went backwards: keep ordering by counting up.
    payload = increment_payload(state_.last_random);
    if (payload == Uint128{}) {
      logger()->debug("ulid payload space exhausted at timestamp {}, wrapped to zero", ts);
    }
  }

  state_ = GeneratorState{ts, payload};
  return compose_ulid(ts, payload);
}

Uint128 UlidGenerator::random80() {
  const std::uint64_t hi = random_.next_u64();
  const std::uint16_t lo = random_.next_u16();
  // hi occupies payload bits 79..16, lo bits 15..0.
  return Uint128{hi >> 48, (hi << 16) | lo};
}

}  // namespace ulidkit::core
