#pragma once

#include <compare>
#include <cstdint>

namespace ulidkit::core {

// Uint128 is an unsigned 128-bit value held as two 64-bit words.
struct Uint128 {
  std::uint64_t hi{0};  // NOLINT(readability-identifier-naming)
  std::uint64_t lo{0};  // NOLINT(readability-identifier-naming)

  // Word order makes the defaulted comparison numeric.
  auto operator<=>(const Uint128&) const = default;
};

// Widths of the identifier layout: 48-bit timestamp over an 80-bit payload.
constexpr int kTimestampBits = 48;
constexpr int kPayloadBits = 80;
constexpr std::uint64_t kTimestampMask = 0xFFFFFFFFFFFFULL;

// The payload occupies the whole low word plus the low 16 bits of the high word.
constexpr std::uint64_t kPayloadHiMask = 0xFFFFULL;

constexpr Uint128 kPayloadMax{kPayloadHiMask, ~0ULL};

// compose_ulid builds (timestamp48 << 80) | payload80.
// timestamp is masked to 48 bits and payload to 80 bits first.
constexpr Uint128 compose_ulid(std::uint64_t timestamp, const Uint128& payload) {
  const std::uint64_t ts = timestamp & kTimestampMask;
  return Uint128{(ts << (kPayloadBits - 64)) | (payload.hi & kPayloadHiMask), payload.lo};
}

// Shift right by 5 bits, the width of one Base32 symbol.
constexpr Uint128 shift_right_5(const Uint128& v) {
  return Uint128{v.hi >> 5, (v.lo >> 5) | (v.hi << 59)};
}

}  // namespace ulidkit::core
