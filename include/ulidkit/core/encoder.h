#pragma once

#include "ulidkit/core/uint128.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace ulidkit::core {

// Crockford Base32: digits then letters, skipping I, L, O and U.
constexpr std::string_view kCrockfordAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// 26 symbols x 5 bits = 130 bits; the top two bits of the view are always zero.
constexpr std::size_t kEncodedLength = 26;

// Number of leading symbols fully determined by the 48-bit timestamp.
constexpr std::size_t kTimestampSymbols = 10;

// encode_ulid_to writes the 26-symbol encoding of value into out.
// Pure and total: every 128-bit value has exactly one encoding. No allocation.
void encode_ulid_to(const Uint128& value, char (&out)[kEncodedLength]);  // NOLINT(modernize-avoid-c-arrays)

// encode_ulid returns the encoding as an owned string.
// Throws std::bad_alloc if the string cannot be allocated.
[[nodiscard]] std::string encode_ulid(const Uint128& value);

}  // namespace ulidkit::core
