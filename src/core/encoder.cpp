#include "ulidkit/core/encoder.h"

namespace ulidkit::core {

void encode_ulid_to(const Uint128& value, char (&out)[kEncodedLength]) {  // NOLINT(modernize-avoid-c-arrays)
  Uint128 v = value;
  // Fill from the last symbol backwards so the most significant group lands first.
  for (std::size_t i = kEncodedLength; i > 0; --i) {
    const auto idx = static_cast<std::size_t>(v.lo & 0x1FU);
    out[i - 1] = kCrockfordAlphabet[idx];  // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
    v = shift_right_5(v);
  }
}

std::string encode_ulid(const Uint128& value) {
  char buf[kEncodedLength];  // NOLINT(modernize-avoid-c-arrays)
  encode_ulid_to(value, buf);
  return std::string(buf, kEncodedLength);
}

}  // namespace ulidkit::core
