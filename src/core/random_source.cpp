#include "ulidkit/core/random_source.h"

namespace ulidkit::core {

std::uint64_t RandomSource::next_u64() {
  return engine_();
}

std::uint16_t RandomSource::next_u16() {
  return static_cast<std::uint16_t>(engine_() >> 48);
}

}  // namespace ulidkit::core
