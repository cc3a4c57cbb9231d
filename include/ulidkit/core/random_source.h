#pragma once

#include <cstdint>
#include <random>

namespace ulidkit::core {

// RandomSource supplies fixed-width pseudorandom integers from a seeded engine.
// Same seed and same call sequence produce the same outputs on every platform:
// std::mt19937_64's output sequence is fixed by the standard, and no
// distribution object (whose algorithm is implementation-defined) is involved.
class RandomSource {
 public:
  explicit RandomSource(std::uint64_t seed) : engine_(seed) {}

  [[nodiscard]] std::uint64_t next_u64();

  // Top 16 bits of one engine draw.
  [[nodiscard]] std::uint16_t next_u16();

 private:
  std::mt19937_64 engine_;
};

}  // namespace ulidkit::core
