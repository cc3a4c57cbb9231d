#pragma once

#include <chrono>
#include <cstdint>

namespace ulidkit::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

// Milliseconds since the Unix epoch. Pre-epoch times clamp to 0.
inline std::uint64_t to_unix_millis(const Timestamp ts) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
  return ms < 0 ? 0 : static_cast<std::uint64_t>(ms);
}

}  // namespace ulidkit::core
