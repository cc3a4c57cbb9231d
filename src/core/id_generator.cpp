#include "ulidkit/core/id_generator.h"

#include <random>

namespace ulidkit::core {

namespace {

std::string with_prefix(std::string_view prefix, const std::string& ulid) {
  std::string out;
  out.reserve(prefix.size() + 1 + ulid.size());
  out.append(prefix);
  out.push_back('-');
  out.append(ulid);
  return out;
}

}  // namespace

std::uint64_t random_seed() {
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) | static_cast<std::uint64_t>(rd());
}

SystemIdGenerator::SystemIdGenerator() : clock_(system_clock_), ulid_(random_seed()) {}

SystemIdGenerator::SystemIdGenerator(std::uint64_t seed, IClock& clock)
    : clock_(clock), ulid_(seed) {}

std::string SystemIdGenerator::next(std::string_view prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  // Clock read under the lock so timestamps reach the generator in call order.
  return with_prefix(prefix, ulid_.next(clock_.now_unix_millis()));
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  return with_prefix(prefix, ulid_.next(clock_.now_unix_millis()));
}

}  // namespace ulidkit::core
