#pragma once

#include "ulidkit/core/clock.h"
#include "ulidkit/core/ulid_generator.h"

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace ulidkit::core {

// Abstract ID generator interface for dependency injection.
// Allows production code to use wall-clock ULIDs while tests/demos use a fixed clock and seed.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Generate next ID with given prefix.
  // Contract: returned ID is "<prefix>-<26-char ULID>" and sorts after every
  // ID previously returned by this instance for the same prefix
  // (apart from the payload wraparound documented on UlidGenerator).
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// Production ID generator: a UlidGenerator behind a mutex, timestamps from a clock.
// Thread-safe. The clock must outlive the generator.
class SystemIdGenerator final : public IIdGenerator {
 public:
  // Seeds from std::random_device and reads the system clock.
  SystemIdGenerator();
  SystemIdGenerator(std::uint64_t seed, IClock& clock);
  ~SystemIdGenerator() override = default;

  // Not copyable or movable (contains mutex)
  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  SystemClock system_clock_;
  IClock& clock_;
  std::mutex mutex_;
  UlidGenerator ulid_;
};

// Deterministic ID generator: fixed seed and fixed millisecond.
// For tests and demos where reproducible output is required.
// Thread-safe. Same seed, same instant and same sequence of next() calls produce the same IDs.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  static constexpr std::uint64_t kDefaultSeed = 0;
  static constexpr std::uint64_t kDefaultMillis = 1767225600000ULL;  // 2026-01-01T00:00:00Z

  explicit DeterministicIdGenerator(std::uint64_t seed = kDefaultSeed,
                                    std::uint64_t fixed_millis = kDefaultMillis)
      : clock_(fixed_millis), ulid_(seed) {}
  ~DeterministicIdGenerator() override = default;

  // Not copyable or movable (contains mutex)
  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  FixedClock clock_;
  std::mutex mutex_;
  UlidGenerator ulid_;
};

// random_seed draws a seed from std::random_device.
std::uint64_t random_seed();

}  // namespace ulidkit::core
