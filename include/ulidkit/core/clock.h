#pragma once

#include <cstdint>
#include <string>

namespace ulidkit::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests/demos use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Milliseconds since the Unix epoch.
  virtual std::uint64_t now_unix_millis() = 0;

  // Same instant in ISO 8601 format (UTC, millisecond precision).
  // Contract: returned string is non-empty and valid ISO 8601.
  virtual std::string now_iso8601();

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::uint64_t now_unix_millis() override;
};

// Fixed clock: returns constant timestamp for deterministic tests/demos.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::uint64_t fixed_millis) : fixed_millis_(fixed_millis) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::uint64_t now_unix_millis() override;

  // Move the fixed instant, e.g. to step through milliseconds in a test.
  void set(std::uint64_t millis) { fixed_millis_ = millis; }

 private:
  std::uint64_t fixed_millis_;
};

// format_iso8601 renders Unix milliseconds as YYYY-MM-DDTHH:MM:SS.mmmZ.
std::string format_iso8601(std::uint64_t unix_millis);

}  // namespace ulidkit::core
