#include "ulidkit/core/clock.h"

#include "ulidkit/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ulidkit::core {

std::string IClock::now_iso8601() {
  return format_iso8601(now_unix_millis());
}

std::uint64_t SystemClock::now_unix_millis() {
  return to_unix_millis(now_utc());
}

std::uint64_t FixedClock::now_unix_millis() {
  return fixed_millis_;
}

std::string format_iso8601(std::uint64_t unix_millis) {
  const auto seconds = static_cast<std::time_t>(unix_millis / 1000);
  const auto millis = static_cast<int>(unix_millis % 1000);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return oss.str();
}

}  // namespace ulidkit::core
