#include "ulidkit/core/logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace ulidkit::core {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;
  std::call_once(once, [] {
    instance = spdlog::get(kLoggerName);
    if (!instance) {
      instance = spdlog::stderr_color_mt(kLoggerName);
      instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
      instance->set_level(spdlog::level::info);
    }
  });
  return instance;
}

bool set_log_level(std::string_view level) {
  const std::string name(level);
  const auto parsed = spdlog::level::from_str(name);
  // from_str maps unknown names to off; only accept off when asked for it.
  if (parsed == spdlog::level::off && name != "off") {
    return false;
  }
  logger()->set_level(parsed);
  return true;
}

}  // namespace ulidkit::core
