#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace ulidkit::core {

// Name under which the library logger is registered with spdlog.
constexpr const char* kLoggerName = "ulidkit";

// logger returns the process-wide library logger (stderr, colour).
// Created on first use and registered with spdlog so applications can
// reconfigure it through spdlog::get(kLoggerName).
std::shared_ptr<spdlog::logger> logger();

// set_log_level accepts trace|debug|info|warn|error|critical|off.
// Returns false and leaves the level unchanged for any other string.
bool set_log_level(std::string_view level);

}  // namespace ulidkit::core
