#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "readlater/common.hpp"

namespace readlater::util {

// Time utilities for API timestamps and display
class Time {
 public:
  // Format time as RFC3339 string (ISO 8601)
  static std::string toRfc3339(std::chrono::system_clock::time_point time);

  // Unix epoch seconds, the unit the API uses for every timestamp
  static std::int64_t toUnixSeconds(std::chrono::system_clock::time_point time);
  static std::chrono::system_clock::time_point fromUnixSeconds(std::int64_t seconds);

  // Get current time
  static std::chrono::system_clock::time_point now();

  // Format duration for human reading
  static std::string formatDuration(std::chrono::nanoseconds duration);

  // Parse human-readable relative time (e.g., "2 days ago")
  static Result<std::chrono::system_clock::time_point> parseRelativeTime(const std::string& str);
};

}  // namespace readlater::util
