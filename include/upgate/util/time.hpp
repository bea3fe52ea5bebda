#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "upgate/common.hpp"

namespace upgate::util {

// RFC3339 timestamps (UTC, millisecond precision) and file-clock conversion
class Time {
 public:
  // Format time as RFC3339 string, e.g. 2024-05-01T12:30:00.250Z
  static std::string toRfc3339(std::chrono::system_clock::time_point time);

  // Parse RFC3339 string to time_point
  static Result<std::chrono::system_clock::time_point> fromRfc3339(const std::string& str);

  static std::chrono::system_clock::time_point fromFileTime(std::filesystem::file_time_type time);
};

}  // namespace upgate::util
