#pragma once

#include <filesystem>
#include <string>

#include "upgate/common.hpp"

namespace upgate::util {

struct LogOptions {
  std::string level = "info";          // Threshold for the file sink
  std::filesystem::path file;          // Empty: no file sink
  bool verbose = false;                // Show info and debug on stderr
  bool quiet = false;                  // Only errors on stderr
};

// Install the default spdlog logger: colored stderr plus an optional rotating file.
// Falls back to stderr only when the file sink cannot be opened.
Result<void> setupLogging(const LogOptions& options);

}  // namespace upgate::util
