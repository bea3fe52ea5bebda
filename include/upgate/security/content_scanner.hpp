#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "upgate/core/upload_error.hpp"

namespace upgate::security {

/**
 * @brief Heuristic content scan used by the strict profile
 *
 * Rejects content containing a suspicious token (case-insensitive), content
 * whose Shannon entropy exceeds the threshold, and tiny payloads. Internal
 * errors never reject: scanFile() treats an unreadable file as safe.
 */
class ContentScanner {
 public:
  static constexpr double kEntropyThreshold = 7.5;
  static constexpr size_t kMinimumSize = 10;

  struct ScanResult {
    bool safe = true;
    std::string reason;
    core::ViolationKind kind = core::ViolationKind::kContentPattern;
  };

  ContentScanner();
  explicit ContentScanner(std::vector<std::string> patterns);

  ScanResult scan(std::string_view content) const;

  // Reads and scans a file; read failures fail open
  ScanResult scanFile(const std::filesystem::path& path) const;

  // Bits per byte, in [0, 8]
  static double entropy(std::string_view content);

  static const std::vector<std::string>& defaultPatterns();

  const std::vector<std::string>& patterns() const { return patterns_; }

 private:
  std::vector<std::string> patterns_;  // Lowercase
};

}  // namespace upgate::security
