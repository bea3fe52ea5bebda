#pragma once

#include <filesystem>
#include <string>

#include "upgate/common.hpp"
#include "upgate/quota/rate_limiter.hpp"
#include "upgate/security/file_validator.hpp"
#include "upgate/security/mime_sniffer.hpp"
#include "upgate/security/upload_policy.hpp"

namespace upgate::config {

// Configuration for upgate, read from TOML
class Config {
 public:
  // Built-in defaults, nothing read from disk
  Config();

  // Storage
  std::filesystem::path root;
  std::filesystem::path catalog_file;  // Empty: {root}/attachments.json
  std::string temp_dir = "temp";
  std::string scanner_command;         // Reserved for an external virus scanner, never run

  // Upload policy
  security::UploadPolicy policy;
  security::ValidationProfile default_profile = security::ValidationProfile::kStrict;
  security::MimeDetection mime_detection = security::MimeDetection::kSignature;

  quota::RateLimits rate_limits;

  // Logging
  std::string log_level = "info";
  std::filesystem::path log_file;      // Empty: stderr only

  // Read a TOML file over the current values. A missing file leaves the defaults.
  Result<void> load(const std::filesystem::path& config_path);

  Result<void> save(const std::filesystem::path& config_path = {}) const;

  Result<void> validate() const;

  std::filesystem::path catalogPath() const;

  const std::filesystem::path& loadedFrom() const { return config_path_; }

  static std::filesystem::path defaultConfigPath();

 private:
  std::filesystem::path config_path_;
};

}  // namespace upgate::config
