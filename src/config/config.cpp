#include "upgate/config/config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <sstream>

#include <toml++/toml.hpp>

#include "upgate/util/filesystem.hpp"
#include "upgate/util/xdg.hpp"

namespace upgate::config {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
  "trace", "debug", "info", "warn", "error", "critical", "off"
};

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string normalizeExtension(const std::string& value) {
  auto extension = toLower(value);
  if (!extension.empty() && extension.front() != '.') {
    extension.insert(extension.begin(), '.');
  }
  return extension;
}

Error invalidValue(std::string_view key, std::string_view expected) {
  return makeError(ErrorCode::kConfigError,
                   "Invalid value for " + std::string(key) + ": expected " + std::string(expected));
}

template <typename T>
Result<void> readCount(toml::node_view<toml::node> node, std::string_view key, T& out) {
  if (!node) {
    return {};
  }
  auto value = node.value<std::int64_t>();
  if (!value || *value < 0) {
    return std::unexpected(invalidValue(key, "a non-negative integer"));
  }
  out = static_cast<T>(*value);
  return {};
}

Result<void> readStringSet(toml::node_view<toml::node> node, std::string_view key,
                           bool extensions, std::set<std::string>& out) {
  if (!node) {
    return {};
  }
  auto* array = node.as_array();
  if (array == nullptr) {
    return std::unexpected(invalidValue(key, "an array of strings"));
  }

  std::set<std::string> values;
  for (auto& element : *array) {
    auto value = element.value<std::string>();
    if (!value) {
      return std::unexpected(invalidValue(key, "an array of strings"));
    }
    values.insert(extensions ? normalizeExtension(*value) : toLower(*value));
  }
  out = std::move(values);
  return {};
}

toml::array toArray(const std::set<std::string>& values) {
  toml::array array;
  for (const auto& value : values) {
    array.push_back(value);
  }
  return array;
}

std::int64_t toInt(std::uintmax_t value) {
  return static_cast<std::int64_t>(value);
}

}  // namespace

Config::Config() {
  root = util::Xdg::storageDir();
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return {};  // Defaults
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    // Storage
    auto storage = config_data["storage"];
    if (auto value = storage["root"].value<std::string>()) {
      root = *value;
    }
    if (auto value = storage["catalog_file"].value<std::string>()) {
      catalog_file = *value;
    }
    if (auto value = storage["temp_dir"].value<std::string>()) {
      temp_dir = *value;
    }
    if (auto value = storage["scanner_command"].value<std::string>()) {
      scanner_command = *value;
    }

    // Upload policy
    auto upload = config_data["upload"];
    if (auto result = readCount(upload["max_file_size"], "upload.max_file_size",
                                policy.max_file_size); !result) {
      return result;
    }
    if (auto result = readStringSet(upload["allowed_extensions"], "upload.allowed_extensions",
                                    true, policy.allowed_extensions); !result) {
      return result;
    }
    if (auto result = readStringSet(upload["blocked_extensions"], "upload.blocked_extensions",
                                    true, policy.blocked_extensions); !result) {
      return result;
    }
    if (auto result = readStringSet(upload["allowed_mime_types"], "upload.allowed_mime_types",
                                    false, policy.allowed_mime_types); !result) {
      return result;
    }
    if (auto value = upload["default_profile"].value<std::string>()) {
      auto profile = security::parseProfile(*value);
      if (!profile) {
        return std::unexpected(invalidValue("upload.default_profile", "\"strict\" or \"relaxed\""));
      }
      default_profile = *profile;
    }
    if (auto value = upload["mime_detection"].value<std::string>()) {
      if (*value == "signature") {
        mime_detection = security::MimeDetection::kSignature;
      } else if (*value == "declared") {
        mime_detection = security::MimeDetection::kDeclared;
      } else {
        return std::unexpected(invalidValue("upload.mime_detection",
                                            "\"signature\" or \"declared\""));
      }
    }

    auto sizes = upload["size_limits"];
    auto& limits = policy.size_limits;
    for (auto [key, field] : std::array<std::pair<std::string_view, std::uintmax_t*>, 6>{{
             {"image", &limits.image},
             {"video", &limits.video},
             {"audio", &limits.audio},
             {"archive", &limits.archive},
             {"document", &limits.document},
             {"default", &limits.fallback}}}) {
      if (auto result = readCount(sizes[key], "upload.size_limits." + std::string(key), *field);
          !result) {
        return result;
      }
    }

    // Rate limits
    auto rates = config_data["rate_limits"];
    if (auto result = readCount(rates["uploads_per_minute"], "rate_limits.uploads_per_minute",
                                rate_limits.uploads_per_minute); !result) {
      return result;
    }
    if (auto result = readCount(rates["uploads_per_hour"], "rate_limits.uploads_per_hour",
                                rate_limits.uploads_per_hour); !result) {
      return result;
    }
    if (auto result = readCount(rates["uploads_per_day"], "rate_limits.uploads_per_day",
                                rate_limits.uploads_per_day); !result) {
      return result;
    }
    if (auto result = readCount(rates["total_size_per_hour"], "rate_limits.total_size_per_hour",
                                rate_limits.total_size_per_hour); !result) {
      return result;
    }
    if (auto result = readCount(rates["total_size_per_day"], "rate_limits.total_size_per_day",
                                rate_limits.total_size_per_day); !result) {
      return result;
    }

    // Logging
    auto logging = config_data["logging"];
    if (auto value = logging["level"].value<std::string>()) {
      log_level = toLower(*value);
    }
    if (auto value = logging["file"].value<std::string>()) {
      log_file = *value;
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;
  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  toml::table storage;
  storage.insert_or_assign("root", root.string());
  storage.insert_or_assign("catalog_file", catalog_file.string());
  storage.insert_or_assign("temp_dir", temp_dir);
  storage.insert_or_assign("scanner_command", scanner_command);

  toml::table size_limits;
  size_limits.insert_or_assign("image", toInt(policy.size_limits.image));
  size_limits.insert_or_assign("video", toInt(policy.size_limits.video));
  size_limits.insert_or_assign("audio", toInt(policy.size_limits.audio));
  size_limits.insert_or_assign("archive", toInt(policy.size_limits.archive));
  size_limits.insert_or_assign("document", toInt(policy.size_limits.document));
  size_limits.insert_or_assign("default", toInt(policy.size_limits.fallback));

  toml::table upload;
  upload.insert_or_assign("max_file_size", toInt(policy.max_file_size));
  upload.insert_or_assign("allowed_extensions", toArray(policy.allowed_extensions));
  upload.insert_or_assign("blocked_extensions", toArray(policy.blocked_extensions));
  upload.insert_or_assign("allowed_mime_types", toArray(policy.allowed_mime_types));
  upload.insert_or_assign("default_profile", std::string(security::profileToString(default_profile)));
  upload.insert_or_assign("mime_detection",
                          std::string(security::mimeDetectionToString(mime_detection)));
  upload.insert_or_assign("size_limits", std::move(size_limits));

  toml::table rates;
  rates.insert_or_assign("uploads_per_minute", toInt(rate_limits.uploads_per_minute));
  rates.insert_or_assign("uploads_per_hour", toInt(rate_limits.uploads_per_hour));
  rates.insert_or_assign("uploads_per_day", toInt(rate_limits.uploads_per_day));
  rates.insert_or_assign("total_size_per_hour", toInt(rate_limits.total_size_per_hour));
  rates.insert_or_assign("total_size_per_day", toInt(rate_limits.total_size_per_day));

  toml::table logging;
  logging.insert_or_assign("level", log_level);
  logging.insert_or_assign("file", log_file.string());

  toml::table config_data;
  config_data.insert_or_assign("storage", std::move(storage));
  config_data.insert_or_assign("upload", std::move(upload));
  config_data.insert_or_assign("rate_limits", std::move(rates));
  config_data.insert_or_assign("logging", std::move(logging));

  std::stringstream ss;
  ss << config_data << '\n';
  auto write_result = util::FileSystem::writeFileAtomic(save_path, ss.str());
  if (!write_result.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Cannot write config file: " + write_result.error().message()));
  }
  return {};
}

Result<void> Config::validate() const {
  if (root.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Storage root is not set"));
  }
  if (policy.max_file_size == 0) {
    return std::unexpected(invalidValue("upload.max_file_size", "a positive size"));
  }

  const auto& sizes = policy.size_limits;
  if (sizes.image == 0 || sizes.video == 0 || sizes.audio == 0 || sizes.archive == 0 ||
      sizes.document == 0 || sizes.fallback == 0) {
    return std::unexpected(invalidValue("upload.size_limits", "positive sizes"));
  }

  if (rate_limits.uploads_per_minute == 0 || rate_limits.uploads_per_hour == 0 ||
      rate_limits.uploads_per_day == 0 || rate_limits.total_size_per_hour == 0 ||
      rate_limits.total_size_per_day == 0) {
    return std::unexpected(invalidValue("rate_limits", "positive limits"));
  }

  if (std::find(kLogLevels.begin(), kLogLevels.end(), log_level) == kLogLevels.end()) {
    return std::unexpected(invalidValue("logging.level",
                                        "trace, debug, info, warn, error, critical or off"));
  }

  return {};
}

std::filesystem::path Config::catalogPath() const {
  if (!catalog_file.empty()) {
    return catalog_file;
  }
  return root / "attachments.json";
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

}  // namespace upgate::config
