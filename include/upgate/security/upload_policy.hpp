#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <string_view>

namespace upgate::security {

constexpr std::uintmax_t kMiB = 1024 * 1024;

// Per-category byte ceilings, chosen by MIME type
struct SizeLimits {
  std::uintmax_t image = 5 * kMiB;
  std::uintmax_t video = 50 * kMiB;
  std::uintmax_t audio = 20 * kMiB;
  std::uintmax_t archive = 25 * kMiB;
  std::uintmax_t document = 10 * kMiB;
  std::uintmax_t fallback = 10 * kMiB;
};

/**
 * @brief Immutable upload policy tables
 *
 * Extensions are stored lowercase with a leading dot. An extension present in
 * both sets is treated as blocked.
 */
struct UploadPolicy {
  std::uintmax_t max_file_size = 10 * kMiB;

  std::set<std::string> allowed_extensions = {
      // Documents
      ".pdf", ".doc", ".docx", ".txt", ".rtf", ".odt",
      // Images
      ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".svg", ".webp",
      // Spreadsheets
      ".xls", ".xlsx", ".csv", ".ods",
      // Presentations
      ".ppt", ".pptx", ".odp",
      // Archives
      ".zip", ".rar", ".7z", ".tar", ".gz",
      // Code and markup
      ".py", ".js", ".html", ".css", ".json", ".xml", ".sql",
      // Media
      ".mp4", ".avi", ".mov", ".wmv", ".mp3", ".wav", ".flac"
  };

  std::set<std::string> blocked_extensions = {
      ".exe", ".bat", ".cmd", ".com", ".scr", ".pif", ".vbs", ".js",
      ".jar", ".class", ".php", ".asp", ".aspx", ".jsp", ".py", ".pl",
      ".sh", ".ps1", ".dll", ".sys", ".drv", ".ocx", ".cpl", ".msi"
  };

  std::set<std::string> allowed_mime_types = {
      // Documents
      "application/pdf",
      "application/msword",
      "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
      "text/plain",
      "text/rtf",
      "application/vnd.oasis.opendocument.text",
      // Images
      "image/jpeg", "image/png", "image/gif", "image/bmp", "image/svg+xml", "image/webp",
      // Spreadsheets
      "application/vnd.ms-excel",
      "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
      "text/csv",
      "application/vnd.oasis.opendocument.spreadsheet",
      // Presentations
      "application/vnd.ms-powerpoint",
      "application/vnd.openxmlformats-officedocument.presentationml.presentation",
      "application/vnd.oasis.opendocument.presentation",
      // Archives
      "application/zip", "application/x-rar-compressed", "application/x-7z-compressed",
      "application/x-tar", "application/gzip",
      // Code and markup
      "text/x-python", "application/javascript", "text/html", "text/css",
      "application/json", "application/xml", "text/x-sql",
      // Media
      "video/mp4", "video/avi", "video/quicktime", "video/x-ms-wmv",
      "audio/mpeg", "audio/wav", "audio/flac"
  };

  SizeLimits size_limits;

  bool isExtensionAllowed(std::string_view extension) const;
  bool isExtensionBlocked(std::string_view extension) const;
  bool isMimeAllowed(std::string_view mime_type) const;

  // Ceiling for the category of the given MIME type
  std::uintmax_t sizeLimitFor(std::string_view mime_type) const;
};

// Category name used for size ceilings: image, video, audio, archive, document or default
std::string_view sizeCategory(std::string_view mime_type);

// MIME type guessed from a filename extension, empty if unknown
std::string mimeTypeForExtension(std::string_view extension);

// Lowercased extension of a filename including the dot, empty if none
std::string lowercaseExtension(std::string_view filename);

}  // namespace upgate::security
