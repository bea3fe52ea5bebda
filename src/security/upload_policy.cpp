#include "upgate/security/upload_policy.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace upgate::security {

namespace {

std::string toLower(std::string_view value) {
  std::string result(value);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

bool isArchiveType(std::string_view mime_type) {
  return mime_type == "application/zip" ||
         mime_type == "application/x-rar-compressed" ||
         mime_type == "application/x-7z-compressed";
}

bool isDocumentType(std::string_view mime_type) {
  for (std::string_view marker : {"pdf", "document", "spreadsheet", "presentation"}) {
    if (mime_type.find(marker) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

bool UploadPolicy::isExtensionAllowed(std::string_view extension) const {
  return allowed_extensions.count(toLower(extension)) > 0;
}

bool UploadPolicy::isExtensionBlocked(std::string_view extension) const {
  return blocked_extensions.count(toLower(extension)) > 0;
}

bool UploadPolicy::isMimeAllowed(std::string_view mime_type) const {
  return allowed_mime_types.count(std::string(mime_type)) > 0;
}

std::uintmax_t UploadPolicy::sizeLimitFor(std::string_view mime_type) const {
  auto category = sizeCategory(mime_type);
  if (category == "image") return size_limits.image;
  if (category == "video") return size_limits.video;
  if (category == "audio") return size_limits.audio;
  if (category == "archive") return size_limits.archive;
  if (category == "document") return size_limits.document;
  return size_limits.fallback;
}

std::string_view sizeCategory(std::string_view mime_type) {
  if (mime_type.starts_with("image/")) return "image";
  if (mime_type.starts_with("video/")) return "video";
  if (mime_type.starts_with("audio/")) return "audio";
  if (isArchiveType(mime_type)) return "archive";
  if (isDocumentType(mime_type)) return "document";
  return "default";
}

std::string mimeTypeForExtension(std::string_view extension) {
  static const std::unordered_map<std::string, std::string> mime_types = {
    {".pdf", "application/pdf"},
    {".doc", "application/msword"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".txt", "text/plain"}, {".rtf", "text/rtf"},
    {".odt", "application/vnd.oasis.opendocument.text"},
    {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"},
    {".png", "image/png"}, {".gif", "image/gif"}, {".bmp", "image/bmp"},
    {".svg", "image/svg+xml"}, {".webp", "image/webp"},
    {".xls", "application/vnd.ms-excel"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".csv", "text/csv"},
    {".ods", "application/vnd.oasis.opendocument.spreadsheet"},
    {".ppt", "application/vnd.ms-powerpoint"},
    {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
    {".odp", "application/vnd.oasis.opendocument.presentation"},
    {".zip", "application/zip"}, {".rar", "application/x-rar-compressed"},
    {".7z", "application/x-7z-compressed"}, {".tar", "application/x-tar"},
    {".gz", "application/gzip"},
    {".py", "text/x-python"}, {".js", "application/javascript"},
    {".html", "text/html"}, {".css", "text/css"},
    {".json", "application/json"}, {".xml", "application/xml"}, {".sql", "text/x-sql"},
    {".mp4", "video/mp4"}, {".avi", "video/avi"}, {".mov", "video/quicktime"},
    {".wmv", "video/x-ms-wmv"},
    {".mp3", "audio/mpeg"}, {".wav", "audio/wav"}, {".flac", "audio/flac"}
  };

  auto it = mime_types.find(toLower(extension));
  if (it != mime_types.end()) {
    return it->second;
  }
  return "";
}

std::string lowercaseExtension(std::string_view filename) {
  return toLower(std::filesystem::path(filename).extension().string());
}

}  // namespace upgate::security
