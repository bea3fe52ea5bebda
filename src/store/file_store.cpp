#include "upgate/store/file_store.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "upgate/core/upload_token.hpp"
#include "upgate/util/filesystem.hpp"
#include "upgate/util/format.hpp"
#include "upgate/util/time.hpp"

namespace upgate::store {

namespace {

std::filesystem::path normalized(const std::filesystem::path& path) {
  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  return canonical;
}

}  // namespace

FileStore::FileStore(Config config, const security::FileValidator& validator,
                     quota::RateLimiter& limiter)
    : config_(std::move(config)), validator_(validator), limiter_(limiter) {
  if (auto layout = ensureLayout(); !layout.has_value()) {
    spdlog::error("Failed to prepare storage root {}: {}", config_.root.string(),
                  layout.error().message());
  }
}

std::string FileStore::generateUniqueName(std::string_view original_filename) {
  return core::UploadToken::generate().toString() +
         security::lowercaseExtension(original_filename);
}

bool FileStore::isValidContainerId(std::string_view container_id) {
  if (container_id.empty() || container_id.size() > 128) {
    return false;
  }
  return std::all_of(container_id.begin(), container_id.end(), [](char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '-' || ch == '_';
  });
}

core::UploadResult<core::StoredFileRecord> FileStore::save(std::istream& content,
                                                           const SaveRequest& request,
                                                           const PostWriteCheck& post_write) {
  if (!isValidContainerId(request.container_id)) {
    return std::unexpected(
        core::UploadError::storage("Invalid container id: " + request.container_id));
  }

  const auto max_size = validator_.policy().max_file_size;

  // Pre-write checks run on the name and the first bytes only
  std::string prefix(security::SignatureClassifier::kPrefixSize, '\0');
  content.read(prefix.data(), static_cast<std::streamsize>(prefix.size()));
  prefix.resize(static_cast<size_t>(content.gcount()));
  if (content.bad()) {
    return std::unexpected(core::UploadError::storage("Failed to read upload content"));
  }

  auto outcome = validator_.validateName(request.original_filename);
  outcome.merge(validator_.validatePrefix(prefix));
  if (request.declared_size && *request.declared_size > max_size) {
    outcome.reject(core::ViolationKind::kFileTooLarge,
                   "File size exceeds maximum allowed size (" +
                   util::formatMegabytes(max_size) + ")");
  }
  if (!outcome.accepted()) {
    spdlog::warn("Rejected upload '{}' from {}: {}", request.original_filename,
                 request.identity, fmt::join(outcome.reasons(), "; "));
    return std::unexpected(core::UploadError::validation(std::move(outcome)));
  }

  auto reservation = limiter_.reserve(request.identity, request.declared_size.value_or(max_size));
  if (!reservation.has_value()) {
    spdlog::warn("Rate limit hit for {}: {}", request.identity, reservation.error().message());
    return std::unexpected(reservation.error());
  }

  auto container_dir = tasksDir() / request.container_id;
  if (auto created = util::FileSystem::createDirectories(container_dir); !created.has_value()) {
    spdlog::error("Cannot create container directory {}: {}", container_dir.string(),
                  created.error().message());
    return std::unexpected(core::UploadError::storage(created.error().message()));
  }

  auto filename = generateUniqueName(request.original_filename);
  auto path = container_dir / filename;

  auto written = writeContent(content, prefix, path);
  if (!written.has_value()) {
    spdlog::error("Failed to store {}: {}", path.string(), written.error().message());
    discard(path);
    return std::unexpected(core::UploadError::storage(written.error().message()));
  }

  auto actual_size = util::FileSystem::fileSize(path);
  if (!actual_size.has_value()) {
    discard(path);
    return std::unexpected(core::UploadError::storage(actual_size.error().message()));
  }

  if (*actual_size > max_size) {
    discard(path);
    core::ValidationOutcome too_large;
    too_large.reject(core::ViolationKind::kFileTooLarge,
                     "File size exceeds maximum allowed size (" +
                     util::formatMegabytes(max_size) + ")");
    spdlog::warn("Rejected upload '{}' from {}: exceeds {}", request.original_filename,
                 request.identity, util::formatMegabytes(max_size));
    return std::unexpected(core::UploadError::validation(std::move(too_large)));
  }

  if (post_write) {
    auto checked = post_write(path);
    if (!checked.accepted()) {
      discard(path);
      spdlog::warn("Rejected upload '{}' from {}: {}", request.original_filename,
                   request.identity, fmt::join(checked.reasons(), "; "));
      return std::unexpected(core::UploadError::validation(std::move(checked)));
    }
  }

  // Measured size goes through the byte windows again
  if (auto committed = reservation->commit(*actual_size); !committed.has_value()) {
    discard(path);
    reservation->release();
    spdlog::warn("Rate limit hit for {} after measuring {}: {}", request.identity,
                 util::formatMegabytes(*actual_size), committed.error().message());
    return std::unexpected(committed.error());
  }

  core::StoredFileRecord record;
  record.filename = filename;
  record.original_filename = request.original_filename;
  record.path = path;
  record.size = *actual_size;
  record.mime_type = request.declared_mime;
  if (record.mime_type.empty()) {
    record.mime_type = security::mimeTypeForExtension(
        security::lowercaseExtension(request.original_filename));
  }
  if (record.mime_type.empty()) {
    record.mime_type = "application/octet-stream";
  }
  record.container_id = request.container_id;
  record.uploaded_by = request.identity;
  record.created = std::chrono::system_clock::now();

  return record;
}

bool FileStore::remove(const std::filesystem::path& path) {
  if (!isUnderTasks(path)) {
    spdlog::warn("Refusing to delete path outside storage: {}", path.string());
    return false;
  }

  std::error_code ec;
  bool removed = std::filesystem::remove(path, ec);
  if (ec) {
    spdlog::error("Failed to delete {}: {}", path.string(), ec.message());
    return false;
  }
  if (removed) {
    spdlog::info("Deleted {}", path.string());
  }
  return removed;
}

Result<std::vector<std::filesystem::path>> FileStore::findOrphans(
    const std::set<std::filesystem::path>& referenced_paths) const {
  std::vector<std::filesystem::path> orphans;
  if (!std::filesystem::exists(tasksDir())) {
    return orphans;
  }

  std::set<std::filesystem::path> referenced;
  for (const auto& path : referenced_paths) {
    referenced.insert(normalized(path));
  }

  auto files = util::FileSystem::listFilesRecursive(tasksDir());
  if (!files.has_value()) {
    return std::unexpected(files.error());
  }

  for (const auto& file : *files) {
    if (!referenced.contains(normalized(file))) {
      orphans.push_back(file);
    }
  }
  return orphans;
}

Result<size_t> FileStore::cleanupOrphans(const std::set<std::filesystem::path>& referenced_paths) {
  auto orphans = findOrphans(referenced_paths);
  if (!orphans.has_value()) {
    return std::unexpected(orphans.error());
  }

  size_t deleted = 0;
  for (const auto& file : *orphans) {
    // Already gone counts as nothing deleted, not as a failure
    std::error_code ec;
    if (std::filesystem::remove(file, ec)) {
      ++deleted;
      spdlog::debug("Removed orphaned file {}", file.string());
    } else if (ec) {
      spdlog::warn("Failed to remove orphaned file {}: {}", file.string(), ec.message());
    }
  }

  spdlog::info("Orphan cleanup removed {} file(s)", deleted);
  return deleted;
}

Result<StorageStats> FileStore::stats() const {
  StorageStats stats;
  stats.root = config_.root;

  if (!std::filesystem::exists(tasksDir())) {
    return stats;
  }

  auto files = util::FileSystem::listFilesRecursive(tasksDir());
  if (!files.has_value()) {
    return std::unexpected(files.error());
  }

  for (const auto& file : *files) {
    std::error_code ec;
    auto size = std::filesystem::file_size(file, ec);
    if (ec) {
      continue;  // Deleted while walking
    }
    ++stats.file_count;
    stats.total_bytes += size;
  }

  return stats;
}

std::optional<std::filesystem::path> FileStore::filePath(std::string_view container_id,
                                                         std::string_view filename) const {
  if (!isValidContainerId(container_id) || filename.empty() ||
      filename.find('/') != std::string_view::npos || filename.find("..") != std::string_view::npos) {
    return std::nullopt;
  }

  auto path = tasksDir() / std::string(container_id) / std::string(filename);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  return path;
}

Result<FileInfo> FileStore::fileInfo(const std::filesystem::path& path) const {
  auto size = util::FileSystem::fileSize(path);
  if (!size.has_value()) {
    return std::unexpected(size.error());
  }
  auto modified = util::FileSystem::lastModified(path);
  if (!modified.has_value()) {
    return std::unexpected(modified.error());
  }

  FileInfo info;
  info.size = *size;
  info.mime_type = security::mimeTypeForExtension(
      security::lowercaseExtension(path.filename().string()));
  if (info.mime_type.empty()) {
    info.mime_type = "application/octet-stream";
  }
  info.modified = util::Time::fromFileTime(*modified);
  return info;
}

Result<void> FileStore::ensureLayout() const {
  if (config_.root.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Storage root is not set"));
  }
  auto tasks = util::FileSystem::createDirectories(tasksDir());
  if (!tasks.has_value()) {
    return tasks;
  }
  return util::FileSystem::createDirectories(tempDir());
}

Result<std::uintmax_t> FileStore::writeContent(std::istream& content, const std::string& prefix,
                                               const std::filesystem::path& path) const {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot open file for writing: " + path.string()));
  }

  const auto max_size = validator_.policy().max_file_size;
  std::uintmax_t written = prefix.size();
  out.write(prefix.data(), static_cast<std::streamsize>(prefix.size()));

  std::array<char, kCopyChunkSize> buffer{};
  // Stop copying once past the ceiling; the size check rejects the file
  while (out && written <= max_size && content) {
    content.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto count = content.gcount();
    if (count <= 0) {
      break;
    }
    out.write(buffer.data(), count);
    written += static_cast<std::uintmax_t>(count);
  }

  if (content.bad()) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Failed to read upload content"));
  }

  out.flush();
  if (!out) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to write file: " + path.string()));
  }
  out.close();

  return written;
}

void FileStore::discard(const std::filesystem::path& path) const {
  auto removed = util::FileSystem::removeFile(path);
  if (!removed.has_value()) {
    spdlog::error("Failed to remove partial upload {}: {}", path.string(),
                  removed.error().message());
  }
}

bool FileStore::isUnderTasks(const std::filesystem::path& path) const {
  auto base = normalized(tasksDir());
  auto target = normalized(path);
  auto rel = target.lexically_relative(base);
  return !rel.empty() && rel != "." && *rel.begin() != "..";
}

}  // namespace upgate::store
