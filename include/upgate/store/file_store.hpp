#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "upgate/common.hpp"
#include "upgate/core/stored_file_record.hpp"
#include "upgate/core/upload_error.hpp"
#include "upgate/quota/rate_limiter.hpp"
#include "upgate/security/file_validator.hpp"

namespace upgate::store {

struct StorageStats {
  size_t file_count = 0;
  std::uintmax_t total_bytes = 0;
  std::filesystem::path root;
};

struct FileInfo {
  std::uintmax_t size = 0;
  std::string mime_type;  // Guessed from the extension
  std::chrono::system_clock::time_point modified;
};

/**
 * @brief Durable placement of uploaded bytes
 *
 * Layout: {root}/tasks/{container_id}/{token}{.ext}, with {root}/temp
 * reserved. Every file is written through save(), which admits the upload
 * against the rate limiter and leaves nothing on disk when it fails.
 */
class FileStore {
 public:
  struct Config {
    std::filesystem::path root;
    std::string temp_dir = "temp";
  };

  struct SaveRequest {
    std::string original_filename;
    std::string declared_mime;
    std::optional<std::uintmax_t> declared_size;  // Unknown for streamed uploads
    std::string container_id;
    std::string identity;
  };

  // Runs on the written file before the upload is committed
  using PostWriteCheck = std::function<core::ValidationOutcome(const std::filesystem::path&)>;

  FileStore(Config config, const security::FileValidator& validator,
            quota::RateLimiter& limiter);

  // Unique stored name: a fresh token plus the lowercased original extension
  static std::string generateUniqueName(std::string_view original_filename);

  // Container ids are limited to letters, digits, '-' and '_'
  static bool isValidContainerId(std::string_view container_id);

  core::UploadResult<core::StoredFileRecord> save(std::istream& content,
                                                   const SaveRequest& request,
                                                   const PostWriteCheck& post_write = {});

  // Idempotent; false when nothing was deleted
  bool remove(const std::filesystem::path& path);

  // Stored files not in referenced_paths
  Result<std::vector<std::filesystem::path>> findOrphans(
      const std::set<std::filesystem::path>& referenced_paths) const;

  // Delete stored files not in referenced_paths, returns how many were deleted
  Result<size_t> cleanupOrphans(const std::set<std::filesystem::path>& referenced_paths);

  Result<StorageStats> stats() const;

  std::optional<std::filesystem::path> filePath(std::string_view container_id,
                                                std::string_view filename) const;

  Result<FileInfo> fileInfo(const std::filesystem::path& path) const;

  // Create {root}/tasks and the temp directory
  Result<void> ensureLayout() const;

  const std::filesystem::path& root() const { return config_.root; }
  std::filesystem::path tasksDir() const { return config_.root / "tasks"; }
  std::filesystem::path tempDir() const { return config_.root / config_.temp_dir; }

  static constexpr size_t kCopyChunkSize = 64 * 1024;

 private:
  // Stream the remaining content after prefix into path
  Result<std::uintmax_t> writeContent(std::istream& content, const std::string& prefix,
                                      const std::filesystem::path& path) const;

  void discard(const std::filesystem::path& path) const;

  bool isUnderTasks(const std::filesystem::path& path) const;

  Config config_;
  const security::FileValidator& validator_;
  quota::RateLimiter& limiter_;
};

}  // namespace upgate::store
