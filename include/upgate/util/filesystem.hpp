#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "upgate/common.hpp"

namespace upgate::util {

// Write to a temporary sibling, then rename over the target
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(const std::filesystem::path& target_path);
  ~AtomicFileWriter();

  // Non-copyable, movable
  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
  AtomicFileWriter(AtomicFileWriter&&) = default;
  AtomicFileWriter& operator=(AtomicFileWriter&&) = default;

  // Write content to temporary file
  Result<void> write(const std::string& content);

  // Commit the changes (rename temp to target)
  Result<void> commit();

  // Cancel the operation (removes temp file)
  void cancel();

 private:
  std::filesystem::path target_path_;
  std::filesystem::path temp_path_;
  bool committed_;
  bool cancelled_;

  void cleanup();
};

// Filesystem utilities
class FileSystem {
 public:
  // Atomic write with fsync and rename
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  // Read whole file
  static Result<std::string> readFile(const std::filesystem::path& path);

  // Read at most max_bytes from the start of a file
  static Result<std::string> readPrefix(const std::filesystem::path& path, size_t max_bytes);

  // Create directory with proper permissions
  static Result<void> createDirectories(const std::filesystem::path& path,
                                        std::filesystem::perms perms = std::filesystem::perms::owner_all);

  // Get file size safely
  static Result<std::uintmax_t> fileSize(const std::filesystem::path& path);

  // Get last modification time
  static Result<std::filesystem::file_time_type> lastModified(const std::filesystem::path& path);

  // Remove file; a missing file is not an error
  static Result<void> removeFile(const std::filesystem::path& path);

  // Regular files below path, recursively
  static Result<std::vector<std::filesystem::path>> listFilesRecursive(
      const std::filesystem::path& path);
};

}  // namespace upgate::util
