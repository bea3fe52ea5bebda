#include "upgate/util/filesystem.hpp"

#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace upgate::util {

// AtomicFileWriter implementation
AtomicFileWriter::AtomicFileWriter(const std::filesystem::path& target_path)
    : target_path_(target_path), committed_(false), cancelled_(false) {
  // Generate unique temporary filename
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);

  temp_path_ = target_path_;
  temp_path_ += ".tmp." + std::to_string(dis(gen));
}

AtomicFileWriter::~AtomicFileWriter() {
  if (!committed_ && !cancelled_) {
    cleanup();
  }
}

Result<void> AtomicFileWriter::write(const std::string& content) {
  if (committed_ || cancelled_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Writer already used"));
  }

  auto parent = target_path_.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Cannot create parent directory: " + ec.message()));
    }
  }

  std::ofstream file(temp_path_, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot create temporary file: " + temp_path_.string()));
  }

  file.write(content.data(), content.size());
  if (!file) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to write to temporary file"));
  }

  file.close();
  if (!file) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to close temporary file"));
  }

  return {};
}

Result<void> AtomicFileWriter::commit() {
  if (committed_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Already committed"));
  }
  if (cancelled_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Operation cancelled"));
  }

  int fd = open(temp_path_.c_str(), O_RDONLY);
  if (fd >= 0) {
    fsync(fd);
    close(fd);
  }

  std::error_code ec;
  std::filesystem::rename(temp_path_, target_path_, ec);
  if (ec) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Atomic rename failed: " + ec.message()));
  }

  // Persist the rename
  auto parent = target_path_.parent_path();
  if (!parent.empty()) {
    int dir_fd = open(parent.c_str(), O_RDONLY);
    if (dir_fd >= 0) {
      fsync(dir_fd);
      close(dir_fd);
    }
  }

  committed_ = true;
  return {};
}

void AtomicFileWriter::cancel() {
  if (!committed_) {
    cancelled_ = true;
    cleanup();
  }
}

void AtomicFileWriter::cleanup() {
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
}

// FileSystem implementation
Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  AtomicFileWriter writer(path);

  auto write_result = writer.write(content);
  if (!write_result.has_value()) {
    return write_result;
  }

  return writer.commit();
}

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Cannot open file: " + path.string()));
  }

  file.seekg(0, std::ios::end);
  auto size = file.tellg();
  if (size < 0) {
    return std::unexpected(makeError(ErrorCode::kFileReadError, "Cannot get file size"));
  }

  file.seekg(0, std::ios::beg);

  std::string content(static_cast<size_t>(size), '\0');
  file.read(content.data(), size);

  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError, "Read failed"));
  }

  return content;
}

Result<std::string> FileSystem::readPrefix(const std::filesystem::path& path, size_t max_bytes) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Cannot open file: " + path.string()));
  }

  std::string content(max_bytes, '\0');
  file.read(content.data(), static_cast<std::streamsize>(max_bytes));
  if (file.bad()) {
    return std::unexpected(makeError(ErrorCode::kFileReadError, "Read failed"));
  }

  content.resize(static_cast<size_t>(file.gcount()));
  return content;
}

Result<void> FileSystem::createDirectories(const std::filesystem::path& path,
                                           std::filesystem::perms perms) {
  std::error_code ec;

  if (!std::filesystem::create_directories(path, ec) && ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                     "Cannot create directories: " + ec.message()));
  }

  std::filesystem::permissions(path, perms, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFilePermissionDenied,
                                     "Cannot set directory permissions: " + ec.message()));
  }

  return {};
}

Result<std::uintmax_t> FileSystem::fileSize(const std::filesystem::path& path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot get file size: " + ec.message()));
  }

  return size;
}

Result<std::filesystem::file_time_type> FileSystem::lastModified(const std::filesystem::path& path) {
  std::error_code ec;
  auto time = std::filesystem::last_write_time(path, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot get modification time: " + ec.message()));
  }

  return time;
}

Result<void> FileSystem::removeFile(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot remove file: " + ec.message()));
  }

  return {};
}

Result<std::vector<std::filesystem::path>> FileSystem::listFilesRecursive(
    const std::filesystem::path& path) {
  std::vector<std::filesystem::path> results;
  std::error_code ec;

  std::filesystem::recursive_directory_iterator it(
      path, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryNotFound,
                                     "Cannot list directory: " + ec.message()));
  }

  const std::filesystem::recursive_directory_iterator end{};
  while (it != end) {
    std::error_code status_ec;
    if (it->is_regular_file(status_ec) && !status_ec) {
      results.push_back(it->path());
    }
    it.increment(ec);
    if (ec) {
      // A failed increment ends the iteration; report what was listed so far
      spdlog::warn("Directory walk of {} stopped early after {} file(s): {}", path.string(),
                   results.size(), ec.message());
      break;
    }
  }

  return results;
}

}  // namespace upgate::util
