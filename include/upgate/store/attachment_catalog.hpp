#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "upgate/common.hpp"
#include "upgate/core/stored_file_record.hpp"

namespace upgate::store {

// JSON form of a record, shared by the catalog file and CLI output
nlohmann::json recordToJson(const core::StoredFileRecord& record);

/**
 * @brief JSON catalog of accepted uploads
 *
 * Persists StoredFileRecords for callers that have no database of their own.
 * Every change rewrites the file atomically.
 */
class AttachmentCatalog {
 public:
  explicit AttachmentCatalog(std::filesystem::path catalog_file);

  Result<void> add(const core::StoredFileRecord& record);

  // Drop the record for a stored path; false when there was none
  Result<bool> remove(const std::filesystem::path& path);

  Result<std::vector<core::StoredFileRecord>> listAll() const;
  Result<std::vector<core::StoredFileRecord>> listForContainer(const std::string& container_id) const;

  Result<std::optional<core::StoredFileRecord>> find(const std::string& container_id,
                                                     const std::string& filename) const;

  // Paths that cleanupOrphans() must keep
  Result<std::set<std::filesystem::path>> referencedPaths() const;

  const std::filesystem::path& file() const { return catalog_file_; }

 private:
  Result<void> loadLocked() const;
  Result<void> saveLocked() const;

  std::filesystem::path catalog_file_;

  mutable std::mutex mutex_;
  mutable std::map<std::string, core::StoredFileRecord> records_;  // Keyed by path
  mutable bool loaded_ = false;
};

}  // namespace upgate::store
