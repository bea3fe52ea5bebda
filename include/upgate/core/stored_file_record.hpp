#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace upgate::core {

// Metadata of one accepted upload. Persisted by the caller, never mutated here.
struct StoredFileRecord {
  std::string filename;               // Generated name (token + original extension)
  std::string original_filename;      // Name supplied by the uploader
  std::filesystem::path path;         // Full path on disk
  std::uintmax_t size = 0;            // Measured size in bytes
  std::string mime_type;
  std::string container_id;           // Owning task
  std::string uploaded_by;            // Uploader identity
  std::chrono::system_clock::time_point created;

  // Path relative to the storage root: tasks/{container}/{filename}
  std::string relativePath() const {
    return "tasks/" + container_id + "/" + filename;
  }
};

}  // namespace upgate::core
