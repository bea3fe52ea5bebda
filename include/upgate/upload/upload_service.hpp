#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>

#include "upgate/core/stored_file_record.hpp"
#include "upgate/core/upload_error.hpp"
#include "upgate/security/file_validator.hpp"
#include "upgate/store/file_store.hpp"

namespace upgate::upload {

struct UploadRequest {
  std::istream* content = nullptr;
  std::string original_filename;
  std::string declared_mime;
  std::optional<std::uintmax_t> declared_size;
  std::string container_id;
  std::string identity;
};

/**
 * @brief Single entry point for accepting an upload
 *
 * Runs the store's write path with the full validation pipeline as the
 * post-write check. On any failure nothing remains on disk and the error
 * carries every reason.
 */
class UploadService {
 public:
  UploadService(store::FileStore& store, const security::FileValidator& validator);

  core::UploadResult<core::StoredFileRecord> upload(const UploadRequest& request,
                                                    security::ValidationProfile profile);

  // Delete the stored file of a record; false when it was already gone
  bool remove(const core::StoredFileRecord& record);

 private:
  store::FileStore& store_;
  const security::FileValidator& validator_;
};

}  // namespace upgate::upload
