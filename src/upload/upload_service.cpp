#include "upgate/upload/upload_service.hpp"

#include <spdlog/spdlog.h>

namespace upgate::upload {

UploadService::UploadService(store::FileStore& store, const security::FileValidator& validator)
    : store_(store), validator_(validator) {
}

core::UploadResult<core::StoredFileRecord> UploadService::upload(
    const UploadRequest& request, security::ValidationProfile profile) {
  if (request.content == nullptr) {
    return std::unexpected(core::UploadError::storage("Upload has no content stream"));
  }

  store::FileStore::SaveRequest save_request;
  save_request.original_filename = request.original_filename;
  save_request.declared_mime = request.declared_mime;
  save_request.declared_size = request.declared_size;
  save_request.container_id = request.container_id;
  save_request.identity = request.identity;

  const auto& declared_mime = request.declared_mime;
  const auto& original_name = request.original_filename;
  auto full_check = [this, &declared_mime, &original_name, profile](
                        const std::filesystem::path& path) {
    return validator_.validate(path, declared_mime, profile, original_name);
  };

  auto result = store_.save(*request.content, save_request, full_check);
  if (!result.has_value()) {
    spdlog::warn("Upload rejected ({}): user={} container={} file='{}': {}",
                 core::uploadErrorKindToString(result.error().kind()), request.identity,
                 request.container_id, request.original_filename, result.error().message());
    return result;
  }

  spdlog::info("Upload accepted ({}): user={} container={} file='{}' stored={} size={}",
               security::profileToString(profile), request.identity, request.container_id,
               request.original_filename, result->filename, result->size);
  return result;
}

bool UploadService::remove(const core::StoredFileRecord& record) {
  return store_.remove(record.path);
}

}  // namespace upgate::upload
