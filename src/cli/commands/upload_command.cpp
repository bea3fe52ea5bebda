#include "upgate/cli/commands/upload_command.hpp"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "upgate/cli/command_error_handler.hpp"
#include "upgate/util/filesystem.hpp"

namespace upgate::cli {

UploadCommand::UploadCommand(Application& app) : app_(app) {
}

void UploadCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("container_id", container_id_, "Owning container (task) id")->required();
  cmd->add_option("file", file_, "File to upload")->required();
  cmd->add_option("-u,--user", user_, "Uploader identity")->required();
  cmd->add_option("--mime", mime_, "Declared MIME type (default: guessed from extension)");
  cmd->add_flag("--relaxed", relaxed_, "Skip MIME and content checks (trusted callers)");
}

Result<int> UploadCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);
  std::filesystem::path source(file_);

  auto size = util::FileSystem::fileSize(source);
  if (!size.has_value()) {
    return std::unexpected(size.error());
  }

  std::ifstream content(source, std::ios::binary);
  if (!content) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot open file: " + source.string()));
  }

  upload::UploadRequest request;
  request.content = &content;
  request.original_filename = source.filename().string();
  request.declared_mime = mime_.empty()
      ? security::mimeTypeForExtension(security::lowercaseExtension(request.original_filename))
      : mime_;
  request.declared_size = *size;
  request.container_id = container_id_;
  request.identity = user_;

  auto profile = relaxed_ ? security::ValidationProfile::kRelaxed : app_.config().default_profile;
  auto record = app_.uploadService().upload(request, profile);
  if (!record.has_value()) {
    return error_handler.handleUploadError(record.error());
  }

  auto added = app_.catalog().add(*record);
  if (!added.has_value()) {
    // Without a catalog entry the file would be an orphan
    app_.uploadService().remove(*record);
    return std::unexpected(makeError(ErrorCode::kStorageError,
                                     "Failed to record upload: " + added.error().message()));
  }

  if (options.json) {
    nlohmann::json result_json;
    result_json["success"] = true;
    result_json["record"] = store::recordToJson(*record);
    std::cout << result_json.dump() << std::endl;
  } else if (!options.quiet) {
    std::cout << "Stored " << record->original_filename << " as " << record->relativePath()
              << " (" << record->size << " bytes, " << record->mime_type << ")" << std::endl;
  }

  return 0;
}

} // namespace upgate::cli
