#include "upgate/cli/commands/remove_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "upgate/cli/command_error_handler.hpp"

namespace upgate::cli {

RemoveCommand::RemoveCommand(Application& app) : app_(app) {
}

void RemoveCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("container_id", container_id_, "Owning container id")->required();
  cmd->add_option("filename", filename_, "Stored (generated) filename")->required();
}

Result<int> RemoveCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  auto record = app_.catalog().find(container_id_, filename_);
  if (!record.has_value()) {
    return std::unexpected(record.error());
  }

  bool deleted = false;
  bool uncataloged = false;
  if (record->has_value()) {
    deleted = app_.uploadService().remove(**record);
    auto dropped = app_.catalog().remove((*record)->path);
    if (!dropped.has_value()) {
      return std::unexpected(dropped.error());
    }
    uncataloged = *dropped;
  } else if (auto path = app_.fileStore().filePath(container_id_, filename_)) {
    deleted = app_.fileStore().remove(*path);
  }

  if (!deleted && !uncataloged) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "No stored file " + filename_ + " in " + container_id_));
  }

  if (options.json) {
    nlohmann::json result_json;
    result_json["success"] = true;
    result_json["container_id"] = container_id_;
    result_json["filename"] = filename_;
    result_json["file_deleted"] = deleted;
    result_json["catalog_updated"] = uncataloged;
    std::cout << result_json.dump() << std::endl;
  } else {
    error_handler.displaySuccess("Removed " + container_id_ + "/" + filename_);
  }

  return 0;
}

} // namespace upgate::cli
