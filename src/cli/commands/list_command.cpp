#include "upgate/cli/commands/list_command.hpp"

#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

#include "upgate/cli/command_error_handler.hpp"
#include "upgate/util/time.hpp"

namespace upgate::cli {

ListCommand::ListCommand(Application& app) : app_(app) {
}

void ListCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("container_id", container_id_, "Only list this container");
}

Result<int> ListCommand::execute(const GlobalOptions& options) {
  auto records = container_id_.empty()
      ? app_.catalog().listAll()
      : app_.catalog().listForContainer(container_id_);
  if (!records.has_value()) {
    return std::unexpected(records.error());
  }

  if (options.json) {
    auto array = nlohmann::json::array();
    for (const auto& record : *records) {
      array.push_back(store::recordToJson(record));
    }
    std::cout << array.dump(2) << std::endl;
    return 0;
  }

  if (records->empty()) {
    if (!options.quiet) {
      std::cout << "No stored files" << std::endl;
    }
    return 0;
  }

  for (const auto& record : *records) {
    std::cout << std::left << std::setw(24) << util::Time::toRfc3339(record.created) << "  "
              << std::setw(48) << record.relativePath() << "  "
              << std::right << std::setw(10) << record.size << "  "
              << record.uploaded_by << "  " << record.original_filename << std::endl;
  }

  return 0;
}

} // namespace upgate::cli
