#include "upgate/cli/commands/gc_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "upgate/cli/command_error_handler.hpp"

namespace upgate::cli {

GcCommand::GcCommand(Application& app) : app_(app) {
}

void GcCommand::setupCommand(CLI::App* cmd) {
  cmd->add_flag("--dry-run", dry_run_, "List orphaned files without deleting them");
}

Result<int> GcCommand::execute(const GlobalOptions& options) {
  auto referenced = app_.catalog().referencedPaths();
  if (!referenced.has_value()) {
    return std::unexpected(referenced.error());
  }

  if (dry_run_) {
    auto orphans = app_.fileStore().findOrphans(*referenced);
    if (!orphans.has_value()) {
      return std::unexpected(orphans.error());
    }

    if (options.json) {
      nlohmann::json result_json;
      result_json["dry_run"] = true;
      result_json["orphans"] = nlohmann::json::array();
      for (const auto& path : *orphans) {
        result_json["orphans"].push_back(path.string());
      }
      std::cout << result_json.dump(2) << std::endl;
    } else {
      for (const auto& path : *orphans) {
        std::cout << path.string() << std::endl;
      }
      if (!options.quiet) {
        std::cout << orphans->size() << " orphaned file(s)" << std::endl;
      }
    }
    return 0;
  }

  auto removed = app_.fileStore().cleanupOrphans(*referenced);
  if (!removed.has_value()) {
    return std::unexpected(removed.error());
  }

  if (options.json) {
    nlohmann::json result_json;
    result_json["dry_run"] = false;
    result_json["removed"] = *removed;
    std::cout << result_json.dump() << std::endl;
  } else if (!options.quiet) {
    std::cout << "Removed " << *removed << " orphaned file(s)" << std::endl;
  }

  return 0;
}

} // namespace upgate::cli
