#include "upgate/cli/commands/stats_command.hpp"

#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

#include "upgate/cli/command_error_handler.hpp"

namespace upgate::cli {

StatsCommand::StatsCommand(Application& app) : app_(app) {
}

Result<int> StatsCommand::execute(const GlobalOptions& options) {
  auto stats = app_.fileStore().stats();
  if (!stats.has_value()) {
    return std::unexpected(stats.error());
  }

  auto records = app_.catalog().listAll();
  if (!records.has_value()) {
    return std::unexpected(records.error());
  }

  if (options.json) {
    nlohmann::json result_json;
    result_json["root"] = stats->root.string();
    result_json["file_count"] = stats->file_count;
    result_json["total_bytes"] = stats->total_bytes;
    result_json["cataloged"] = records->size();
    std::cout << result_json.dump(2) << std::endl;
  } else {
    double megabytes = static_cast<double>(stats->total_bytes) / (1024.0 * 1024.0);
    std::cout << "Storage root: " << stats->root.string() << std::endl;
    std::cout << "Files:        " << stats->file_count << std::endl;
    std::cout << "Total size:   " << stats->total_bytes << " bytes ("
              << std::fixed << std::setprecision(2) << megabytes << " MB)" << std::endl;
    std::cout << "Cataloged:    " << records->size() << std::endl;
  }

  return 0;
}

} // namespace upgate::cli
