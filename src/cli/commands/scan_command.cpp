#include "upgate/cli/commands/scan_command.hpp"

#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

#include "upgate/cli/command_error_handler.hpp"
#include "upgate/util/filesystem.hpp"

namespace upgate::cli {

ScanCommand::ScanCommand(Application& app) : app_(app) {
}

void ScanCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_, "File to scan")->required()->check(CLI::ExistingFile);
}

Result<int> ScanCommand::execute(const GlobalOptions& options) {
  auto content = util::FileSystem::readFile(file_);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  const auto& scanner = app_.validator().scanner();
  auto result = scanner.scan(*content);
  auto entropy = security::ContentScanner::entropy(*content);

  if (options.json) {
    nlohmann::json result_json;
    result_json["file"] = file_;
    result_json["safe"] = result.safe;
    result_json["entropy"] = entropy;
    result_json["size"] = content->size();
    if (!result.safe) {
      result_json["kind"] = std::string(core::violationKindToString(result.kind));
      result_json["reason"] = result.reason;
    }
    std::cout << result_json.dump(2) << std::endl;
  } else {
    std::cout << file_ << ": " << (result.safe ? "clean" : "suspicious") << std::endl;
    std::cout << "  entropy: " << std::fixed << std::setprecision(3) << entropy
              << " bits/byte" << std::endl;
    if (!result.safe) {
      std::cout << "  reason:  " << result.reason << std::endl;
    }
  }

  return result.safe ? 0 : kExitValidation;
}

} // namespace upgate::cli
