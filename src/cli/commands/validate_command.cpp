#include "upgate/cli/commands/validate_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "upgate/cli/command_error_handler.hpp"

namespace upgate::cli {

ValidateCommand::ValidateCommand(Application& app) : app_(app) {
}

void ValidateCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_, "File to check")->required()->check(CLI::ExistingFile);
  cmd->add_option("--mime", mime_, "Declared MIME type (default: guessed from extension)");
  cmd->add_flag("--relaxed", relaxed_, "Use the relaxed profile");
}

Result<int> ValidateCommand::execute(const GlobalOptions& options) {
  std::filesystem::path path(file_);
  auto declared = mime_.empty()
      ? security::mimeTypeForExtension(security::lowercaseExtension(path.filename().string()))
      : mime_;
  auto profile = relaxed_ ? security::ValidationProfile::kRelaxed : app_.config().default_profile;

  auto outcome = app_.validator().validate(path, declared, profile);

  if (options.json) {
    nlohmann::json result_json;
    result_json["file"] = path.string();
    result_json["profile"] = std::string(security::profileToString(profile));
    result_json["declared_mime"] = declared;
    result_json["accepted"] = outcome.accepted();
    result_json["violations"] = violationsToJson(outcome.violations());
    std::cout << result_json.dump(2) << std::endl;
  } else if (outcome.accepted()) {
    if (!options.quiet) {
      std::cout << path.filename().string() << ": accepted ("
                << security::profileToString(profile) << ")" << std::endl;
    }
  } else {
    std::cout << path.filename().string() << ": rejected" << std::endl;
    for (const auto& violation : outcome.violations()) {
      std::cout << "  [" << core::violationKindToString(violation.kind) << "] "
                << violation.message << std::endl;
    }
  }

  return outcome.accepted() ? 0 : kExitValidation;
}

} // namespace upgate::cli
