#include "upgate/cli/command_error_handler.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

namespace upgate::cli {

int exitCodeFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kValidationError:
      return kExitValidation;
    case ErrorCode::kRateLimited:
      return kExitRateLimited;
    case ErrorCode::kStorageError:
    case ErrorCode::kFileWriteError:
    case ErrorCode::kDirectoryCreateError:
      return kExitStorage;
    default:
      return kExitError;
  }
}

int CommandErrorHandler::handleError(const Error& error) {
  spdlog::debug("Command failed: {} ({})", error.message(), errorCodeToString(error.code()));

  if (options_.json) {
    nlohmann::json error_json;
    error_json["success"] = false;
    error_json["error"] = error.message();
    error_json["code"] = std::string(errorCodeToString(error.code()));
    std::cout << error_json.dump() << std::endl;
  } else {
    std::cerr << "Error: " << error.message() << std::endl;
  }

  return exitCodeFor(error.code());
}

int CommandErrorHandler::handleUploadError(const core::UploadError& error) {
  if (options_.json) {
    nlohmann::json error_json;
    error_json["success"] = false;
    error_json["kind"] = std::string(core::uploadErrorKindToString(error.kind()));
    error_json["reasons"] = error.reasons();
    if (!error.violations().empty()) {
      error_json["violations"] = violationsToJson(error.violations());
    }
    if (auto window = error.window()) {
      error_json["window"] = std::string(core::rateWindowToString(*window));
    }
    std::cout << error_json.dump() << std::endl;
  } else {
    std::cerr << "Upload rejected (" << core::uploadErrorKindToString(error.kind()) << "):"
              << std::endl;
    for (const auto& reason : error.reasons()) {
      std::cerr << "  - " << reason << std::endl;
    }
  }

  return exitCodeFor(error.toError().code());
}

void CommandErrorHandler::displaySuccess(const std::string& message) {
  if (options_.json) {
    nlohmann::json success_json;
    success_json["success"] = true;
    success_json["message"] = message;
    std::cout << success_json.dump() << std::endl;
  } else if (!options_.quiet) {
    std::cout << message << std::endl;
  }
}

nlohmann::json violationsToJson(const std::vector<core::Violation>& violations) {
  auto array = nlohmann::json::array();
  for (const auto& violation : violations) {
    array.push_back({{"kind", std::string(core::violationKindToString(violation.kind))},
                     {"message", violation.message}});
  }
  return array;
}

} // namespace upgate::cli
