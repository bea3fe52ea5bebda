#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "upgate/cli/application.hpp"
#include "upgate/core/upload_error.hpp"

namespace upgate::cli {

// Exit codes scripts can branch on
constexpr int kExitError = 1;
constexpr int kExitValidation = 2;
constexpr int kExitRateLimited = 3;
constexpr int kExitStorage = 4;

int exitCodeFor(ErrorCode code);

// Formats errors and results for CLI output
class CommandErrorHandler {
public:
  explicit CommandErrorHandler(const GlobalOptions& options) : options_(options) {}

  // Print the error, return the exit code
  int handleError(const Error& error);

  // Print every reason of a rejected upload, return the exit code
  int handleUploadError(const core::UploadError& error);

  void displaySuccess(const std::string& message);

private:
  const GlobalOptions& options_;
};

nlohmann::json violationsToJson(const std::vector<core::Violation>& violations);

} // namespace upgate::cli
