#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "upgate/cli/application.hpp"

namespace upgate::cli {

// Run the validation pipeline without storing anything
class ValidateCommand : public Command {
public:
  explicit ValidateCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "validate"; }
  std::string description() const override { return "Check a file against the upload policy"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string file_;
  std::string mime_;
  bool relaxed_ = false;
};

} // namespace upgate::cli
