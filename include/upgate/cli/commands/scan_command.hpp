#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "upgate/cli/application.hpp"

namespace upgate::cli {

class ScanCommand : public Command {
public:
  explicit ScanCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "scan"; }
  std::string description() const override { return "Run the content scanner on a file"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string file_;
};

} // namespace upgate::cli
