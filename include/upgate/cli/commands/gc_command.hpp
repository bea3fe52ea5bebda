#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "upgate/cli/application.hpp"

namespace upgate::cli {

// Delete stored files that no catalog record references
class GcCommand : public Command {
public:
  explicit GcCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "gc"; }
  std::string description() const override { return "Remove orphaned files from storage"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  bool dry_run_ = false;
};

} // namespace upgate::cli
