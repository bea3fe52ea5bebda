#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "upgate/cli/application.hpp"

namespace upgate::cli {

class RemoveCommand : public Command {
public:
  explicit RemoveCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "rm"; }
  std::string description() const override { return "Delete a stored file"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string container_id_;
  std::string filename_;
};

} // namespace upgate::cli
