#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "upgate/cli/application.hpp"

namespace upgate::cli {

class ListCommand : public Command {
public:
  explicit ListCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "ls"; }
  std::string description() const override { return "List stored files"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string container_id_;
};

} // namespace upgate::cli
