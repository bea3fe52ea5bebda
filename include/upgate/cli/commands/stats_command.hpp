#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "upgate/cli/application.hpp"

namespace upgate::cli {

class StatsCommand : public Command {
public:
  explicit StatsCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "stats"; }
  std::string description() const override { return "Show storage usage"; }

private:
  Application& app_;
};

} // namespace upgate::cli
