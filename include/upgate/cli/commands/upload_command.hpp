#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "upgate/cli/application.hpp"

namespace upgate::cli {

class UploadCommand : public Command {
public:
  explicit UploadCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "upload"; }
  std::string description() const override { return "Validate and store a file for a container"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string container_id_;
  std::string file_;
  std::string user_;
  std::string mime_;
  bool relaxed_ = false;
};

} // namespace upgate::cli
