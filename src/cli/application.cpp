#include "upgate/cli/application.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

#include "upgate/cli/command_error_handler.hpp"
#include "upgate/util/logging.hpp"

#include "upgate/cli/commands/gc_command.hpp"
#include "upgate/cli/commands/list_command.hpp"
#include "upgate/cli/commands/remove_command.hpp"
#include "upgate/cli/commands/scan_command.hpp"
#include "upgate/cli/commands/stats_command.hpp"
#include "upgate/cli/commands/upload_command.hpp"
#include "upgate/cli/commands/validate_command.hpp"

namespace upgate::cli {

Application::Application()
    : app_("upgate", "Upload admission control and file integrity validation") {
  app_.set_version_flag("--version", upgate::getVersion().toString());
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Only print errors");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--storage-root", global_options_.storage_root, "Override storage root");
}

void Application::setupCommands() {
  // Uploads
  registerCommand(std::make_unique<UploadCommand>(*this));
  registerCommand(std::make_unique<ValidateCommand>(*this));
  registerCommand(std::make_unique<ScanCommand>(*this));

  // Stored files
  registerCommand(std::make_unique<RemoveCommand>(*this));
  registerCommand(std::make_unique<ListCommand>(*this));

  // Maintenance
  registerCommand(std::make_unique<GcCommand>(*this));
  registerCommand(std::make_unique<StatsCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  upgate upload task-42 report.pdf --user alice
  upgate validate photo.png --mime image/png
  upgate ls task-42 --json
  upgate gc --dry-run

Exit codes: 0 ok, 1 error, 2 validation, 3 rate limit, 4 storage)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());
  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    CommandErrorHandler error_handler(global_options_);

    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      throw CLI::RuntimeError(error_handler.handleError(init_result.error()));
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      throw CLI::RuntimeError(error_handler.handleError(result.error()));
    }

    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  config_ = std::make_unique<config::Config>();
  auto config_path = global_options_.config_file.empty()
      ? config::Config::defaultConfigPath()
      : std::filesystem::path(global_options_.config_file);
  if (auto loaded = config_->load(config_path); !loaded.has_value()) {
    return loaded;
  }
  if (!global_options_.storage_root.empty()) {
    config_->root = global_options_.storage_root;
  }
  if (auto valid = config_->validate(); !valid.has_value()) {
    return valid;
  }

  util::LogOptions log_options;
  log_options.level = config_->log_level;
  log_options.file = config_->log_file;
  log_options.verbose = global_options_.verbose > 0;
  log_options.quiet = global_options_.quiet;
  // A broken log file only costs the file sink
  if (auto logging = util::setupLogging(log_options); !logging.has_value()) {
    spdlog::debug("Continuing with stderr logging only");
  }

  rate_limiter_ = std::make_unique<quota::RateLimiter>(config_->rate_limits);
  validator_ = std::make_unique<security::FileValidator>(
      config_->policy, security::makeMimeSniffer(config_->mime_detection));

  store::FileStore::Config store_config;
  store_config.root = config_->root;
  store_config.temp_dir = config_->temp_dir;
  file_store_ = std::make_unique<store::FileStore>(store_config, *validator_, *rate_limiter_);
  if (auto layout = file_store_->ensureLayout(); !layout.has_value()) {
    return layout;
  }

  catalog_ = std::make_unique<store::AttachmentCatalog>(config_->catalogPath());
  upload_service_ = std::make_unique<upload::UploadService>(*file_store_, *validator_);

  spdlog::debug("Storage root {}, MIME detection {}", config_->root.string(),
                security::mimeDetectionToString(config_->mime_detection));

  services_initialized_ = true;
  return {};
}

} // namespace upgate::cli
