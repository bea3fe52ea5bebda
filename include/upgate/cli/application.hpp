#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "upgate/common.hpp"
#include "upgate/config/config.hpp"
#include "upgate/quota/rate_limiter.hpp"
#include "upgate/security/file_validator.hpp"
#include "upgate/store/attachment_catalog.hpp"
#include "upgate/store/file_store.hpp"
#include "upgate/upload/upload_service.hpp"

namespace upgate::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Show info and debug logs
  bool quiet = false;          // --quiet: Only errors
  std::string config_file;     // --config: Path to config file
  std::string storage_root;    // --storage-root: Override storage root
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application and composition root
 *
 * Services are built once, after argument parsing, from the loaded config.
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  // Service accessors for commands, valid once a command runs
  const GlobalOptions& globalOptions() const { return global_options_; }
  config::Config& config() { return *config_; }
  quota::RateLimiter& rateLimiter() { return *rate_limiter_; }
  const security::FileValidator& validator() const { return *validator_; }
  store::FileStore& fileStore() { return *file_store_; }
  store::AttachmentCatalog& catalog() { return *catalog_; }
  upload::UploadService& uploadService() { return *upload_service_; }

private:
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);

  Result<void> initializeServices();

  CLI::App app_;
  GlobalOptions global_options_;
  bool services_initialized_ = false;

  std::unique_ptr<config::Config> config_;
  std::unique_ptr<quota::RateLimiter> rate_limiter_;
  std::unique_ptr<security::FileValidator> validator_;
  std::unique_ptr<store::FileStore> file_store_;
  std::unique_ptr<store::AttachmentCatalog> catalog_;
  std::unique_ptr<upload::UploadService> upload_service_;

  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace upgate::cli
