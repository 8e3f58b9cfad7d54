#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "readlater/common.hpp"
#include "readlater/api/client.hpp"
#include "readlater/config/config.hpp"
#include "readlater/util/http_client.hpp"

namespace readlater::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
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
 * @brief Main CLI application
 */
class Application {
public:
  Application();

  // Use the given transport instead of libcurl
  explicit Application(std::shared_ptr<util::HttpTransport> transport);
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  const GlobalOptions& globalOptions() const;

  // Loaded configuration. Only valid once a command is running.
  config::Config& config();

  // API client built from the configuration, created on first use
  Result<std::shared_ptr<api::Client>> client();

private:
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);

  Result<void> initializeServices();

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  std::optional<config::Config> config_;
  std::shared_ptr<util::HttpTransport> transport_;
  std::shared_ptr<api::Client> client_;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace readlater::cli
