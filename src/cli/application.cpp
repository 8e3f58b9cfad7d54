#include "readlater/cli/application.hpp"

#include <iostream>

#include "readlater/cli/command_error_handler.hpp"
#include "readlater/util/logging.hpp"

// Command includes
#include "readlater/cli/commands/list_command.hpp"
#include "readlater/cli/commands/add_command.hpp"
#include "readlater/cli/commands/modify_command.hpp"
#include "readlater/cli/commands/tags_command.hpp"
#include "readlater/cli/commands/config_command.hpp"

namespace readlater::cli {

Application::Application()
    : Application(nullptr) {
}

Application::Application(std::shared_ptr<util::HttpTransport> transport)
    : app_("readlater", "Command line client for a read-later bookmarking service")
    , transport_(std::move(transport)) {

  util::initializeConsoleLogging();

  app_.set_version_flag("--version", readlater::getVersion().toString());
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
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output (-vv for debug)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
}

void Application::setupCommands() {
  // Retrieval and saving
  registerCommand(std::make_unique<ListCommand>(*this));
  registerCommand(std::make_unique<AddCommand>(*this));

  // Item state changes
  registerCommand(std::make_unique<ModifyCommand>(*this, core::ActionKind::kArchive));
  registerCommand(std::make_unique<ModifyCommand>(*this, core::ActionKind::kReadd));
  registerCommand(std::make_unique<ModifyCommand>(*this, core::ActionKind::kFavorite));
  registerCommand(std::make_unique<ModifyCommand>(*this, core::ActionKind::kUnfavorite));
  registerCommand(std::make_unique<ModifyCommand>(*this, core::ActionKind::kDelete));

  // Tag editing
  registerCommand(std::make_unique<TagsCommand>(*this));

  // Configuration management
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  readlater list --count 10 --sort newest
  readlater list --untagged --state unread
  readlater add https://example.com --title "Example" --tags news,tech
  readlater archive 1234 2345
  readlater tags add news,tech 1234 2345
  readlater tags rename 1234 old-name new-name
  readlater config set consumer_key env:POCKET_CONSUMER_KEY

For more information on a specific command, run:
  readlater <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    CommandErrorHandler errors(global_options_);

    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      throw CLI::RuntimeError(errors.handleError(init_result.error(), "initialize"));
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      throw CLI::RuntimeError(errors.handleError(result.error(), cmd_ptr->name()));
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  // Store the command
  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (config_) {
    return {};
  }

  if (!global_options_.config_file.empty()) {
    auto loaded = config::Config::fromFile(global_options_.config_file);
    if (!loaded.has_value()) {
      return std::unexpected(loaded.error());
    }
    config_ = std::move(*loaded);
  } else {
    config_.emplace();
  }

  std::string level = config_->logging.level;
  if (global_options_.verbose > 1) {
    level = "debug";
  } else if (global_options_.verbose == 1) {
    level = "info";
  }
  util::initializeLogging(level, config_->logging.file);

  return {};
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  if (!config_) {
    throw std::runtime_error("Services not initialized");
  }
  return *config_;
}

Result<std::shared_ptr<api::Client>> Application::client() {
  if (client_) {
    return client_;
  }

  auto credentials = config().credentials();
  if (!credentials.has_value()) {
    return std::unexpected(credentials.error());
  }

  if (!transport_) {
    transport_ = std::make_shared<util::HttpClient>(
        std::chrono::seconds(config().timeout_seconds));
  }

  client_ = std::make_shared<api::Client>(std::move(*credentials), transport_);
  return client_;
}

} // namespace readlater::cli
