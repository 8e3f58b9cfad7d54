#include "readlater/cli/commands/config_command.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>

#include "readlater/cli/command_error_handler.hpp"

namespace readlater::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { get_mode_ = true; });

  auto set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value")->required();
  set_cmd->callback([this]() { set_mode_ = true; });

  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { path_mode_ = true; });

  auto validate_cmd = cmd->add_subcommand("validate", "Validate current configuration");
  validate_cmd->callback([this]() { validate_mode_ = true; });

  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  if (get_mode_) {
    return executeGet(options);
  } else if (set_mode_) {
    return executeSet(options);
  } else if (path_mode_) {
    return executePath(options);
  } else if (validate_mode_) {
    return executeValidate(options);
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> ConfigCommand::executeGet(const GlobalOptions& options) {
  auto result = app_.config().get(key_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["key"] = key_;
    output["value"] = *result;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << *result << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeSet(const GlobalOptions& options) {
  auto& config = app_.config();

  auto result = config.set(key_, value_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  auto save_result = config.save();
  if (!save_result.has_value()) {
    return std::unexpected(save_result.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["success"] = true;
    output["key"] = key_;
    output["value"] = value_;
    std::cout << output.dump(2) << "\n";
  } else {
    CommandErrorHandler(options).displaySuccess("Configuration updated: " + key_ + " = " + value_);
  }
  return 0;
}

Result<int> ConfigCommand::executePath(const GlobalOptions& options) {
  auto config_path = app_.config().path();
  if (config_path.empty()) {
    config_path = config::Config::defaultConfigPath();
  }
  bool exists = std::filesystem::exists(config_path);

  if (options.json) {
    nlohmann::json output;
    output["config_path"] = config_path.string();
    output["exists"] = exists;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << config_path.string() << "\n";
    if (!exists && !options.quiet) {
      std::cout << "(file not found, using defaults)\n";
    }
  }
  return 0;
}

Result<int> ConfigCommand::executeValidate(const GlobalOptions& options) {
  auto result = app_.config().validate();

  if (options.json) {
    nlohmann::json output;
    output["valid"] = result.has_value();
    if (!result.has_value()) {
      output["error"] = result.error().message();
    }
    std::cout << output.dump(2) << "\n";
    return result.has_value() ? 0 : 1;
  }

  if (!result.has_value()) {
    return CommandErrorHandler(options).handleError(result.error(), "validate");
  }
  CommandErrorHandler(options).displaySuccess("Configuration is valid");
  return 0;
}

} // namespace readlater::cli
