#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "readlater/cli/application.hpp"

namespace readlater::cli {

class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "config"; }
  std::string description() const override { return "Manage configuration settings"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string key_;
  std::string value_;

  bool get_mode_ = false;
  bool set_mode_ = false;
  bool path_mode_ = false;
  bool validate_mode_ = false;

  Result<int> executeGet(const GlobalOptions& options);
  Result<int> executeSet(const GlobalOptions& options);
  Result<int> executePath(const GlobalOptions& options);
  Result<int> executeValidate(const GlobalOptions& options);
};

} // namespace readlater::cli
