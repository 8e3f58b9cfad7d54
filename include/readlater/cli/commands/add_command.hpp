#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include "readlater/cli/application.hpp"

namespace readlater::cli {

class AddCommand : public Command {
public:
  explicit AddCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "add"; }
  std::string description() const override { return "Save a new item"; }
  void setupCommand(CLI::App* cmd) override;

  nlohmann::json buildOptions() const;

private:
  Application& app_;

  std::string url_;
  std::string title_;
  std::vector<std::string> tags_;
  std::string tweet_id_;
};

} // namespace readlater::cli
