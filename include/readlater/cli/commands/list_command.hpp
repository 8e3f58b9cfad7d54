#pragma once

#include <optional>
#include <string>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include "readlater/cli/application.hpp"

namespace readlater::cli {

class ListCommand : public Command {
public:
  explicit ListCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "list"; }
  std::string description() const override { return "List saved items"; }
  void setupCommand(CLI::App* cmd) override;

  // Retrieve options for the current flags
  Result<nlohmann::json> buildOptions() const;

private:
  Application& app_;

  std::string state_;
  bool favorite_ = false;
  std::string tag_;
  bool untagged_ = false;
  bool any_tag_ = false;
  std::string search_;
  std::string domain_;
  std::string sort_;
  std::string detail_;
  std::string since_;
  std::optional<int> count_;
  std::optional<int> offset_;
};

} // namespace readlater::cli
