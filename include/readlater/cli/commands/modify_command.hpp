#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "readlater/cli/application.hpp"
#include "readlater/core/action_batch.hpp"

namespace readlater::cli {

// One subcommand per item state change: archive, readd, favorite, unfavorite, delete
class ModifyCommand : public Command {
public:
  ModifyCommand(Application& app, core::ActionKind kind);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override;
  std::string description() const override;
  void setupCommand(CLI::App* cmd) override;

  core::ActionBatch buildBatch() const;

  // Send a batch and print one line per action. Shared with the tags command.
  static Result<int> sendBatch(Application& app, const core::ActionBatch& batch,
                               const GlobalOptions& options, const std::string& operation);

private:
  Application& app_;
  core::ActionKind kind_;
  std::vector<std::string> item_ids_;
};

} // namespace readlater::cli
