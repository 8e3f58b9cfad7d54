#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "readlater/cli/application.hpp"
#include "readlater/core/action_batch.hpp"

namespace readlater::cli {

class TagsCommand : public Command {
public:
  explicit TagsCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "tags"; }
  std::string description() const override { return "Edit item tags"; }
  void setupCommand(CLI::App* cmd) override;

  // Batch for the selected subcommand
  Result<core::ActionBatch> buildBatch() const;

private:
  enum class Mode { kNone, kAdd, kRemove, kReplace, kClear, kRename, kDelete };

  Application& app_;
  Mode mode_ = Mode::kNone;

  // add / remove / replace
  std::vector<std::string> tags_;
  std::vector<std::string> item_ids_;

  // rename / delete
  std::string item_id_;
  std::string old_tag_;
  std::string new_tag_;
};

} // namespace readlater::cli
