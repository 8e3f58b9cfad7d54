#include "readlater/cli/commands/modify_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "readlater/cli/command_error_handler.hpp"

namespace readlater::cli {

ModifyCommand::ModifyCommand(Application& app, core::ActionKind kind)
    : app_(app), kind_(kind) {
}

std::string ModifyCommand::name() const {
  return std::string(core::actionKindToString(kind_));
}

std::string ModifyCommand::description() const {
  switch (kind_) {
    case core::ActionKind::kArchive: return "Archive items";
    case core::ActionKind::kReadd: return "Move archived items back to the list";
    case core::ActionKind::kFavorite: return "Mark items as favorite";
    case core::ActionKind::kUnfavorite: return "Remove the favorite mark";
    case core::ActionKind::kDelete: return "Permanently delete items";
    default: return "Modify items";
  }
}

void ModifyCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("ids", item_ids_, "Item IDs")->required();
}

core::ActionBatch ModifyCommand::buildBatch() const {
  core::ActionBatch batch;
  switch (kind_) {
    case core::ActionKind::kArchive: return batch.archive(item_ids_);
    case core::ActionKind::kReadd: return batch.readd(item_ids_);
    case core::ActionKind::kFavorite: return batch.favorite(item_ids_);
    case core::ActionKind::kUnfavorite: return batch.unfavorite(item_ids_);
    case core::ActionKind::kDelete: return batch.remove(item_ids_);
    default: return batch;
  }
}

Result<int> ModifyCommand::execute(const GlobalOptions& options) {
  return sendBatch(app_, buildBatch(), options, name());
}

Result<int> ModifyCommand::sendBatch(Application& app, const core::ActionBatch& batch,
                                     const GlobalOptions& options, const std::string& operation) {
  auto client = app.client();
  if (!client.has_value()) {
    return std::unexpected(client.error());
  }

  CommandErrorHandler output(options);

  auto result = (*client)->send(batch);
  if (!result.has_value()) {
    return output.handleApiError(result.error(), operation);
  }

  auto failed = result->failedActions();
  const auto& actions = batch.actions();

  if (options.json) {
    nlohmann::json json_actions = nlohmann::json::array();
    for (size_t i = 0; i < actions.size(); ++i) {
      nlohmann::json entry = actions[i].toJson();
      entry["result"] = i < result->action_results.size() ? result->action_results[i]
                                                          : nlohmann::json();
      json_actions.push_back(entry);
    }
    nlohmann::json json_output;
    json_output["success"] = failed.empty();
    json_output["actions"] = json_actions;
    std::cout << json_output.dump() << std::endl;
  } else {
    for (size_t index : failed) {
      if (index < actions.size()) {
        output.displayWarning(actions[index].action() + " failed for item " +
                              actions[index].itemId().value_or("?"));
      }
    }
    if (failed.empty()) {
      output.displaySuccess(operation + ": " + std::to_string(actions.size()) + " action(s) applied");
    }
  }

  return failed.empty() ? 0 : 1;
}

} // namespace readlater::cli
