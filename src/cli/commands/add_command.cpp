#include "readlater/cli/commands/add_command.hpp"

#include <iostream>

#include "readlater/cli/command_error_handler.hpp"

namespace readlater::cli {

AddCommand::AddCommand(Application& app) : app_(app) {
}

void AddCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("url", url_, "URL to save")->required();
  cmd->add_option("--title", title_, "Title to store with the item");
  cmd->add_option("--tags", tags_, "Comma-separated tags")->delimiter(',');
  cmd->add_option("--tweet-id", tweet_id_, "Tweet the item was shared from");
}

nlohmann::json AddCommand::buildOptions() const {
  nlohmann::json options;
  options["url"] = url_;
  if (!title_.empty()) options["title"] = title_;
  if (!tags_.empty()) options["tags"] = tags_;
  if (!tweet_id_.empty()) options["tweet_id"] = tweet_id_;
  return options;
}

Result<int> AddCommand::execute(const GlobalOptions& options) {
  auto client = app_.client();
  if (!client.has_value()) {
    return std::unexpected(client.error());
  }

  auto result = (*client)->add(buildOptions());
  if (!result.has_value()) {
    return CommandErrorHandler(options).handleApiError(result.error(), name());
  }

  if (options.json) {
    nlohmann::json output;
    output["success"] = true;
    output["item_id"] = result->item.item_id;
    output["url"] = result->item.url();
    output["title"] = result->item.title();
    std::cout << output.dump() << std::endl;
  } else if (!options.quiet) {
    std::cout << "Saved " << result->item.url() << " as " << result->item.item_id << std::endl;
  }

  return 0;
}

} // namespace readlater::cli
