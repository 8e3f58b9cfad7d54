#include "readlater/cli/commands/list_command.hpp"

#include <charconv>
#include <iostream>
#include <iomanip>

#include "readlater/cli/command_error_handler.hpp"
#include "readlater/core/tags.hpp"
#include "readlater/util/time.hpp"

namespace readlater::cli {

ListCommand::ListCommand(Application& app) : app_(app) {
}

void ListCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("--state", state_, "Item state")
      ->check(CLI::IsMember({"unread", "archive", "all"}));
  cmd->add_flag("--favorite", favorite_, "Only favorited items");

  auto* tag_opt = cmd->add_option("--tag", tag_, "Only items with this tag");
  auto* untagged_opt = cmd->add_flag("--untagged", untagged_, "Only items without tags");
  auto* any_opt = cmd->add_flag("--any-tag", any_tag_, "Only items with at least one tag");
  tag_opt->excludes(untagged_opt)->excludes(any_opt);
  untagged_opt->excludes(any_opt);

  cmd->add_option("--search", search_, "Match title or url");
  cmd->add_option("--domain", domain_, "Only items from this domain");
  cmd->add_option("--sort", sort_, "Sort order")
      ->check(CLI::IsMember({"newest", "oldest", "title", "site"}));
  cmd->add_option("--detail", detail_, "Detail level")
      ->check(CLI::IsMember({"simple", "complete"}));
  cmd->add_option("--since", since_, "Changed since (Unix seconds or \"N days ago\")");
  cmd->add_option("-n,--count", count_, "Maximum number of items");
  cmd->add_option("--offset", offset_, "Skip this many items");
}

Result<nlohmann::json> ListCommand::buildOptions() const {
  nlohmann::json options = nlohmann::json::object();

  if (!state_.empty()) options["state"] = state_;
  if (favorite_) options["favorite"] = 1;

  if (!tag_.empty()) {
    options["tag"] = core::normalizeTags(core::TagValue{tag_});
  } else if (untagged_) {
    options["tag"] = core::normalizeTags(core::TagValue{core::TagSentinel::kUntagged});
  } else if (any_tag_) {
    options["tag"] = core::normalizeTags(core::TagValue{core::TagSentinel::kAny});
  }

  if (!search_.empty()) options["search"] = search_;
  if (!domain_.empty()) options["domain"] = domain_;
  if (!sort_.empty()) options["sort"] = sort_;
  if (!detail_.empty()) options["detailType"] = detail_;
  if (count_) options["count"] = *count_;
  if (offset_) options["offset"] = *offset_;

  if (!since_.empty()) {
    std::int64_t seconds = 0;
    auto [ptr, ec] = std::from_chars(since_.data(), since_.data() + since_.size(), seconds);
    if (ec == std::errc() && ptr == since_.data() + since_.size()) {
      options["since"] = seconds;
    } else {
      auto parsed = util::Time::parseRelativeTime(since_);
      if (!parsed.has_value()) {
        return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                         "Invalid --since value: " + since_));
      }
      options["since"] = util::Time::toUnixSeconds(*parsed);
    }
  }

  return options;
}

Result<int> ListCommand::execute(const GlobalOptions& options) {
  auto request = buildOptions();
  if (!request.has_value()) {
    return std::unexpected(request.error());
  }

  auto client = app_.client();
  if (!client.has_value()) {
    return std::unexpected(client.error());
  }

  auto result = (*client)->retrieve(*request);
  if (!result.has_value()) {
    return CommandErrorHandler(options).handleApiError(result.error(), name());
  }

  const auto& items = result->items;

  if (options.json) {
    nlohmann::json json_items = nlohmann::json::array();
    for (const auto& item : items) {
      nlohmann::json json_item;
      json_item["item_id"] = item.item_id;
      json_item["title"] = item.title();
      json_item["url"] = item.url();
      json_item["favorite"] = item.favorite;
      json_item["status"] = item.status;
      json_item["tags"] = item.tags;
      if (item.time_added > 0) {
        json_item["time_added"] = util::Time::toRfc3339(util::Time::fromUnixSeconds(item.time_added));
      }
      json_items.push_back(json_item);
    }

    nlohmann::json output;
    output["total"] = items.size();
    output["items"] = json_items;
    std::cout << output.dump() << std::endl;
    return 0;
  }

  if (items.empty()) {
    if (!options.quiet) {
      std::cout << "No items found." << std::endl;
    }
    return 0;
  }

  for (const auto& item : items) {
    std::cout << std::setw(12) << std::left << item.item_id << " "
              << (item.favorite ? "* " : "  ")
              << (item.title().empty() ? item.url() : item.title());
    if (!item.tags.empty()) {
      std::cout << "  [" << core::normalizeTags(core::TagValue{item.tags}) << "]";
    }
    std::cout << std::endl;

    if (options.verbose > 0) {
      std::cout << std::string(15, ' ') << item.url() << std::endl;
    }
  }

  return 0;
}

} // namespace readlater::cli
