#include "readlater/cli/commands/tags_command.hpp"

#include "readlater/cli/commands/modify_command.hpp"

namespace readlater::cli {

TagsCommand::TagsCommand(Application& app) : app_(app) {
}

void TagsCommand::setupCommand(CLI::App* cmd) {
  auto add_cmd = cmd->add_subcommand("add", "Add tags to items");
  add_cmd->add_option("tags", tags_, "Comma-separated tags")->required()->delimiter(',');
  add_cmd->add_option("ids", item_ids_, "Item IDs")->required();
  add_cmd->callback([this]() { mode_ = Mode::kAdd; });

  auto remove_cmd = cmd->add_subcommand("remove", "Remove tags from items");
  remove_cmd->add_option("tags", tags_, "Comma-separated tags")->required()->delimiter(',');
  remove_cmd->add_option("ids", item_ids_, "Item IDs")->required();
  remove_cmd->callback([this]() { mode_ = Mode::kRemove; });

  auto replace_cmd = cmd->add_subcommand("replace", "Replace all tags of items");
  replace_cmd->add_option("tags", tags_, "Comma-separated tags")->required()->delimiter(',');
  replace_cmd->add_option("ids", item_ids_, "Item IDs")->required();
  replace_cmd->callback([this]() { mode_ = Mode::kReplace; });

  auto clear_cmd = cmd->add_subcommand("clear", "Remove every tag from items");
  clear_cmd->add_option("ids", item_ids_, "Item IDs")->required();
  clear_cmd->callback([this]() { mode_ = Mode::kClear; });

  auto rename_cmd = cmd->add_subcommand("rename", "Rename a tag");
  rename_cmd->add_option("id", item_id_, "Item ID")->required();
  rename_cmd->add_option("old", old_tag_, "Current tag name")->required();
  rename_cmd->add_option("new", new_tag_, "New tag name")->required();
  rename_cmd->callback([this]() { mode_ = Mode::kRename; });

  auto delete_cmd = cmd->add_subcommand("delete", "Delete a tag");
  delete_cmd->add_option("id", item_id_, "Item ID")->required();
  delete_cmd->add_option("tag", old_tag_, "Tag to delete")->required();
  delete_cmd->callback([this]() { mode_ = Mode::kDelete; });

  cmd->require_subcommand(1);
}

Result<core::ActionBatch> TagsCommand::buildBatch() const {
  core::ActionBatch batch;
  core::TagValue tags{tags_};

  switch (mode_) {
    case Mode::kAdd: return batch.tagsAdd(item_ids_, tags);
    case Mode::kRemove: return batch.tagsRemove(item_ids_, tags);
    case Mode::kReplace: return batch.tagsReplace(item_ids_, tags);
    case Mode::kClear: return batch.tagsClear(item_ids_);
    case Mode::kRename: return batch.renameTag(item_id_, old_tag_, new_tag_);
    case Mode::kDelete: return batch.deleteTag(item_id_, old_tag_);
    case Mode::kNone: break;
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> TagsCommand::execute(const GlobalOptions& options) {
  auto batch = buildBatch();
  if (!batch.has_value()) {
    return std::unexpected(batch.error());
  }
  return ModifyCommand::sendBatch(app_, *batch, options, name());
}

} // namespace readlater::cli
