#include "readlater/core/action_batch.hpp"

#include "readlater/util/time.hpp"

namespace readlater::core {

ActionBatch::ActionBatch()
    : actions_(std::make_shared<const std::vector<Action>>()) {}

ActionBatch::ActionBatch(std::vector<Action> actions)
    : actions_(std::make_shared<const std::vector<Action>>(std::move(actions))) {}

ActionBatch::ActionBatch(std::shared_ptr<const std::vector<Action>> actions)
    : actions_(std::move(actions)) {}

ActionBatch ActionBatch::fromMaps(const std::vector<ActionMap>& maps) {
  std::vector<Action> converted;
  converted.reserve(maps.size());
  for (const auto& map : maps) {
    converted.push_back(Action::fromMap(map));
  }
  return ActionBatch(std::move(converted));
}

Result<ActionBatch> ActionBatch::fromJson(const nlohmann::json& json) {
  if (!json.is_object() && !json.is_array()) {
    return makeErrorResult<ActionBatch>(ErrorCode::kInvalidArgument,
                                        "Actions must be an object or an array of objects");
  }

  std::vector<ActionMap> maps;
  for (const auto& entry : json.is_object() ? nlohmann::json::array({json}) : json) {
    if (!entry.is_object()) {
      return makeErrorResult<ActionBatch>(ErrorCode::kInvalidArgument,
                                          "Action must be an object: " + entry.dump());
    }

    ActionMap map;
    for (const auto& [name, value] : entry.items()) {
      if (value.is_null()) {
        continue;
      }
      map[name] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    maps.push_back(std::move(map));
  }

  return fromMaps(maps);
}

ActionBatch ActionBatch::append(const Action& action) const {
  return append(std::vector<Action>{action});
}

ActionBatch ActionBatch::append(const std::vector<Action>& actions) const {
  auto extended = std::make_shared<std::vector<Action>>();
  extended->reserve(actions_->size() + actions.size());
  extended->insert(extended->end(), actions_->begin(), actions_->end());
  extended->insert(extended->end(), actions.begin(), actions.end());
  return ActionBatch(std::shared_ptr<const std::vector<Action>>(std::move(extended)));
}

ActionBatch ActionBatch::add(const AddTarget& target) const {
  return append(actions::add(target));
}

ActionBatch ActionBatch::archive(const ItemIds& ids) const {
  return append(actions::archive(ids));
}

ActionBatch ActionBatch::readd(const ItemIds& ids) const {
  return append(actions::readd(ids));
}

ActionBatch ActionBatch::favorite(const ItemIds& ids) const {
  return append(actions::favorite(ids));
}

ActionBatch ActionBatch::unfavorite(const ItemIds& ids) const {
  return append(actions::unfavorite(ids));
}

ActionBatch ActionBatch::remove(const ItemIds& ids) const {
  return append(actions::remove(ids));
}

ActionBatch ActionBatch::tagsAdd(const ItemIds& ids, const TagValue& tags) const {
  return append(actions::tagsAdd(ids, tags));
}

ActionBatch ActionBatch::tagsRemove(const ItemIds& ids, const TagValue& tags) const {
  return append(actions::tagsRemove(ids, tags));
}

ActionBatch ActionBatch::tagsReplace(const ItemIds& ids, const TagValue& tags) const {
  return append(actions::tagsReplace(ids, tags));
}

ActionBatch ActionBatch::tagsAdd(const ItemIds& ids,
                                 std::initializer_list<std::string> tags) const {
  return append(actions::tagsAdd(ids, tags));
}

ActionBatch ActionBatch::tagsRemove(const ItemIds& ids,
                                    std::initializer_list<std::string> tags) const {
  return append(actions::tagsRemove(ids, tags));
}

ActionBatch ActionBatch::tagsReplace(const ItemIds& ids,
                                     std::initializer_list<std::string> tags) const {
  return append(actions::tagsReplace(ids, tags));
}

ActionBatch ActionBatch::tagsClear(const ItemIds& ids) const {
  return append(actions::tagsClear(ids));
}

ActionBatch ActionBatch::renameTag(const std::string& item_id, const std::string& old_tag,
                                   const std::string& new_tag) const {
  return append(actions::renameTag(item_id, old_tag, new_tag));
}

ActionBatch ActionBatch::deleteTag(const std::string& item_id, const std::string& tag) const {
  return append(actions::deleteTag(item_id, tag));
}

std::vector<Action> ActionBatch::stamped(std::chrono::system_clock::time_point at) const {
  const std::string timestamp = std::to_string(util::Time::toUnixSeconds(at));

  std::vector<Action> snapshot;
  snapshot.reserve(actions_->size());
  for (const auto& action : *actions_) {
    snapshot.push_back(action.withField(fields::kTimestamp, timestamp));
  }
  return snapshot;
}

}  // namespace readlater::core
