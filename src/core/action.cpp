#include "readlater/core/action.hpp"

#include <array>
#include <utility>

namespace readlater::core {

namespace {

constexpr std::array<std::pair<ActionKind, std::string_view>, 12> kActionNames = {{
    {ActionKind::kAdd, "add"},
    {ActionKind::kArchive, "archive"},
    {ActionKind::kReadd, "readd"},
    {ActionKind::kFavorite, "favorite"},
    {ActionKind::kUnfavorite, "unfavorite"},
    {ActionKind::kDelete, "delete"},
    {ActionKind::kTagsAdd, "tags_add"},
    {ActionKind::kTagsRemove, "tags_remove"},
    {ActionKind::kTagsReplace, "tags_replace"},
    {ActionKind::kTagsClear, "tags_clear"},
    {ActionKind::kTagRename, "tag_rename"},
    {ActionKind::kTagDelete, "tag_delete"},
}};

std::vector<Action> fanOut(ActionKind kind, const ItemIds& ids,
                           const std::optional<std::string>& tags = std::nullopt) {
  std::vector<Action> result;
  result.reserve(ids.ids().size());
  for (const auto& id : ids.ids()) {
    auto action = Action(kind).withField(fields::kItemId, id);
    if (tags) {
      action = action.withField(fields::kTags, *tags);
    }
    result.push_back(std::move(action));
  }
  return result;
}

}  // namespace

std::string_view actionKindToString(ActionKind kind) {
  for (const auto& [k, name] : kActionNames) {
    if (k == kind) {
      return name;
    }
  }
  return "unknown";
}

std::optional<ActionKind> actionKindFromString(std::string_view name) {
  for (const auto& [kind, n] : kActionNames) {
    if (n == name) {
      return kind;
    }
  }
  return std::nullopt;
}

Action::Action(ActionKind kind) {
  fields_[fields::kAction] = std::string(actionKindToString(kind));
}

Action::Action(ActionMap fields) : fields_(std::move(fields)) {}

Action Action::fromMap(ActionMap map) {
  return Action(std::move(map));
}

std::string Action::action() const {
  return field(fields::kAction).value_or("");
}

std::optional<ActionKind> Action::kind() const {
  return actionKindFromString(action());
}

std::optional<std::string> Action::field(const std::string& name) const {
  auto it = fields_.find(name);
  if (it == fields_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Action Action::withField(const std::string& name, std::string value) const {
  Action copy = *this;
  copy.fields_[name] = std::move(value);
  return copy;
}

nlohmann::json Action::toJson() const {
  nlohmann::json json = nlohmann::json::object();
  for (const auto& [name, value] : fields_) {
    json[name] = value;
  }
  return json;
}

AddTarget AddTarget::fromUrl(std::string url) {
  AddTarget target;
  target.url = std::move(url);
  return target;
}

AddTarget AddTarget::fromItemId(std::string item_id) {
  AddTarget target;
  target.item_id = std::move(item_id);
  return target;
}

namespace actions {

Action add(const AddTarget& target) {
  Action action(ActionKind::kAdd);
  if (target.url) {
    action = action.withField(fields::kUrl, *target.url);
  }
  if (target.item_id) {
    action = action.withField(fields::kItemId, *target.item_id);
  }
  if (target.title) {
    action = action.withField(fields::kTitle, *target.title);
  }
  if (target.tags) {
    action = action.withField(fields::kTags, normalizeTags(*target.tags));
  }
  if (target.time) {
    action = action.withField(fields::kTime, std::to_string(*target.time));
  }
  return action;
}

std::vector<Action> archive(const ItemIds& ids) {
  return fanOut(ActionKind::kArchive, ids);
}

std::vector<Action> readd(const ItemIds& ids) {
  return fanOut(ActionKind::kReadd, ids);
}

std::vector<Action> favorite(const ItemIds& ids) {
  return fanOut(ActionKind::kFavorite, ids);
}

std::vector<Action> unfavorite(const ItemIds& ids) {
  return fanOut(ActionKind::kUnfavorite, ids);
}

std::vector<Action> remove(const ItemIds& ids) {
  return fanOut(ActionKind::kDelete, ids);
}

std::vector<Action> tagsAdd(const ItemIds& ids, const TagValue& tags) {
  return fanOut(ActionKind::kTagsAdd, ids, normalizeTags(tags));
}

std::vector<Action> tagsRemove(const ItemIds& ids, const TagValue& tags) {
  return fanOut(ActionKind::kTagsRemove, ids, normalizeTags(tags));
}

std::vector<Action> tagsReplace(const ItemIds& ids, const TagValue& tags) {
  return fanOut(ActionKind::kTagsReplace, ids, normalizeTags(tags));
}

std::vector<Action> tagsAdd(const ItemIds& ids, std::initializer_list<std::string> tags) {
  return tagsAdd(ids, TagValue{std::vector<std::string>(tags)});
}

std::vector<Action> tagsRemove(const ItemIds& ids, std::initializer_list<std::string> tags) {
  return tagsRemove(ids, TagValue{std::vector<std::string>(tags)});
}

std::vector<Action> tagsReplace(const ItemIds& ids, std::initializer_list<std::string> tags) {
  return tagsReplace(ids, TagValue{std::vector<std::string>(tags)});
}

std::vector<Action> tagsClear(const ItemIds& ids) {
  return fanOut(ActionKind::kTagsClear, ids);
}

Action renameTag(const std::string& item_id, const std::string& old_tag,
                 const std::string& new_tag) {
  return Action(ActionKind::kTagRename)
      .withField(fields::kItemId, item_id)
      .withField(fields::kOldTag, old_tag)
      .withField(fields::kNewTag, new_tag);
}

Action deleteTag(const std::string& item_id, const std::string& tag) {
  return Action(ActionKind::kTagDelete)
      .withField(fields::kItemId, item_id)
      .withField(fields::kTag, tag);
}

}  // namespace actions

}  // namespace readlater::core
