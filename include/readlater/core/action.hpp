#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "readlater/core/tags.hpp"

namespace readlater::core {

// Mutations accepted by the modify endpoint
enum class ActionKind {
  kAdd,
  kArchive,
  kReadd,
  kFavorite,
  kUnfavorite,
  kDelete,
  kTagsAdd,
  kTagsRemove,
  kTagsReplace,
  kTagsClear,
  kTagRename,
  kTagDelete
};

// Wire name of an action kind ("archive", "tags_add", ...)
std::string_view actionKindToString(ActionKind kind);

// Parse a wire name, nullopt for names this client does not know
std::optional<ActionKind> actionKindFromString(std::string_view name);

// A plain action description as a caller would write it: {"action": "archive", "item_id": "1"}
using ActionMap = std::map<std::string, std::string>;

// Field names used on the wire
namespace fields {
inline constexpr const char* kAction = "action";
inline constexpr const char* kItemId = "item_id";
inline constexpr const char* kUrl = "url";
inline constexpr const char* kTitle = "title";
inline constexpr const char* kTags = "tags";
inline constexpr const char* kTag = "tag";
inline constexpr const char* kOldTag = "old_tag";
inline constexpr const char* kNewTag = "new_tag";
inline constexpr const char* kTime = "time";
inline constexpr const char* kTimestamp = "timestamp";
}  // namespace fields

// One mutation targeting one item. All fields are flat strings.
class Action {
 public:
  explicit Action(ActionKind kind);

  // Build from a caller-supplied map; the "action" value is kept verbatim
  static Action fromMap(ActionMap map);

  // Action name as sent, empty if the source map had none
  std::string action() const;

  // Known kind, nullopt if the action name is not one of ActionKind
  std::optional<ActionKind> kind() const;

  std::optional<std::string> itemId() const { return field(fields::kItemId); }
  std::optional<std::string> field(const std::string& name) const;
  const ActionMap& fields() const noexcept { return fields_; }

  // Copy of this action with one field set
  Action withField(const std::string& name, std::string value) const;

  nlohmann::json toJson() const;

  bool operator==(const Action& other) const = default;

 private:
  explicit Action(ActionMap fields);

  ActionMap fields_;
};

// One item id or an ordered list of ids
class ItemIds {
 public:
  ItemIds(std::string id) : ids_{std::move(id)} {}
  ItemIds(const char* id) : ids_{std::string(id)} {}
  ItemIds(std::vector<std::string> ids) : ids_(std::move(ids)) {}
  ItemIds(std::initializer_list<std::string> ids) : ids_(ids) {}

  const std::vector<std::string>& ids() const noexcept { return ids_; }

 private:
  std::vector<std::string> ids_;
};

// Target of an add action: a new url, or an item id already known to the server
struct AddTarget {
  std::optional<std::string> url;
  std::optional<std::string> item_id;
  std::optional<std::string> title;
  std::optional<TagValue> tags;
  // Unix seconds of when the item was saved, sent as the action's "time"
  std::optional<std::int64_t> time;

  static AddTarget fromUrl(std::string url);
  static AddTarget fromItemId(std::string item_id);
};

// Producers for the actions of a single builder call.
// List arguments fan out to one action per id, in order, sharing all other fields.
namespace actions {

Action add(const AddTarget& target);

std::vector<Action> archive(const ItemIds& ids);
std::vector<Action> readd(const ItemIds& ids);
std::vector<Action> favorite(const ItemIds& ids);
std::vector<Action> unfavorite(const ItemIds& ids);
std::vector<Action> remove(const ItemIds& ids);

// One normalized tags value is attached to every id
std::vector<Action> tagsAdd(const ItemIds& ids, const TagValue& tags);
std::vector<Action> tagsRemove(const ItemIds& ids, const TagValue& tags);
std::vector<Action> tagsReplace(const ItemIds& ids, const TagValue& tags);
// Braced tag lists, e.g. tagsAdd({"1", "2"}, {"a", "b"})
std::vector<Action> tagsAdd(const ItemIds& ids, std::initializer_list<std::string> tags);
std::vector<Action> tagsRemove(const ItemIds& ids, std::initializer_list<std::string> tags);
std::vector<Action> tagsReplace(const ItemIds& ids, std::initializer_list<std::string> tags);
std::vector<Action> tagsClear(const ItemIds& ids);

Action renameTag(const std::string& item_id, const std::string& old_tag,
                 const std::string& new_tag);
Action deleteTag(const std::string& item_id, const std::string& tag);

}  // namespace actions

}  // namespace readlater::core
