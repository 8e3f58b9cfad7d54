#pragma once

#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "readlater/common.hpp"
#include "readlater/core/action.hpp"

namespace readlater::core {

/**
 * @brief Ordered, append-only list of actions for one modify request
 *
 * Every builder method is const and returns a new batch holding the previous
 * actions followed by the appended ones, so call chains compose and earlier
 * batches stay valid:
 *
 *   auto batch = ActionBatch().favorite({"1234", "2345"}).unfavorite("9876");
 *
 * Storage is shared between copies and never modified after construction.
 */
class ActionBatch {
 public:
  ActionBatch();
  explicit ActionBatch(std::vector<Action> actions);

  // Normalize plain caller maps into a batch, order preserved
  static ActionBatch fromMaps(const std::vector<ActionMap>& maps);

  // Same for JSON input: one object or an array of objects.
  // Scalar values are converted to strings.
  static Result<ActionBatch> fromJson(const nlohmann::json& json);

  ActionBatch append(const Action& action) const;
  ActionBatch append(const std::vector<Action>& actions) const;

  ActionBatch add(const AddTarget& target) const;
  ActionBatch archive(const ItemIds& ids) const;
  ActionBatch readd(const ItemIds& ids) const;
  ActionBatch favorite(const ItemIds& ids) const;
  ActionBatch unfavorite(const ItemIds& ids) const;
  ActionBatch remove(const ItemIds& ids) const;
  ActionBatch tagsAdd(const ItemIds& ids, const TagValue& tags) const;
  ActionBatch tagsRemove(const ItemIds& ids, const TagValue& tags) const;
  ActionBatch tagsReplace(const ItemIds& ids, const TagValue& tags) const;
  ActionBatch tagsAdd(const ItemIds& ids, std::initializer_list<std::string> tags) const;
  ActionBatch tagsRemove(const ItemIds& ids, std::initializer_list<std::string> tags) const;
  ActionBatch tagsReplace(const ItemIds& ids, std::initializer_list<std::string> tags) const;
  ActionBatch tagsClear(const ItemIds& ids) const;
  ActionBatch renameTag(const std::string& item_id, const std::string& old_tag,
                        const std::string& new_tag) const;
  ActionBatch deleteTag(const std::string& item_id, const std::string& tag) const;

  const std::vector<Action>& actions() const noexcept { return *actions_; }
  size_t size() const noexcept { return actions_->size(); }
  bool empty() const noexcept { return actions_->empty(); }

  // Snapshot for dispatch: every action carries the same timestamp
  // (Unix epoch seconds of `at`).
  std::vector<Action> stamped(std::chrono::system_clock::time_point at) const;

 private:
  explicit ActionBatch(std::shared_ptr<const std::vector<Action>> actions);

  std::shared_ptr<const std::vector<Action>> actions_;
};

}  // namespace readlater::core
