#include "readlater/api/payloads.hpp"

#include <algorithm>
#include <charconv>

namespace readlater::api {

namespace {

std::string readString(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return {};
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}

std::optional<std::int64_t> readInt(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end()) {
    return std::nullopt;
  }
  if (it->is_number_integer()) {
    return it->get<std::int64_t>();
  }
  if (it->is_boolean()) {
    return it->get<bool>() ? 1 : 0;
  }
  if (it->is_string()) {
    const auto& text = it->get_ref<const std::string&>();
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc() && ptr == text.data() + text.size()) {
      return value;
    }
  }
  return std::nullopt;
}

std::vector<std::string> readTags(const nlohmann::json& json) {
  std::vector<std::string> tags;
  auto it = json.find("tags");
  if (it == json.end()) {
    return tags;
  }
  // {"tag": {"item_id": "...", "tag": "tag"}, ...}
  if (it->is_object()) {
    for (const auto& [name, _] : it->items()) {
      tags.push_back(name);
    }
  } else if (it->is_array()) {
    for (const auto& tag : *it) {
      if (tag.is_string()) {
        tags.push_back(tag.get<std::string>());
      } else if (tag.is_object()) {
        tags.push_back(readString(tag, "tag"));
      }
    }
  }
  return tags;
}

}  // namespace

const std::string& SavedItem::title() const {
  return resolved_title.empty() ? given_title : resolved_title;
}

const std::string& SavedItem::url() const {
  return resolved_url.empty() ? given_url : resolved_url;
}

Result<SavedItem> SavedItem::fromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return makeErrorResult<SavedItem>(ErrorCode::kParseError, "Item is not an object");
  }

  SavedItem item;
  item.item_id = readString(json, "item_id");
  if (item.item_id.empty()) {
    return makeErrorResult<SavedItem>(ErrorCode::kParseError, "Item without item_id");
  }

  item.given_url = readString(json, "given_url");
  item.resolved_url = readString(json, "resolved_url");
  if (item.given_url.empty()) {
    // the add endpoint names it normal_url
    item.given_url = readString(json, "normal_url");
  }
  item.given_title = readString(json, "given_title");
  item.resolved_title = readString(json, "resolved_title");
  if (item.resolved_title.empty()) {
    item.resolved_title = readString(json, "title");
  }
  item.excerpt = readString(json, "excerpt");
  item.favorite = readInt(json, "favorite").value_or(0) != 0;
  item.status = static_cast<int>(readInt(json, "status").value_or(0));
  item.word_count = readInt(json, "word_count").value_or(0);
  item.time_added = readInt(json, "time_added").value_or(0);
  item.tags = readTags(json);

  return item;
}

Result<RetrieveResult> RetrieveResult::fromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return makeErrorResult<RetrieveResult>(ErrorCode::kParseError,
                                           "Retrieve response is not an object");
  }

  RetrieveResult result;
  result.status = static_cast<int>(readInt(json, "status").value_or(0));
  result.complete = static_cast<int>(readInt(json, "complete").value_or(0));
  result.since = readInt(json, "since");

  auto list = json.find("list");
  if (list == json.end() || list->is_null()) {
    return result;
  }

  // An empty result arrives as [] instead of {}
  if (list->is_array()) {
    if (!list->empty()) {
      return makeErrorResult<RetrieveResult>(ErrorCode::kParseError,
                                             "Unexpected item array in retrieve response");
    }
    return result;
  }

  if (!list->is_object()) {
    return makeErrorResult<RetrieveResult>(ErrorCode::kParseError,
                                           "Retrieve list is not an object");
  }

  std::vector<std::pair<std::int64_t, SavedItem>> ordered;
  std::int64_t position = 0;
  for (const auto& [_, entry] : list->items()) {
    auto item = SavedItem::fromJson(entry);
    if (!item.has_value()) {
      return std::unexpected(item.error());
    }
    auto sort_id = readInt(entry, "sort_id").value_or(position);
    ordered.emplace_back(sort_id, std::move(*item));
    ++position;
  }

  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const auto& a, const auto& b) { return a.first < b.first; });

  result.items.reserve(ordered.size());
  for (auto& [_, item] : ordered) {
    result.items.push_back(std::move(item));
  }

  return result;
}

Result<AddResult> AddResult::fromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return makeErrorResult<AddResult>(ErrorCode::kParseError, "Add response is not an object");
  }

  auto item_json = json.find("item");
  if (item_json == json.end()) {
    return makeErrorResult<AddResult>(ErrorCode::kParseError, "Add response without item");
  }

  auto item = SavedItem::fromJson(*item_json);
  if (!item.has_value()) {
    return std::unexpected(item.error());
  }

  AddResult result;
  result.status = static_cast<int>(readInt(json, "status").value_or(0));
  result.item = std::move(*item);
  return result;
}

std::vector<size_t> SendResult::failedActions() const {
  std::vector<size_t> failed;
  for (size_t i = 0; i < action_results.size(); ++i) {
    if (action_results[i].is_boolean() && !action_results[i].get<bool>()) {
      failed.push_back(i);
    }
  }
  return failed;
}

Result<SendResult> SendResult::fromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return makeErrorResult<SendResult>(ErrorCode::kParseError, "Send response is not an object");
  }

  auto results = json.find("action_results");
  if (results == json.end() || !results->is_array()) {
    return makeErrorResult<SendResult>(ErrorCode::kParseError,
                                       "Send response without action_results");
  }

  SendResult result;
  result.status = static_cast<int>(readInt(json, "status").value_or(0));
  result.action_results.assign(results->begin(), results->end());

  auto errors = json.find("action_errors");
  if (errors != json.end() && errors->is_array()) {
    result.action_errors.assign(errors->begin(), errors->end());
  }

  return result;
}

}  // namespace readlater::api
