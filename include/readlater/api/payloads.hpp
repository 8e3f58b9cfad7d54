#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "readlater/common.hpp"

namespace readlater::api {

// A saved article as returned by the retrieve and add endpoints.
// The API sends most numbers as strings; both forms are accepted.
struct SavedItem {
  std::string item_id;
  std::string given_url;
  std::string resolved_url;
  std::string given_title;
  std::string resolved_title;
  std::string excerpt;
  bool favorite = false;
  int status = 0;              // 0 unread, 1 archived, 2 pending deletion
  std::int64_t word_count = 0;
  std::int64_t time_added = 0; // Unix seconds, 0 if unknown
  std::vector<std::string> tags;

  // Best title available
  const std::string& title() const;
  // Best url available
  const std::string& url() const;

  static Result<SavedItem> fromJson(const nlohmann::json& json);
};

// Response of /v3/get
struct RetrieveResult {
  int status = 0;
  int complete = 0;
  std::optional<std::int64_t> since;
  std::vector<SavedItem> items;  // in the order the server sorted them

  static Result<RetrieveResult> fromJson(const nlohmann::json& json);
};

// Response of /v3/add
struct AddResult {
  int status = 0;
  SavedItem item;

  static Result<AddResult> fromJson(const nlohmann::json& json);
};

// Response of /v3/send: one result entry per submitted action, same order
struct SendResult {
  int status = 0;
  std::vector<nlohmann::json> action_results;  // true, false or an item object
  std::vector<nlohmann::json> action_errors;   // empty when the server sent none

  // Indices of actions the server reported as failed
  std::vector<size_t> failedActions() const;

  static Result<SendResult> fromJson(const nlohmann::json& json);
};

}  // namespace readlater::api
