#pragma once

#include <array>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "readlater/api/credentials.hpp"
#include "readlater/core/action.hpp"

namespace readlater::api {

// Builds the JSON payloads of the three endpoints. Credentials are merged
// last so a caller option can never replace them.
class RequestAssembler {
 public:
  // Fields the add endpoint accepts; everything else is dropped
  static constexpr std::array<std::string_view, 4> kAddAllowList = {
      "url", "tags", "title", "tweet_id"};

  // Options are copied verbatim
  static nlohmann::json retrieve(const Credentials& credentials,
                                 const nlohmann::json& options);

  // Options are filtered by kAddAllowList and "tags" is normalized
  static nlohmann::json add(const Credentials& credentials,
                            const nlohmann::json& options);

  // {"actions": [...]} from an already stamped snapshot
  static nlohmann::json send(const Credentials& credentials,
                             const std::vector<core::Action>& actions);

 private:
  static void addCredentials(nlohmann::json& payload, const Credentials& credentials);
};

}  // namespace readlater::api
