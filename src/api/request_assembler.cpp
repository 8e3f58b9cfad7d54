#include "readlater/api/request_assembler.hpp"

#include <algorithm>

#include "readlater/core/tags.hpp"

namespace readlater::api {

nlohmann::json RequestAssembler::retrieve(const Credentials& credentials,
                                          const nlohmann::json& options) {
  nlohmann::json payload = options.is_object() ? options : nlohmann::json::object();
  addCredentials(payload, credentials);
  return payload;
}

nlohmann::json RequestAssembler::add(const Credentials& credentials,
                                     const nlohmann::json& options) {
  nlohmann::json payload = nlohmann::json::object();

  if (options.is_object()) {
    for (const auto& [key, value] : options.items()) {
      bool allowed = std::find(kAddAllowList.begin(), kAddAllowList.end(), key) !=
                     kAddAllowList.end();
      if (!allowed) {
        continue;
      }
      if (key == core::fields::kTags) {
        payload[key] = core::normalizeTags(value);
      } else {
        payload[key] = value;
      }
    }
  }

  addCredentials(payload, credentials);
  return payload;
}

nlohmann::json RequestAssembler::send(const Credentials& credentials,
                                      const std::vector<core::Action>& actions) {
  nlohmann::json action_list = nlohmann::json::array();
  for (const auto& action : actions) {
    action_list.push_back(action.toJson());
  }

  nlohmann::json payload = nlohmann::json::object();
  payload["actions"] = std::move(action_list);
  addCredentials(payload, credentials);
  return payload;
}

void RequestAssembler::addCredentials(nlohmann::json& payload, const Credentials& credentials) {
  payload["consumer_key"] = credentials.consumerKey();
  payload["access_token"] = credentials.accessToken();
}

}  // namespace readlater::api
