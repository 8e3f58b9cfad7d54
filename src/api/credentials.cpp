#include "readlater/api/credentials.hpp"

namespace readlater::api {

Credentials::Credentials(std::string consumer_key, std::string access_token, std::string site)
    : consumer_key_(std::move(consumer_key)),
      access_token_(std::move(access_token)),
      site_(std::move(site)) {
  while (!site_.empty() && site_.back() == '/') {
    site_.pop_back();
  }
}

Result<Credentials> Credentials::fromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return makeErrorResult<Credentials>(ErrorCode::kConfigError,
                                        "Credentials must be an object");
  }

  auto readString = [&json](const char* key) -> std::string {
    auto it = json.find(key);
    if (it == json.end() || !it->is_string()) {
      return {};
    }
    return it->get<std::string>();
  };

  std::string consumer_key = readString("consumer_key");
  std::string access_token = readString("access_token");
  if (consumer_key.empty() || access_token.empty()) {
    return makeErrorResult<Credentials>(ErrorCode::kConfigError,
                                        "Credentials require consumer_key and access_token");
  }

  std::string site = readString("site");
  if (site.empty()) {
    site = kDefaultSite;
  }

  return Credentials(std::move(consumer_key), std::move(access_token), std::move(site));
}

std::string Credentials::endpoint(const std::string& path) const {
  return site_ + path;
}

}  // namespace readlater::api
