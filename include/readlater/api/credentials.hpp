#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "readlater/common.hpp"

namespace readlater::api {

// Authentication for every request plus the site the endpoints live under.
// Immutable once constructed.
class Credentials {
 public:
  static constexpr const char* kDefaultSite = "https://getpocket.com";

  Credentials(std::string consumer_key, std::string access_token,
              std::string site = kDefaultSite);

  // Accept a loose {"consumer_key", "access_token"[, "site"]} map
  static Result<Credentials> fromJson(const nlohmann::json& json);

  const std::string& consumerKey() const noexcept { return consumer_key_; }
  const std::string& accessToken() const noexcept { return access_token_; }
  const std::string& site() const noexcept { return site_; }

  // site + path, e.g. "https://getpocket.com/v3/get"
  std::string endpoint(const std::string& path) const;

 private:
  std::string consumer_key_;
  std::string access_token_;
  std::string site_;
};

}  // namespace readlater::api
