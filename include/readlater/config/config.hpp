#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "readlater/common.hpp"
#include "readlater/api/credentials.hpp"

namespace readlater::config {

// Configuration for the readlater client
class Config {
 public:
  // Default constructor loads from default config file
  Config();

  // Defaults plus the given file only; errors are reported instead of ignored
  static Result<Config> fromFile(const std::filesystem::path& config_path);

  // API access. Values of the form "env:NAME" are read from the environment.
  std::string consumer_key;
  std::string access_token;
  std::string site = api::Credentials::kDefaultSite;
  int timeout_seconds = 60;

  struct LoggingConfig {
    std::string level = "warn";   // trace, debug, info, warn, error, critical, off
    std::string file;             // empty: Xdg::logFile()
  };
  LoggingConfig logging;

  Result<void> load(const std::filesystem::path& config_path);

  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Dotted keys: "site", "logging.level", ...
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  Result<void> validate() const;

  // Credentials with env: references resolved
  Result<api::Credentials> credentials() const;

  // Path the configuration was loaded from, if any
  const std::filesystem::path& path() const noexcept { return config_path_; }

  static std::filesystem::path defaultConfigPath();

 private:
  struct DefaultsOnly {};
  explicit Config(DefaultsOnly) {}

  std::filesystem::path config_path_;

  std::string resolveEnvVar(const std::string& value) const;
  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace readlater::config
