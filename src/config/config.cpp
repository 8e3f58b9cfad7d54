#include "readlater/config/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "readlater/util/xdg.hpp"

namespace readlater::config {

Config::Config() {
  // Try to load from default location
  auto default_path = defaultConfigPath();
  if (std::filesystem::exists(default_path)) {
    auto result = load(default_path);
    if (!result.has_value()) {
      // Continue with defaults
      spdlog::warn("Ignoring config file: {}", result.error().message());
    }
  }
}

Result<Config> Config::fromFile(const std::filesystem::path& config_path) {
  Config config{DefaultsOnly{}};
  auto result = config.load(config_path);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  return config;
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["consumer_key"].value<std::string>()) {
      consumer_key = *value;
    }
    if (auto value = config_data["access_token"].value<std::string>()) {
      access_token = *value;
    }
    if (auto value = config_data["site"].value<std::string>()) {
      site = *value;
    }
    if (auto value = config_data["timeout_seconds"].value<int64_t>()) {
      timeout_seconds = static_cast<int>(*value);
    }

    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        logging.level = *value;
      }
      if (auto value = (*logging_table)["file"].value<std::string>()) {
        logging.file = *value;
      }
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  try {
    toml::table config_data;

    if (!consumer_key.empty()) config_data.insert_or_assign("consumer_key", consumer_key);
    if (!access_token.empty()) config_data.insert_or_assign("access_token", access_token);
    config_data.insert_or_assign("site", site);
    config_data.insert_or_assign("timeout_seconds", timeout_seconds);

    auto logging_table = toml::table{};
    logging_table.insert_or_assign("level", logging.level);
    if (!logging.file.empty()) logging_table.insert_or_assign("file", logging.file);
    config_data.insert_or_assign("logging", std::move(logging_table));

    if (save_path.has_parent_path()) {
      std::filesystem::create_directories(save_path.parent_path());
    }

    std::ofstream out(save_path);
    if (!out) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Cannot write config file: " + save_path.string()));
    }
    out << config_data << "\n";

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config save error: " + std::string(e.what())));
  }
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    const std::string& name = path[0];
    if (name == "consumer_key") return consumer_key;
    if (name == "access_token") return access_token;
    if (name == "site") return site;
    if (name == "timeout_seconds") return std::to_string(timeout_seconds);
  } else if (path.size() == 2 && path[0] == "logging") {
    if (path[1] == "level") return logging.level;
    if (path[1] == "file") return logging.file;
  }

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    const std::string& name = path[0];
    if (name == "consumer_key") { consumer_key = value; return {}; }
    if (name == "access_token") { access_token = value; return {}; }
    if (name == "site") { site = value; return {}; }
    if (name == "timeout_seconds") {
      try {
        timeout_seconds = std::stoi(value);
      } catch (const std::exception&) {
        return std::unexpected(makeError(ErrorCode::kValidationError,
                                         "timeout_seconds must be a number: " + value));
      }
      return {};
    }
  } else if (path.size() == 2 && path[0] == "logging") {
    if (path[1] == "level") { logging.level = value; return {}; }
    if (path[1] == "file") { logging.file = value; return {}; }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

Result<void> Config::validate() const {
  if (resolveEnvVar(consumer_key).empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "consumer_key not configured"));
  }

  if (resolveEnvVar(access_token).empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "access_token not configured"));
  }

  if (site.rfind("http://", 0) != 0 && site.rfind("https://", 0) != 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Invalid site: " + site));
  }

  if (timeout_seconds <= 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Invalid timeout_seconds value"));
  }

  return {};
}

Result<api::Credentials> Config::credentials() const {
  auto valid = validate();
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }
  return api::Credentials(resolveEnvVar(consumer_key), resolveEnvVar(access_token), site);
}

std::filesystem::path Config::defaultConfigPath() {
  return readlater::util::Xdg::configFile();
}

std::string Config::resolveEnvVar(const std::string& value) const {
  if (value.substr(0, 4) == "env:") {
    std::string var_name = value.substr(4);
    const char* env_value = std::getenv(var_name.c_str());
    return env_value ? std::string(env_value) : "";
  }
  return value;
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  return parts;
}

}  // namespace readlater::config
