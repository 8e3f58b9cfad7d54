#pragma once

#include <filesystem>
#include <string>

namespace readlater::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/readlater)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/readlater)
  static std::filesystem::path configHome();

  // Get config file path
  static std::filesystem::path configFile();

  // Get default log file path
  static std::filesystem::path logFile();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace readlater::util
