#pragma once

#include <filesystem>
#include <string>

namespace readlater::util {

// Send the default spdlog logger to stderr until initializeLogging() runs.
// Keeps stdout free for command output.
void initializeConsoleLogging();

// Install the default spdlog logger: a rotating file sink at `level` and a
// stderr sink at error. An empty path uses Xdg::logFile(). Falls back to
// console-only logging when the file cannot be opened. Idempotent.
void initializeLogging(const std::string& level, const std::filesystem::path& log_file = {});

// Change the level of the default logger
void setLogLevel(const std::string& level);

}  // namespace readlater::util
