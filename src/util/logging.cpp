#include "readlater/util/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "readlater/util/xdg.hpp"

namespace readlater::util {

namespace {

class LoggerSetup {
public:
  static LoggerSetup& instance() {
    static LoggerSetup instance_;
    return instance_;
  }

  // stderr only, replaced by initialize()
  void initializeConsole() {
    if (initialized_ || console_installed_) {
      return;
    }
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("readlater", console_sink);
    logger->set_pattern("[%l] %v");
    spdlog::set_default_logger(logger);
    console_installed_ = true;
  }

  void initialize(const std::string& level, const std::filesystem::path& log_file) {
    if (initialized_) {
      setLogLevel(level);
      return;
    }

    auto path = log_file.empty() ? Xdg::logFile() : log_file;

    try {
      std::filesystem::create_directories(path.parent_path());

      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path.string(), 1024 * 1024 * 5, 3); // 5MB files, 3 backups

      // Console shows errors only, warnings go to the file
      auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_level(spdlog::level::err);

      std::vector<spdlog::sink_ptr> sinks = {file_sink, console_sink};
      auto logger = std::make_shared<spdlog::logger>("readlater", sinks.begin(), sinks.end());
      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");

      spdlog::set_default_logger(logger);

    } catch (const std::exception& e) {
      // Fallback to console-only logging if file setup fails
      initializeConsole();
      spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      spdlog::warn("Failed to setup file logging: {}", e.what());
    }

    initialized_ = true;
    setLogLevel(level);
  }

private:
  bool initialized_ = false;
  bool console_installed_ = false;
};

}  // namespace

void initializeConsoleLogging() {
  LoggerSetup::instance().initializeConsole();
}

void initializeLogging(const std::string& level, const std::filesystem::path& log_file) {
  LoggerSetup::instance().initialize(level, log_file);
}

void setLogLevel(const std::string& level) {
  auto parsed = spdlog::level::from_str(level);
  spdlog::set_level(parsed);
}

}  // namespace readlater::util
