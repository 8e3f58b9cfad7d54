#include <gtest/gtest.h>

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "readlater/util/logging.hpp"

namespace readlater::util {

TEST(LoggingTest, ConsoleLoggingWritesToStderrOnly) {
  initializeConsoleLogging();

  auto logger = spdlog::default_logger();
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->name(), "readlater");
  ASSERT_EQ(logger->sinks().size(), 1u);
  EXPECT_NE(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(logger->sinks()[0]),
            nullptr);
}

TEST(LoggingTest, ConsoleLoggingIsIdempotent) {
  initializeConsoleLogging();
  auto first = spdlog::default_logger();
  initializeConsoleLogging();
  EXPECT_EQ(spdlog::default_logger(), first);
}

}  // namespace readlater::util
