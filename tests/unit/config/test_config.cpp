#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "readlater/config/config.hpp"
#include "test_helpers.hpp"

using namespace readlater;
using namespace readlater::config;
using readlater::test::TempDirTest;

class ConfigTest : public TempDirTest {
 protected:
  void TearDown() override {
    unsetenv("READLATER_TEST_TOKEN");
    TempDirTest::TearDown();
  }
};

TEST_F(ConfigTest, LoadsAllKeys) {
  auto path = writeFile("config.toml", R"(
consumer_key = "1234-abcd"
access_token = "5678-efgh"
site = "http://localhost:9000"
timeout_seconds = 15

[logging]
level = "debug"
file = "/tmp/readlater.log"
)");

  auto config = Config::fromFile(path);
  ASSERT_OK(config);
  EXPECT_EQ(config->consumer_key, "1234-abcd");
  EXPECT_EQ(config->access_token, "5678-efgh");
  EXPECT_EQ(config->site, "http://localhost:9000");
  EXPECT_EQ(config->timeout_seconds, 15);
  EXPECT_EQ(config->logging.level, "debug");
  EXPECT_EQ(config->logging.file, "/tmp/readlater.log");
  EXPECT_EQ(config->path(), path);
}

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
  auto path = writeFile("config.toml", "consumer_key = \"ck\"\n");

  auto config = Config::fromFile(path);
  ASSERT_OK(config);
  EXPECT_EQ(config->site, "https://getpocket.com");
  EXPECT_EQ(config->timeout_seconds, 60);
  EXPECT_EQ(config->logging.level, "warn");
  EXPECT_TRUE(config->access_token.empty());
}

TEST_F(ConfigTest, MissingFileIsError) {
  EXPECT_ERROR(Config::fromFile(temp_dir_ / "absent.toml"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, InvalidTomlIsError) {
  auto path = writeFile("broken.toml", "consumer_key = \n[[[");
  EXPECT_ERROR(Config::fromFile(path), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, GetAndSet) {
  auto path = writeFile("config.toml", "");
  auto config = Config::fromFile(path);
  ASSERT_OK(config);

  ASSERT_OK(config->set("consumer_key", "ck"));
  ASSERT_OK(config->set("logging.level", "info"));
  ASSERT_OK(config->set("timeout_seconds", "30"));

  auto key = config->get("consumer_key");
  ASSERT_OK(key);
  EXPECT_EQ(*key, "ck");

  auto level = config->get("logging.level");
  ASSERT_OK(level);
  EXPECT_EQ(*level, "info");

  auto timeout = config->get("timeout_seconds");
  ASSERT_OK(timeout);
  EXPECT_EQ(*timeout, "30");
}

TEST_F(ConfigTest, UnknownKeyAndBadNumber) {
  auto path = writeFile("config.toml", "");
  auto config = Config::fromFile(path);
  ASSERT_OK(config);

  EXPECT_ERROR(config->get("nonexistent"), ErrorCode::kConfigError);
  EXPECT_ERROR(config->set("logging.color", "red"), ErrorCode::kConfigError);
  EXPECT_ERROR(config->set("timeout_seconds", "soon"), ErrorCode::kValidationError);
}

TEST_F(ConfigTest, SaveAndReload) {
  auto path = temp_dir_ / "nested" / "config.toml";
  auto original = Config::fromFile(writeFile("seed.toml", ""));
  ASSERT_OK(original);

  original->consumer_key = "ck";
  original->access_token = "env:READLATER_TEST_TOKEN";
  original->timeout_seconds = 5;
  original->logging.level = "error";
  ASSERT_OK(original->save(path));

  auto reloaded = Config::fromFile(path);
  ASSERT_OK(reloaded);
  EXPECT_EQ(reloaded->consumer_key, "ck");
  EXPECT_EQ(reloaded->access_token, "env:READLATER_TEST_TOKEN");
  EXPECT_EQ(reloaded->timeout_seconds, 5);
  EXPECT_EQ(reloaded->logging.level, "error");
}

TEST_F(ConfigTest, CredentialsResolveEnvironment) {
  setenv("READLATER_TEST_TOKEN", "from-env", 1);
  auto path = writeFile("config.toml",
                        "consumer_key = \"ck\"\naccess_token = \"env:READLATER_TEST_TOKEN\"\n");

  auto config = Config::fromFile(path);
  ASSERT_OK(config);

  auto credentials = config->credentials();
  ASSERT_OK(credentials);
  EXPECT_EQ(credentials->consumerKey(), "ck");
  EXPECT_EQ(credentials->accessToken(), "from-env");
}

TEST_F(ConfigTest, ValidateRejectsIncompleteConfig) {
  auto path = writeFile("config.toml", "consumer_key = \"ck\"\naccess_token = \"env:READLATER_TEST_TOKEN\"\n");
  auto config = Config::fromFile(path);
  ASSERT_OK(config);

  // Environment variable not set
  EXPECT_ERROR(config->validate(), ErrorCode::kConfigError);
  EXPECT_ERROR(config->credentials(), ErrorCode::kConfigError);

  config->access_token = "at";
  EXPECT_OK(config->validate());

  config->site = "ftp://example.com";
  EXPECT_ERROR(config->validate(), ErrorCode::kConfigError);

  config->site = "https://example.com";
  config->timeout_seconds = 0;
  EXPECT_ERROR(config->validate(), ErrorCode::kConfigError);
}
