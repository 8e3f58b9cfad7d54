#include <gtest/gtest.h>

#include "readlater/api/credentials.hpp"
#include "test_helpers.hpp"

using namespace readlater::api;
using readlater::ErrorCode;

class CredentialsTest : public ::testing::Test {};

TEST_F(CredentialsTest, DefaultSite) {
  Credentials credentials("ck", "at");

  EXPECT_EQ(credentials.consumerKey(), "ck");
  EXPECT_EQ(credentials.accessToken(), "at");
  EXPECT_EQ(credentials.endpoint("/v3/get"), "https://getpocket.com/v3/get");
}

TEST_F(CredentialsTest, TrailingSlashIsStripped) {
  Credentials credentials("ck", "at", "http://localhost:8080/");
  EXPECT_EQ(credentials.endpoint("/v3/send"), "http://localhost:8080/v3/send");
}

TEST_F(CredentialsTest, FromJson) {
  auto result = Credentials::fromJson({{"consumer_key", "ck"}, {"access_token", "at"}});

  ASSERT_OK(result);
  EXPECT_EQ(result->consumerKey(), "ck");
  EXPECT_EQ(result->site(), Credentials::kDefaultSite);
}

TEST_F(CredentialsTest, FromJsonRequiresBothKeys) {
  EXPECT_ERROR(Credentials::fromJson({{"consumer_key", "ck"}}), ErrorCode::kConfigError);
  EXPECT_ERROR(Credentials::fromJson(nlohmann::json::array()), ErrorCode::kConfigError);
}
