#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "readlater/api/client.hpp"
#include "test_helpers.hpp"

using namespace readlater;
using namespace readlater::api;
using readlater::test::MockTransport;
using readlater::test::jsonResponse;
using readlater::test::rawResponse;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SaveArg;

class ClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    transport_ = std::make_shared<MockTransport>();
    client_ = std::make_unique<Client>("ck", "at", transport_);
    client_->setClock([] {
      return std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    });
  }

  // Expect exactly one POST to url and keep the payload it carried
  void expectPost(const std::string& url, util::HttpResponse response) {
    EXPECT_CALL(*transport_, post(url, _, _))
        .WillOnce(DoAll(SaveArg<1>(&sent_body_), SaveArg<2>(&sent_headers_),
                        Return(Result<util::HttpResponse>(std::move(response)))));
  }

  nlohmann::json sentPayload() const { return nlohmann::json::parse(sent_body_); }

  std::shared_ptr<MockTransport> transport_;
  std::unique_ptr<Client> client_;
  std::string sent_body_;
  std::vector<std::string> sent_headers_;
};

TEST_F(ClientTest, RetrievePostsToGetEndpoint) {
  expectPost("https://getpocket.com/v3/get",
             jsonResponse(200, {{"status", 1}, {"list", {{"1", {{"item_id", "1"}}}}}}));

  auto result = client_->retrieve({{"count", 5}});
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->items.size(), 1u);
  EXPECT_EQ(result->items[0].item_id, "1");

  auto payload = sentPayload();
  EXPECT_EQ(payload["count"], 5);
  EXPECT_EQ(payload["consumer_key"], "ck");
  EXPECT_EQ(payload["access_token"], "at");
  EXPECT_THAT(sent_headers_, ::testing::Contains("X-Accept: application/json"));
}

TEST_F(ClientTest, AddFiltersOptions) {
  expectPost("https://getpocket.com/v3/add",
             jsonResponse(200, {{"status", 1}, {"item", {{"item_id", "9"}}}}));

  nlohmann::json options = {{"url", "u"}, {"tags", {"x", "y"}}, {"foo", 1}};
  auto result = client_->add(options);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->item.item_id, "9");

  EXPECT_EQ(sentPayload(), (nlohmann::json{{"url", "u"},
                                           {"tags", "x, y"},
                                           {"consumer_key", "ck"},
                                           {"access_token", "at"}}));
}

TEST_F(ClientTest, SendStampsEveryActionWithOneTimestamp) {
  expectPost("https://getpocket.com/v3/send",
             jsonResponse(200, {{"status", 1}, {"action_results", {true, true, true}}}));

  auto batch = core::ActionBatch().favorite({"1234", "2345"}).unfavorite("9876");
  auto result = client_->send(batch);
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->failedActions().empty());

  auto actions = sentPayload()["actions"];
  ASSERT_EQ(actions.size(), 3u);
  EXPECT_EQ(actions[0]["action"], "favorite");
  EXPECT_EQ(actions[0]["item_id"], "1234");
  EXPECT_EQ(actions[1]["item_id"], "2345");
  EXPECT_EQ(actions[2]["action"], "unfavorite");
  for (const auto& action : actions) {
    EXPECT_EQ(action["timestamp"], "1700000000");
  }

  // Sending does not change the batch
  for (const auto& action : batch.actions()) {
    EXPECT_FALSE(action.field("timestamp").has_value());
  }
}

TEST_F(ClientTest, SendReadsClockOncePerBatch) {
  int calls = 0;
  client_->setClock([&calls] {
    ++calls;
    return std::chrono::system_clock::time_point(std::chrono::seconds(100 + calls));
  });
  expectPost("https://getpocket.com/v3/send",
             jsonResponse(200, {{"status", 1}, {"action_results", {true, true}}}));

  auto result = client_->send(core::ActionBatch().archive({"1", "2"}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(calls, 1);

  auto actions = sentPayload()["actions"];
  EXPECT_EQ(actions[0]["timestamp"], actions[1]["timestamp"]);
}

TEST_F(ClientTest, SendPlainMaps) {
  expectPost("https://getpocket.com/v3/send",
             jsonResponse(200, {{"status", 1}, {"action_results", {true}}}));

  core::ActionMap action = {{"action", "archive"}, {"item_id", "1"}};
  auto result = client_->send(action);
  ASSERT_TRUE(result.has_value());

  auto actions = sentPayload()["actions"];
  ASSERT_EQ(actions.size(), 1u);
  EXPECT_EQ(actions[0]["action"], "archive");
  EXPECT_EQ(actions[0]["timestamp"], "1700000000");
}

TEST_F(ClientTest, ApiErrorIsReported) {
  expectPost("https://getpocket.com/v3/get",
             rawResponse(401, "", {{"X-Error-Code", "107"},
                                   {"X-Error", "Consumer key/access token mismatch."}}));

  auto result = client_->retrieve();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ApiError::Kind::kApi);
  EXPECT_EQ(result.error().status_code, 401);
  EXPECT_EQ(result.error().error_code, "107");
  EXPECT_EQ(result.error().message, "Consumer key/access token mismatch.");
}

TEST_F(ClientTest, TransportErrorIsReported) {
  EXPECT_CALL(*transport_, post(_, _, _))
      .WillOnce(Return(Result<util::HttpResponse>(std::unexpected(
          makeError(ErrorCode::kNetworkError, "HTTP request failed: Timeout was reached")))));

  auto result = client_->send(core::ActionBatch().archive("1"));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ApiError::Kind::kTransport);
  EXPECT_FALSE(result.error().status_code.has_value());
}

TEST_F(ClientTest, OrThrowRaisesApiException) {
  expectPost("https://getpocket.com/v3/send", rawResponse(503, "down"));

  try {
    client_->sendOrThrow(core::ActionBatch().archive("1"));
    FAIL() << "Expected ApiException";
  } catch (const ApiException& e) {
    EXPECT_EQ(e.error().status_code, 503);
    EXPECT_EQ(e.error().error_code, "unknown");
    EXPECT_EQ(e.error().message, "unknown");
    EXPECT_EQ(e.error().body, "down");
  }
}

TEST_F(ClientTest, RetrieveOrThrowRaisesApiException) {
  expectPost("https://getpocket.com/v3/get",
             rawResponse(403, "", {{"X-Error-Code", "158"}, {"X-Error", "invalid consumer key"}}));

  try {
    client_->retrieveOrThrow({{"state", "unread"}});
    FAIL() << "Expected ApiException";
  } catch (const ApiException& e) {
    EXPECT_EQ(e.error().kind, ApiError::Kind::kApi);
    EXPECT_EQ(e.error().status_code, 403);
    EXPECT_EQ(e.error().error_code, "158");
    EXPECT_EQ(e.error().message, "invalid consumer key");
  }
}

TEST_F(ClientTest, RetrieveOrThrowReturnsItems) {
  expectPost("https://getpocket.com/v3/get",
             jsonResponse(200, nlohmann::json::parse(R"({
               "status": 1,
               "list": {
                 "20": {"item_id": "20", "sort_id": 1},
                 "10": {"item_id": "10", "sort_id": 0}
               }
             })")));

  auto result = client_->retrieveOrThrow();
  ASSERT_EQ(result.items.size(), 2u);
  EXPECT_EQ(result.items[0].item_id, "10");
  EXPECT_EQ(result.items[1].item_id, "20");
  EXPECT_EQ(sentPayload()["access_token"], "at");
}

TEST_F(ClientTest, OrThrowReturnsValue) {
  expectPost("https://getpocket.com/v3/add",
             jsonResponse(200, {{"status", 1}, {"item", {{"item_id", "5"}}}}));

  nlohmann::json options = {{"url", "https://example.com"}};
  EXPECT_EQ(client_->addOrThrow(options).item.item_id, "5");
}

TEST_F(ClientTest, CustomSite) {
  client_ = std::make_unique<Client>(Credentials("ck", "at", "http://localhost:9000"), transport_);
  expectPost("http://localhost:9000/v3/get", jsonResponse(200, {{"status", 2}, {"list", nlohmann::json::array()}}));

  auto result = client_->retrieve();
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->items.empty());
}
