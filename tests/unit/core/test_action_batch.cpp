#include <gtest/gtest.h>

#include <chrono>

#include "readlater/core/action_batch.hpp"
#include "test_helpers.hpp"

using namespace readlater::core;

class ActionBatchTest : public ::testing::Test {
 protected:
  static std::chrono::system_clock::time_point at(std::int64_t seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
  }
};

TEST_F(ActionBatchTest, NewBatchIsEmpty) {
  ActionBatch batch;
  EXPECT_TRUE(batch.empty());
  EXPECT_EQ(batch.size(), 0u);
}

TEST_F(ActionBatchTest, ChainedCallsKeepOrder) {
  auto batch = ActionBatch().favorite({"1234", "2345"}).unfavorite("9876");

  ASSERT_EQ(batch.size(), 3u);
  const auto& list = batch.actions();
  EXPECT_EQ(list[0].action(), "favorite");
  EXPECT_EQ(list[0].itemId(), "1234");
  EXPECT_EQ(list[1].action(), "favorite");
  EXPECT_EQ(list[1].itemId(), "2345");
  EXPECT_EQ(list[2].action(), "unfavorite");
  EXPECT_EQ(list[2].itemId(), "9876");
}

TEST_F(ActionBatchTest, EarlierBatchIsNotModified) {
  auto first = ActionBatch().archive("1");
  auto second = first.archive("2");
  auto branch = first.remove("3");

  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first.actions()[0].itemId(), "1");

  ASSERT_EQ(second.size(), 2u);
  EXPECT_EQ(second.actions()[1].action(), "archive");

  ASSERT_EQ(branch.size(), 2u);
  EXPECT_EQ(branch.actions()[1].action(), "delete");
}

TEST_F(ActionBatchTest, EmptyIdListLeavesBatchUnchanged) {
  auto batch = ActionBatch().readd("1").archive(std::vector<std::string>{});
  EXPECT_EQ(batch.size(), 1u);
}

TEST_F(ActionBatchTest, TagOperations) {
  auto batch = ActionBatch()
                   .tagsAdd({"1", "2"}, std::vector<std::string>{"a", "b"})
                   .tagsRemove("3", std::string("c"))
                   .tagsReplace("4", std::string("d"))
                   .tagsClear("5")
                   .renameTag("6", "old", "new")
                   .deleteTag("7", "gone");

  ASSERT_EQ(batch.size(), 7u);
  const auto& list = batch.actions();
  EXPECT_EQ(list[0].field("tags"), "a, b");
  EXPECT_EQ(list[1].field("tags"), "a, b");
  EXPECT_EQ(list[2].action(), "tags_remove");
  EXPECT_EQ(list[3].action(), "tags_replace");
  EXPECT_EQ(list[4].action(), "tags_clear");
  EXPECT_EQ(list[5].action(), "tag_rename");
  EXPECT_EQ(list[6].action(), "tag_delete");
}

TEST_F(ActionBatchTest, BracedTagListsOnEveryId) {
  auto batch = ActionBatch()
                   .tagsAdd({"1", "2"}, {"a", "b"})
                   .tagsRemove("3", {"c"})
                   .tagsReplace({"4"}, {"d", "e"});

  ASSERT_EQ(batch.size(), 4u);
  const auto& list = batch.actions();
  EXPECT_EQ(list[0].itemId(), "1");
  EXPECT_EQ(list[0].field("tags"), "a, b");
  EXPECT_EQ(list[1].itemId(), "2");
  EXPECT_EQ(list[1].field("tags"), "a, b");
  EXPECT_EQ(list[2].field("tags"), "c");
  EXPECT_EQ(list[3].action(), "tags_replace");
  EXPECT_EQ(list[3].field("tags"), "d, e");
}

TEST_F(ActionBatchTest, FromMapsPreservesOrder) {
  auto batch = ActionBatch::fromMaps({{{"action", "archive"}, {"item_id", "1"}},
                                      {{"action", "favorite"}, {"item_id", "2"}}});

  ASSERT_EQ(batch.size(), 2u);
  EXPECT_EQ(batch.actions()[0].action(), "archive");
  EXPECT_EQ(batch.actions()[1].action(), "favorite");
}

TEST_F(ActionBatchTest, StampedSetsOneTimestampOnEveryAction) {
  auto batch = ActionBatch().archive({"1", "2", "3"});
  auto snapshot = batch.stamped(at(1700000000));

  ASSERT_EQ(snapshot.size(), 3u);
  for (const auto& action : snapshot) {
    EXPECT_EQ(action.field("timestamp"), "1700000000");
  }

  // The batch itself does not carry timestamps
  for (const auto& action : batch.actions()) {
    EXPECT_FALSE(action.field("timestamp").has_value());
  }
}

TEST_F(ActionBatchTest, StampedOverwritesCallerTimestamp) {
  auto batch = ActionBatch::fromMaps({{{"action", "archive"}, {"item_id", "1"}, {"timestamp", "5"}}});
  auto snapshot = batch.stamped(at(100));

  ASSERT_EQ(snapshot.size(), 1u);
  EXPECT_EQ(snapshot[0].field("timestamp"), "100");
}

TEST_F(ActionBatchTest, FromJsonSingleObject) {
  auto batch = ActionBatch::fromJson({{"action", "archive"}, {"item_id", 1234}, {"time", nullptr}});

  ASSERT_OK(batch);
  ASSERT_EQ(batch->size(), 1u);
  EXPECT_EQ(batch->actions()[0].action(), "archive");
  EXPECT_EQ(batch->actions()[0].itemId(), "1234");
  EXPECT_FALSE(batch->actions()[0].field("time").has_value());
}

TEST_F(ActionBatchTest, FromJsonArray) {
  auto json = nlohmann::json::parse(R"([
    {"action": "favorite", "item_id": "1"},
    {"action": "tags_add", "item_id": "2", "tags": "a, b"}
  ])");

  auto batch = ActionBatch::fromJson(json);
  ASSERT_OK(batch);
  ASSERT_EQ(batch->size(), 2u);
  EXPECT_EQ(batch->actions()[1].field("tags"), "a, b");
}

TEST_F(ActionBatchTest, FromJsonRejectsOtherShapes) {
  EXPECT_ERROR(ActionBatch::fromJson(nlohmann::json("archive")), readlater::ErrorCode::kInvalidArgument);
  EXPECT_ERROR(ActionBatch::fromJson(nlohmann::json::array({1, 2})),
               readlater::ErrorCode::kInvalidArgument);
}
