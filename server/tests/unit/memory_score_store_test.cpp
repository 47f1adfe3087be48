#include <gtest/gtest.h>

#include "scoreboard/memory_score_store.hpp"
#include "scoreboard/storage_error.hpp"

namespace {

scoreboard::Leaderboard MakeLeaderboard(scoreboard::UpdatePolicy policy,
                                        scoreboard::Ordering ordering = scoreboard::Ordering::kHigherIsBetter) {
  scoreboard::Leaderboard lb;
  lb.id = "lb-store";
  lb.secret = "secret";
  lb.name = "store";
  lb.ordering = ordering;
  lb.update_policy = policy;
  return lb;
}

scoreboard::PutRequest Request(const std::string& player, double value, std::int64_t ts_ms,
                               const std::string& name = "") {
  scoreboard::PutRequest request;
  request.player_id = player;
  request.display_name = name;
  request.value = value;
  request.timestamp_ms = ts_ms;
  return request;
}

}  // namespace

TEST(MemoryScoreStoreTest, KeepBestRetainsBestScore) {
  scoreboard::MemoryScoreStore store;
  auto lb = MakeLeaderboard(scoreboard::UpdatePolicy::kKeepBest);

  auto first = store.Put(lb, Request("alice", 100, 1000, "Alice"));
  EXPECT_TRUE(first.changed);
  EXPECT_FALSE(first.previous.has_value());

  auto worse = store.Put(lb, Request("alice", 90, 2000));
  EXPECT_FALSE(worse.changed);
  EXPECT_DOUBLE_EQ(worse.current.value, 100);
  ASSERT_TRUE(worse.previous.has_value());
  EXPECT_DOUBLE_EQ(worse.previous->value, 100);
  EXPECT_EQ(worse.display_name, "Alice");

  auto better = store.Put(lb, Request("alice", 130, 3000));
  EXPECT_TRUE(better.changed);
  EXPECT_DOUBLE_EQ(store.GetCurrent(lb.id, "alice")->value, 130);
  EXPECT_EQ(store.History(lb.id, "alice").size(), 1u);
}

TEST(MemoryScoreStoreTest, KeepAllKeepsHistoryAndBestAsCurrent) {
  scoreboard::MemoryScoreStore store;
  auto lb = MakeLeaderboard(scoreboard::UpdatePolicy::kKeepAll, scoreboard::Ordering::kLowerIsBetter);
  store.Put(lb, Request("runner", 31.5, 1000));
  store.Put(lb, Request("runner", 29.0, 2000));
  store.Put(lb, Request("runner", 35.0, 3000));

  auto history = store.History(lb.id, "runner");
  ASSERT_EQ(history.size(), 3u);
  EXPECT_LT(history[0].sequence, history[1].sequence);
  EXPECT_LT(history[1].sequence, history[2].sequence);
  EXPECT_DOUBLE_EQ(store.GetCurrent(lb.id, "runner")->value, 29.0);
}

TEST(MemoryScoreStoreTest, DisplayNameDefaultsToPlayerAndUpdatesWhenGiven) {
  scoreboard::MemoryScoreStore store;
  auto lb = MakeLeaderboard(scoreboard::UpdatePolicy::kKeepLatest);
  store.Put(lb, Request("p1", 1, 1));
  EXPECT_EQ(store.DisplayName(lb.id, "p1"), "p1");
  store.Put(lb, Request("p1", 2, 2, "Renamed"));
  EXPECT_EQ(store.DisplayName(lb.id, "p1"), "Renamed");
  EXPECT_FALSE(store.DisplayName(lb.id, "nobody").has_value());
}

TEST(MemoryScoreStoreTest, CurrentEntriesScopedToLeaderboard) {
  scoreboard::MemoryScoreStore store;
  auto lb = MakeLeaderboard(scoreboard::UpdatePolicy::kKeepBest);
  auto other = lb;
  other.id = "lb-other";
  store.Put(lb, Request("a", 1, 1));
  store.Put(lb, Request("b", 2, 1));
  store.Put(other, Request("c", 3, 1));
  EXPECT_EQ(store.CurrentEntries(lb.id).size(), 2u);
  EXPECT_EQ(store.CurrentEntries(other.id).size(), 1u);
  EXPECT_TRUE(store.CurrentEntries("lb-none").empty());
}

TEST(MemoryScoreStoreTest, InjectedFailureLeavesStateUnchanged) {
  scoreboard::MemoryScoreStore store;
  auto lb = MakeLeaderboard(scoreboard::UpdatePolicy::kKeepLatest);
  store.Put(lb, Request("alice", 10, 1));
  store.SetTransientInjector([](std::size_t) { return true; });
  EXPECT_THROW(store.Put(lb, Request("alice", 20, 2)), scoreboard::StorageUnavailable);
  EXPECT_DOUBLE_EQ(store.GetCurrent(lb.id, "alice")->value, 10);
  EXPECT_EQ(store.PutCalls(), 2u);
}
