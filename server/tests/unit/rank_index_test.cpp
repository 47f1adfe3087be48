#include <algorithm>
#include <limits>
#include <random>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "scoreboard/rank_index.hpp"

namespace {

scoreboard::IndexRecord Record(const std::string& player, double value, std::int64_t ts_ms) {
  return scoreboard::IndexRecord{player, player, scoreboard::RankKey{value, ts_ms}, std::nullopt};
}

}  // namespace

TEST(RankIndexTest, TopOrdersByValueDescending) {
  scoreboard::RankIndex index(scoreboard::Ordering::kHigherIsBetter);
  EXPECT_EQ(index.InsertOrUpdate(Record("alice", 100, 1), std::nullopt), scoreboard::IndexUpdate::kInserted);
  EXPECT_EQ(index.InsertOrUpdate(Record("bob", 150, 2), std::nullopt), scoreboard::IndexUpdate::kInserted);
  EXPECT_EQ(index.InsertOrUpdate(Record("carol", 120, 3), std::nullopt), scoreboard::IndexUpdate::kInserted);

  auto top = index.Top(2);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].player_id, "bob");
  EXPECT_EQ(top[0].rank, 1u);
  EXPECT_EQ(top[1].player_id, "carol");
  EXPECT_EQ(top[1].rank, 2u);
  EXPECT_EQ(index.RankOf("alice"), 3u);
  EXPECT_FALSE(index.RankOf("nobody").has_value());
}

TEST(RankIndexTest, LowerIsBetterReversesOrder) {
  scoreboard::RankIndex index(scoreboard::Ordering::kLowerIsBetter);
  index.InsertOrUpdate(Record("fast", 10.5, 1), std::nullopt);
  index.InsertOrUpdate(Record("slow", 30.0, 1), std::nullopt);
  index.InsertOrUpdate(Record("mid", 20.0, 1), std::nullopt);
  auto all = index.Snapshot();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].player_id, "fast");
  EXPECT_EQ(all[1].player_id, "mid");
  EXPECT_EQ(all[2].player_id, "slow");
}

TEST(RankIndexTest, TiesGetDistinctConsecutiveRanks) {
  scoreboard::RankIndex index(scoreboard::Ordering::kHigherIsBetter);
  index.InsertOrUpdate(Record("zed", 50, 100), std::nullopt);
  index.InsertOrUpdate(Record("amy", 50, 100), std::nullopt);
  index.InsertOrUpdate(Record("early", 50, 10), std::nullopt);
  EXPECT_EQ(index.RankOf("early"), 1u);
  EXPECT_EQ(index.RankOf("amy"), 2u);
  EXPECT_EQ(index.RankOf("zed"), 3u);
}

TEST(RankIndexTest, UpdateMovesPlayerAndDetectsStaleKey) {
  scoreboard::RankIndex index(scoreboard::Ordering::kHigherIsBetter);
  index.InsertOrUpdate(Record("alice", 100, 1), std::nullopt);
  index.InsertOrUpdate(Record("bob", 150, 2), std::nullopt);

  auto updated = index.InsertOrUpdate(Record("alice", 200, 3), scoreboard::RankKey{100, 1});
  EXPECT_EQ(updated, scoreboard::IndexUpdate::kUpdated);
  EXPECT_EQ(index.RankOf("alice"), 1u);
  EXPECT_EQ(index.Size(), 2u);

  EXPECT_EQ(index.InsertOrUpdate(Record("alice", 200, 3), scoreboard::RankKey{200, 3}),
            scoreboard::IndexUpdate::kUnchanged);

  // 저장소가 기억하는 이전 키와 인덱스가 다르면 불일치로 보고하되 새 키는 반영한다
  auto stale = index.InsertOrUpdate(Record("bob", 10, 4), scoreboard::RankKey{999, 9});
  EXPECT_EQ(stale, scoreboard::IndexUpdate::kInconsistent);
  EXPECT_EQ(index.RankOf("bob"), 2u);

  EXPECT_EQ(index.InsertOrUpdate(Record("carol", 5, 5), scoreboard::RankKey{5, 5}),
            scoreboard::IndexUpdate::kInconsistent);
  EXPECT_EQ(index.Size(), 3u);
}

TEST(RankIndexTest, AroundClipsAtBothEnds) {
  scoreboard::RankIndex index(scoreboard::Ordering::kHigherIsBetter);
  for (int i = 0; i < 10; ++i) {
    index.InsertOrUpdate(Record("p" + std::to_string(i), 100 - i, 1), std::nullopt);
  }
  auto head = index.Around("p0", 2);
  ASSERT_EQ(head.size(), 3u);
  EXPECT_EQ(head.front().rank, 1u);
  EXPECT_EQ(head.back().rank, 3u);

  auto middle = index.Around("p5", 2);
  ASSERT_EQ(middle.size(), 5u);
  EXPECT_EQ(middle.front().rank, 4u);
  EXPECT_EQ(middle[2].player_id, "p5");

  auto tail = index.Around("p9", 3);
  ASSERT_EQ(tail.size(), 4u);
  EXPECT_EQ(tail.back().rank, 10u);

  EXPECT_EQ(index.Around("p4", 0).size(), 1u);
  EXPECT_TRUE(index.Around("missing", 3).empty());
}

TEST(RankIndexTest, RanksFormPermutationMatchingSortedOrder) {
  scoreboard::RankIndex index(scoreboard::Ordering::kHigherIsBetter);
  std::mt19937 gen(7);
  std::uniform_int_distribution<int> score(0, 50);
  std::vector<scoreboard::IndexRecord> latest(300);
  for (int round = 0; round < 3; ++round) {
    for (int i = 0; i < 300; ++i) {
      auto record = Record("player-" + std::to_string(i), score(gen), round * 1000 + i);
      index.InsertOrUpdate(record, std::nullopt);
      latest[static_cast<std::size_t>(i)] = record;
    }
  }
  ASSERT_EQ(index.Size(), 300u);

  std::sort(latest.begin(), latest.end(), [](const auto& a, const auto& b) {
    if (a.key.value != b.key.value) {
      return a.key.value > b.key.value;
    }
    if (a.key.timestamp_ms != b.key.timestamp_ms) {
      return a.key.timestamp_ms < b.key.timestamp_ms;
    }
    return a.player_id < b.player_id;
  });

  std::set<std::size_t> ranks;
  for (std::size_t i = 0; i < latest.size(); ++i) {
    auto rank = index.RankOf(latest[i].player_id);
    ASSERT_TRUE(rank.has_value());
    EXPECT_EQ(*rank, i + 1);
    ranks.insert(*rank);
  }
  EXPECT_EQ(ranks.size(), 300u);

  auto top10 = index.Top(10);
  auto top11 = index.Top(11);
  ASSERT_EQ(top10.size(), 10u);
  for (std::size_t i = 0; i < top10.size(); ++i) {
    EXPECT_EQ(top10[i].player_id, top11[i].player_id);
    EXPECT_EQ(top10[i].player_id, latest[i].player_id);
  }
}

TEST(RankIndexTest, RemoveAndRebuild) {
  scoreboard::RankIndex index(scoreboard::Ordering::kHigherIsBetter);
  index.InsertOrUpdate(Record("a", 3, 1), std::nullopt);
  index.InsertOrUpdate(Record("b", 2, 1), std::nullopt);
  EXPECT_TRUE(index.Remove("a"));
  EXPECT_FALSE(index.Remove("a"));
  EXPECT_EQ(index.RankOf("b"), 1u);

  index.Rebuild({Record("x", 1, 1), Record("y", 9, 1), Record("x", 5, 2)});
  EXPECT_EQ(index.Size(), 2u);
  EXPECT_EQ(index.RankOf("y"), 1u);
  auto x = index.Find("x");
  ASSERT_TRUE(x.has_value());
  EXPECT_DOUBLE_EQ(x->value, 5);
  EXPECT_EQ(x->rank, 2u);
  EXPECT_FALSE(index.Find("b").has_value());

  index.Clear();
  EXPECT_EQ(index.Size(), 0u);
  EXPECT_TRUE(index.Top(5).empty());
}

TEST(RankIndexTest, AroundWithHugeWindowReturnsWholeBoard) {
  scoreboard::RankIndex index(scoreboard::Ordering::kHigherIsBetter);
  for (int i = 0; i < 6; ++i) {
    index.InsertOrUpdate(Record("p" + std::to_string(i), 100 - i, 1), std::nullopt);
  }
  const auto max_window = std::numeric_limits<std::size_t>::max();
  auto all = index.Around("p3", max_window);
  ASSERT_EQ(all.size(), 6u);
  EXPECT_EQ(all.front().rank, 1u);
  EXPECT_EQ(all.back().rank, 6u);
  EXPECT_EQ(index.Around("p5", max_window - 1).size(), 6u);
}

TEST(RankIndexTest, RepeatedMovesAndRemovalsKeepRanksDense) {
  scoreboard::RankIndex index(scoreboard::Ordering::kLowerIsBetter);
  std::mt19937 rng(7);
  std::uniform_int_distribution<int> value(0, 500);
  for (int round = 0; round < 2000; ++round) {
    const std::string player = "p" + std::to_string(round % 40);
    if (round % 7 == 0) {
      index.Remove(player);
    } else {
      index.InsertOrUpdate(Record(player, value(rng), round), std::nullopt);
    }
  }
  auto snapshot = index.Snapshot();
  ASSERT_EQ(snapshot.size(), index.Size());
  for (std::size_t i = 0; i < snapshot.size(); ++i) {
    EXPECT_EQ(snapshot[i].rank, i + 1);
    EXPECT_EQ(index.RankOf(snapshot[i].player_id), i + 1);
    if (i > 0) {
      EXPECT_LE(snapshot[i - 1].value, snapshot[i].value);
    }
  }
  index.Clear();
  index.InsertOrUpdate(Record("after-clear", 1, 1), std::nullopt);
  EXPECT_EQ(index.RankOf("after-clear"), 1u);
}
