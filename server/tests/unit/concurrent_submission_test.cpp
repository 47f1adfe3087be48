#include <algorithm>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "scoreboard/memory_score_store.hpp"
#include "scoreboard/submission_gateway.hpp"

namespace {

using namespace scoreboard;

struct Harness {
  Harness() {
    store = std::make_shared<MemoryScoreStore>();
    registry = std::make_shared<LeaderboardRegistry>();
    engine = std::make_shared<RankingEngine>(store, nullptr);
    gateway = std::make_shared<SubmissionGateway>(registry, nullptr, store, engine, nullptr, RetryPolicy{});
  }

  ScoreSubmission Make(const Leaderboard& lb, const std::string& player, double value) const {
    ScoreSubmission submission;
    submission.leaderboard_id = lb.id;
    submission.key = lb.secret;
    submission.player_id = player;
    submission.value = value;
    return submission;
  }

  std::shared_ptr<MemoryScoreStore> store;
  std::shared_ptr<LeaderboardRegistry> registry;
  std::shared_ptr<RankingEngine> engine;
  std::shared_ptr<SubmissionGateway> gateway;
};

}  // namespace

TEST(ConcurrentSubmissionTest, DistinctPlayersRankedByValue) {
  Harness h;
  auto lb = h.registry->Provision("concurrent", Ordering::kHigherIsBetter, UpdatePolicy::kKeepBest);
  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;
  std::atomic<int> acknowledged{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        int n = t * kPerThread + i;
        if (h.gateway->Submit(h.Make(lb, "player-" + std::to_string(n), n)).Acknowledged()) {
          acknowledged.fetch_add(1);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  ASSERT_EQ(acknowledged.load(), kThreads * kPerThread);

  auto top = h.engine->Acquire(lb)->Index().Top(kThreads * kPerThread);
  ASSERT_EQ(top.size(), static_cast<std::size_t>(kThreads * kPerThread));
  for (std::size_t i = 0; i < top.size(); ++i) {
    int expected = kThreads * kPerThread - 1 - static_cast<int>(i);
    EXPECT_EQ(top[i].player_id, "player-" + std::to_string(expected));
    EXPECT_EQ(top[i].rank, i + 1);
  }
  EXPECT_TRUE(h.engine->Verify(lb).Consistent());
}

TEST(ConcurrentSubmissionTest, SamePlayerKeepsBestUnderContention) {
  Harness h;
  auto lb = h.registry->Provision("contention", Ordering::kHigherIsBetter, UpdatePolicy::kKeepBest);
  constexpr int kThreads = 6;
  constexpr int kPerThread = 40;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        // 스레드마다 다른 값 순서로 같은 플레이어들에 제출한다
        double value = static_cast<double>((i * 7 + t * 13) % 97);
        h.gateway->Submit(h.Make(lb, "shared-" + std::to_string(i % 4), value));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (int p = 0; p < 4; ++p) {
    double best = -1;
    for (int t = 0; t < kThreads; ++t) {
      for (int i = p; i < kPerThread; i += 4) {
        best = std::max(best, static_cast<double>((i * 7 + t * 13) % 97));
      }
    }
    std::string player = "shared-" + std::to_string(p);
    auto current = h.store->GetCurrent(lb.id, player);
    ASSERT_TRUE(current.has_value());
    EXPECT_DOUBLE_EQ(current->value, best);
    auto indexed = h.engine->Acquire(lb)->Index().Find(player);
    ASSERT_TRUE(indexed.has_value());
    EXPECT_DOUBLE_EQ(indexed->value, best);
  }
  EXPECT_TRUE(h.engine->Verify(lb).Consistent());
}

TEST(ConcurrentSubmissionTest, ReadersObserveConsistentSnapshots) {
  Harness h;
  auto lb = h.registry->Provision("readers", Ordering::kHigherIsBetter, UpdatePolicy::kKeepLatest);
  std::atomic<bool> done{false};
  std::atomic<int> bad_snapshots{0};

  std::thread reader([&]() {
    while (!done.load()) {
      auto top = h.engine->Acquire(lb)->Index().Top(50);
      for (std::size_t i = 0; i < top.size(); ++i) {
        if (top[i].rank != i + 1 || (i > 0 && top[i - 1].value < top[i].value)) {
          bad_snapshots.fetch_add(1);
        }
      }
    }
  });
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&, t]() {
      for (int i = 0; i < 200; ++i) {
        h.gateway->Submit(h.Make(lb, "w" + std::to_string((t * 200 + i) % 30), (i * 31 + t) % 101));
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }
  done.store(true);
  reader.join();
  EXPECT_EQ(bad_snapshots.load(), 0);
  EXPECT_TRUE(h.engine->Verify(lb).Consistent());
}
