#include <memory>

#include <gtest/gtest.h>

#include "scoreboard/leaderboard_registry.hpp"

namespace {

class RecordingRepository : public scoreboard::LeaderboardRepository {
 public:
  std::vector<scoreboard::Leaderboard> LoadAll() const override { return stored; }
  void Insert(const scoreboard::Leaderboard& leaderboard) override { stored.push_back(leaderboard); }
  void Update(const scoreboard::Leaderboard& leaderboard) override {
    ++updates;
    for (auto& lb : stored) {
      if (lb.id == leaderboard.id) {
        lb = leaderboard;
      }
    }
  }

  std::vector<scoreboard::Leaderboard> stored;
  int updates{0};
};

}  // namespace

TEST(LeaderboardRegistryTest, ProvisionAndAuthenticate) {
  scoreboard::LeaderboardRegistry registry;
  auto lb = registry.Provision("arcade", scoreboard::Ordering::kHigherIsBetter, scoreboard::UpdatePolicy::kKeepBest);
  EXPECT_EQ(lb.id.size(), 36u);
  EXPECT_NE(lb.id, lb.secret);

  auto resolved = registry.Resolve(lb.id);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(resolved->name, "arcade");
  EXPECT_TRUE(registry.Authenticate(lb.id, lb.secret));
  EXPECT_FALSE(registry.Authenticate(lb.id, "wrong"));
  EXPECT_FALSE(registry.Authenticate("unknown", lb.secret));
  EXPECT_FALSE(registry.Resolve("unknown").has_value());
}

TEST(LeaderboardRegistryTest, RotateKeyInvalidatesOldSecret) {
  scoreboard::LeaderboardRegistry registry;
  auto lb = registry.Provision("arcade", scoreboard::Ordering::kHigherIsBetter, scoreboard::UpdatePolicy::kKeepBest);
  auto rotated = registry.RotateKey(lb.id);
  ASSERT_TRUE(rotated.has_value());
  EXPECT_NE(rotated->secret, lb.secret);
  EXPECT_FALSE(registry.Authenticate(lb.id, lb.secret));
  EXPECT_TRUE(registry.Authenticate(lb.id, rotated->secret));
  EXPECT_FALSE(registry.RotateKey("unknown").has_value());
}

TEST(LeaderboardRegistryTest, SoftDeleteHidesAndRestoreReturns) {
  scoreboard::LeaderboardRegistry registry;
  auto lb = registry.Provision("tmp", scoreboard::Ordering::kLowerIsBetter, scoreboard::UpdatePolicy::kKeepAll);
  ASSERT_TRUE(registry.SoftDelete(lb.id).has_value());
  EXPECT_FALSE(registry.Resolve(lb.id).has_value());
  EXPECT_TRUE(registry.ResolveIncludingDeleted(lb.id).has_value());
  EXPECT_FALSE(registry.Authenticate(lb.id, lb.secret));
  EXPECT_TRUE(registry.List(false).empty());
  EXPECT_EQ(registry.List(true).size(), 1u);

  ASSERT_TRUE(registry.Restore(lb.id).has_value());
  EXPECT_TRUE(registry.Resolve(lb.id).has_value());
}

TEST(LeaderboardRegistryTest, PersistsThroughRepository) {
  auto repository = std::make_shared<RecordingRepository>();
  scoreboard::LeaderboardRegistry registry(repository);
  auto lb = registry.Provision("persisted", scoreboard::Ordering::kHigherIsBetter,
                               scoreboard::UpdatePolicy::kKeepLatest);
  ASSERT_EQ(repository->stored.size(), 1u);
  registry.Rename(lb.id, "renamed");
  EXPECT_EQ(repository->updates, 1);
  EXPECT_EQ(repository->stored[0].name, "renamed");

  scoreboard::LeaderboardRegistry reloaded(repository);
  EXPECT_EQ(reloaded.Load(), 1u);
  auto found = reloaded.Resolve(lb.id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->name, "renamed");
  EXPECT_EQ(found->update_policy, scoreboard::UpdatePolicy::kKeepLatest);
}

TEST(LeaderboardRegistryTest, RegisterRejectsDuplicateId) {
  scoreboard::LeaderboardRegistry registry;
  scoreboard::Leaderboard lb;
  lb.id = "fixed-id";
  lb.secret = "fixed-secret";
  EXPECT_TRUE(registry.Register(lb));
  EXPECT_FALSE(registry.Register(lb));
  EXPECT_EQ(registry.Size(), 1u);
}
