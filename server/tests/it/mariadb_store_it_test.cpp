#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "scoreboard/db_client.hpp"
#include "scoreboard/leaderboard_registry.hpp"
#include "scoreboard/errors.hpp"
#include "scoreboard/mariadb_leaderboard_repository.hpp"
#include "scoreboard/mariadb_player_repository.hpp"
#include "scoreboard/mariadb_score_store.hpp"
#include "scoreboard/ranking_engine.hpp"
#include "scoreboard/storage_error.hpp"
#include "scoreboard/submission_gateway.hpp"

namespace {

scoreboard::DbConfig TestDbConfig() {
  scoreboard::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "app_db";
  return cfg;
}

scoreboard::RetryPolicy FastRetry() {
  scoreboard::RetryPolicy retry;
  retry.max_attempts = 3;
  retry.base_delay = std::chrono::milliseconds(5);
  retry.max_delay = std::chrono::milliseconds(20);
  retry.max_jitter = std::chrono::milliseconds(0);
  return retry;
}

class MariaDbStoreItTest : public ::testing::Test {
 protected:
  void SetUp() override {
    db_client = std::make_shared<scoreboard::MariaDbClient>(TestDbConfig(), FastRetry());
    repository = std::make_shared<scoreboard::MariaDbLeaderboardRepository>(db_client);
    store = std::make_shared<scoreboard::MariaDbScoreStore>(db_client);
    players = std::make_shared<scoreboard::MariaDbPlayerRepository>(db_client);
    repository->EnsureSchema();
    store->EnsureSchema();
    players->EnsureSchema();
    store->ClearAll();
    repository->ClearAll();
    players->ClearAll();
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

  std::shared_ptr<scoreboard::MariaDbClient> db_client;
  std::shared_ptr<scoreboard::MariaDbLeaderboardRepository> repository;
  std::shared_ptr<scoreboard::MariaDbScoreStore> store;
  std::shared_ptr<scoreboard::MariaDbPlayerRepository> players;
};

}  // namespace

TEST_F(MariaDbStoreItTest, KeepBestPersistsSingleCurrentEntry) {
  scoreboard::LeaderboardRegistry registry(repository);
  auto lb = registry.Provision("it-best", scoreboard::Ordering::kHigherIsBetter, scoreboard::UpdatePolicy::kKeepBest);

  auto first = store->Put(lb, Request("alice", 100, 1000, "Alice"));
  EXPECT_TRUE(first.changed);
  auto worse = store->Put(lb, Request("alice", 80, 2000));
  EXPECT_FALSE(worse.changed);
  EXPECT_DOUBLE_EQ(worse.current.value, 100);
  EXPECT_EQ(worse.display_name, "Alice");
  auto better = store->Put(lb, Request("alice", 120, 3000, "Alice2"));
  EXPECT_TRUE(better.changed);

  auto current = store->GetCurrent(lb.id, "alice");
  ASSERT_TRUE(current.has_value());
  EXPECT_DOUBLE_EQ(current->value, 120);
  EXPECT_EQ(current->timestamp_ms, 3000);
  EXPECT_EQ(store->History(lb.id, "alice").size(), 1u);
  EXPECT_EQ(store->DisplayName(lb.id, "alice"), "Alice2");
}

TEST_F(MariaDbStoreItTest, KeepAllRetainsHistoryAndCurrentProjection) {
  scoreboard::LeaderboardRegistry registry(repository);
  auto lb = registry.Provision("it-all", scoreboard::Ordering::kLowerIsBetter, scoreboard::UpdatePolicy::kKeepAll);
  store->Put(lb, Request("runner", 40.5, 1000, std::string()));
  store->Put(lb, Request("runner", 38.25, 2000));
  store->Put(lb, Request("runner", 45.0, 3000));
  store->Put(lb, Request("other", 50.0, 3000));

  auto history = store->History(lb.id, "runner");
  ASSERT_EQ(history.size(), 3u);
  EXPECT_DOUBLE_EQ(history[0].value, 40.5);
  EXPECT_DOUBLE_EQ(history[2].value, 45.0);

  auto entries = store->CurrentEntries(lb.id);
  ASSERT_EQ(entries.size(), 2u);
  for (const auto& entry : entries) {
    if (entry.entry.player_id == "runner") {
      EXPECT_DOUBLE_EQ(entry.entry.value, 38.25);
    }
  }
}

TEST_F(MariaDbStoreItTest, InjectedTransientFailureRollsBack) {
  scoreboard::LeaderboardRegistry registry(repository);
  auto lb = registry.Provision("it-fail", scoreboard::Ordering::kHigherIsBetter,
                               scoreboard::UpdatePolicy::kKeepLatest);
  store->Put(lb, Request("alice", 10, 1000));
  db_client->SetTransientInjector([](std::size_t) { return true; });
  EXPECT_THROW(store->Put(lb, Request("alice", 20, 2000)), scoreboard::StorageUnavailable);
  db_client->SetTransientInjector(nullptr);
  EXPECT_DOUBLE_EQ(store->GetCurrent(lb.id, "alice")->value, 10);
}

TEST_F(MariaDbStoreItTest, RegistryAndIndexSurviveRestart) {
  std::string lb_id;
  std::string secret;
  {
    auto registry = std::make_shared<scoreboard::LeaderboardRegistry>(repository);
    auto engine = std::make_shared<scoreboard::RankingEngine>(store, nullptr);
    scoreboard::SubmissionGateway gateway(registry, nullptr, store, engine, nullptr, FastRetry());
    auto lb = registry->Provision("it-restart", scoreboard::Ordering::kHigherIsBetter,
                                  scoreboard::UpdatePolicy::kKeepBest);
    lb_id = lb.id;
    secret = lb.secret;
    for (const auto& sample : {std::make_pair("alice", 100.0), std::make_pair("bob", 150.0),
                               std::make_pair("alice", 90.0)}) {
      scoreboard::ScoreSubmission submission;
      submission.leaderboard_id = lb.id;
      submission.key = lb.secret;
      submission.player_id = sample.first;
      submission.value = sample.second;
      ASSERT_TRUE(gateway.Submit(submission).Acknowledged());
    }
    registry->Rename(lb.id, "renamed");
  }

  auto registry = std::make_shared<scoreboard::LeaderboardRegistry>(repository);
  EXPECT_EQ(registry->Load(), 1u);
  auto lb = registry->Resolve(lb_id);
  ASSERT_TRUE(lb.has_value());
  EXPECT_EQ(lb->name, "renamed");
  EXPECT_TRUE(registry->Authenticate(lb_id, secret));

  scoreboard::RankingEngine engine(store, nullptr);
  auto top = engine.Acquire(*lb)->Index().Top(2);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].player_id, "bob");
  EXPECT_EQ(top[1].player_id, "alice");
  EXPECT_DOUBLE_EQ(top[1].value, 100);
  EXPECT_TRUE(engine.Verify(*lb).Consistent());
}

TEST_F(MariaDbStoreItTest, LostCommitAcknowledgementIsNotResubmitted) {
  auto registry = std::make_shared<scoreboard::LeaderboardRegistry>(repository);
  auto engine = std::make_shared<scoreboard::RankingEngine>(store, nullptr);
  scoreboard::SubmissionGateway gateway(registry, nullptr, store, engine, nullptr, FastRetry());
  auto lb = registry->Provision("it-commit", scoreboard::Ordering::kHigherIsBetter,
                                scoreboard::UpdatePolicy::kKeepAll);

  scoreboard::ScoreSubmission submission;
  submission.leaderboard_id = lb.id;
  submission.key = lb.secret;
  submission.player_id = "alice";
  submission.value = 70;
  ASSERT_TRUE(gateway.Submit(submission).Acknowledged());

  // 커밋은 반영되었지만 응답을 잃어버린 상황
  db_client->SetCommitLossInjector([]() { return true; });
  submission.value = 90;
  auto outcome = gateway.Submit(submission);
  db_client->SetCommitLossInjector(nullptr);

  EXPECT_EQ(outcome.status, scoreboard::SubmissionStatus::kFailed);
  EXPECT_EQ(outcome.error_code, scoreboard::errors::kSubmissionFailed);
  EXPECT_EQ(outcome.attempts, 1u);
  // 두 번째 쓰기는 정확히 한 번만 남는다.
  auto history = store->History(lb.id, "alice");
  ASSERT_EQ(history.size(), 2u);
  EXPECT_DOUBLE_EQ(history[1].value, 90);

  auto top = engine->Acquire(lb)->Index().Top(1);
  ASSERT_EQ(top.size(), 1u);
  EXPECT_DOUBLE_EQ(top[0].value, 90);
  EXPECT_TRUE(engine->Verify(lb).Consistent());
}

TEST_F(MariaDbStoreItTest, IssuedPlayerKeySurvivesRestart) {
  std::string id;
  std::string key;
  {
    scoreboard::PlayerDirectory directory(players);
    auto account = directory.Issue(std::string("Persisted"));
    id = account.id;
    key = account.key;
  }
  scoreboard::PlayerDirectory restarted(players);
  auto found = restarted.Find(id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->key, key);
  EXPECT_EQ(found->name, "Persisted");
  EXPECT_FALSE(restarted.Find("00000000-0000-4000-8000-000000000000").has_value());
}
