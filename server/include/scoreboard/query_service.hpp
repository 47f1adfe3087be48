/*
 * 설명: 순위 인덱스만 읽어 top-N, 주변 순위, 플레이어 순위를 제공하는 조회 서비스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/query_service_test.cpp, server/tests/e2e/leaderboard_api_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "scoreboard/leaderboard_registry.hpp"
#include "scoreboard/observability.hpp"
#include "scoreboard/rank_index.hpp"
#include "scoreboard/ranking_engine.hpp"
#include "scoreboard/score_store.hpp"

namespace scoreboard {

struct QueryLimits {
  std::size_t default_limit{10};
  std::size_t max_limit{100};
  std::size_t default_window{5};
  std::size_t max_window{50};
  bool require_key{false};
};

struct PlayerStanding {
  RankedEntry entry;
  std::size_t total{0};
};

struct LeaderboardSummary {
  Leaderboard leaderboard;
  std::size_t ranked_players{0};
};

class QueryService {
 public:
  QueryService(std::shared_ptr<LeaderboardRegistry> registry, std::shared_ptr<ScoreStore> store,
               std::shared_ptr<RankingEngine> engine, std::shared_ptr<Observability> observability,
               QueryLimits limits = {});

  std::optional<std::vector<RankedEntry>> Top(const std::string& leaderboard_id, std::size_t n,
                                              const std::optional<std::string>& key, std::string& error_code,
                                              std::string& error_message) const;
  std::optional<std::vector<RankedEntry>> Around(const std::string& leaderboard_id, const std::string& player_id,
                                                 std::size_t window, const std::optional<std::string>& key,
                                                 std::string& error_code, std::string& error_message) const;
  std::optional<PlayerStanding> Standing(const std::string& leaderboard_id, const std::string& player_id,
                                         const std::optional<std::string>& key, std::string& error_code,
                                         std::string& error_message) const;
  // 저장소를 직접 읽는 보조 조회. keep-all이 아니면 현재 엔트리 하나만 남는다.
  std::optional<std::vector<ScoreEntry>> History(const std::string& leaderboard_id, const std::string& player_id,
                                                 const std::optional<std::string>& key, std::string& error_code,
                                                 std::string& error_message) const;
  std::optional<LeaderboardSummary> Describe(const std::string& leaderboard_id, std::string& error_code,
                                             std::string& error_message) const;

  const QueryLimits& Limits() const { return limits_; }

 private:
  std::shared_ptr<LeaderboardState> Prepare(const std::string& leaderboard_id, const std::optional<std::string>& key,
                                            std::string& error_code, std::string& error_message) const;

  std::shared_ptr<LeaderboardRegistry> registry_;
  std::shared_ptr<ScoreStore> store_;
  std::shared_ptr<RankingEngine> engine_;
  std::shared_ptr<Observability> observability_;
  QueryLimits limits_;
};

}  // namespace scoreboard
