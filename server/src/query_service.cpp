/*
 * 설명: 조회 서비스. 인덱스가 준비되지 않은 리더보드는 첫 조회에서 저장소로부터 복구한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/query_service_test.cpp
 */
#include "scoreboard/query_service.hpp"

#include "scoreboard/errors.hpp"
#include "scoreboard/storage_error.hpp"

namespace scoreboard {

QueryService::QueryService(std::shared_ptr<LeaderboardRegistry> registry, std::shared_ptr<ScoreStore> store,
                           std::shared_ptr<RankingEngine> engine, std::shared_ptr<Observability> observability,
                           QueryLimits limits)
    : registry_(std::move(registry)), store_(std::move(store)), engine_(std::move(engine)),
      observability_(std::move(observability)), limits_(limits) {}

std::optional<std::vector<RankedEntry>> QueryService::Top(const std::string& leaderboard_id, std::size_t n,
                                                          const std::optional<std::string>& key,
                                                          std::string& error_code,
                                                          std::string& error_message) const {
  if (n == 0 || n > limits_.max_limit) {
    error_code = errors::kBadRequest;
    error_message = "limit은 1 이상 " + std::to_string(limits_.max_limit) + " 이하여야 합니다";
    return std::nullopt;
  }
  auto state = Prepare(leaderboard_id, key, error_code, error_message);
  if (!state) {
    return std::nullopt;
  }
  if (observability_) {
    observability_->IncrementQuery();
  }
  return state->Index().Top(n);
}

std::optional<std::vector<RankedEntry>> QueryService::Around(const std::string& leaderboard_id,
                                                             const std::string& player_id, std::size_t window,
                                                             const std::optional<std::string>& key,
                                                             std::string& error_code,
                                                             std::string& error_message) const {
  if (window > limits_.max_window) {
    error_code = errors::kBadRequest;
    error_message = "window는 " + std::to_string(limits_.max_window) + " 이하여야 합니다";
    return std::nullopt;
  }
  auto state = Prepare(leaderboard_id, key, error_code, error_message);
  if (!state) {
    return std::nullopt;
  }
  auto entries = state->Index().Around(player_id, window);
  if (entries.empty()) {
    error_code = errors::kPlayerNotRanked;
    error_message = "순위에 없는 플레이어입니다";
    return std::nullopt;
  }
  if (observability_) {
    observability_->IncrementQuery();
  }
  return entries;
}

std::optional<PlayerStanding> QueryService::Standing(const std::string& leaderboard_id, const std::string& player_id,
                                                     const std::optional<std::string>& key, std::string& error_code,
                                                     std::string& error_message) const {
  auto state = Prepare(leaderboard_id, key, error_code, error_message);
  if (!state) {
    return std::nullopt;
  }
  auto found = state->Index().Find(player_id);
  if (!found) {
    error_code = errors::kPlayerNotRanked;
    error_message = "순위에 없는 플레이어입니다";
    return std::nullopt;
  }
  if (observability_) {
    observability_->IncrementQuery();
  }
  return PlayerStanding{*found, state->Index().Size()};
}

std::optional<std::vector<ScoreEntry>> QueryService::History(const std::string& leaderboard_id,
                                                             const std::string& player_id,
                                                             const std::optional<std::string>& key,
                                                             std::string& error_code,
                                                             std::string& error_message) const {
  auto leaderboard = registry_->Resolve(leaderboard_id);
  if (!leaderboard) {
    error_code = errors::kLeaderboardNotFound;
    error_message = "리더보드를 찾을 수 없습니다";
    return std::nullopt;
  }
  if (limits_.require_key && (!key || !registry_->Authenticate(leaderboard_id, *key))) {
    error_code = errors::kAuthenticationFailed;
    error_message = "리더보드 키가 올바르지 않습니다";
    return std::nullopt;
  }
  try {
    auto history = store_->History(leaderboard_id, player_id);
    if (history.empty()) {
      error_code = errors::kPlayerNotRanked;
      error_message = "점수 기록이 없는 플레이어입니다";
      return std::nullopt;
    }
    if (observability_) {
      observability_->IncrementQuery();
    }
    return history;
  } catch (const DbException& ex) {
    error_code = errors::kStorageUnavailable;
    error_message = std::string("저장소 조회 실패: ") + ex.what();
    return std::nullopt;
  }
}

std::optional<LeaderboardSummary> QueryService::Describe(const std::string& leaderboard_id, std::string& error_code,
                                                         std::string& error_message) const {
  auto leaderboard = registry_->Resolve(leaderboard_id);
  if (!leaderboard) {
    error_code = errors::kLeaderboardNotFound;
    error_message = "리더보드를 찾을 수 없습니다";
    return std::nullopt;
  }
  try {
    auto state = engine_->Acquire(*leaderboard);
    return LeaderboardSummary{*leaderboard, state->Index().Size()};
  } catch (const DbException& ex) {
    error_code = errors::kStorageUnavailable;
    error_message = std::string("인덱스 복구 실패: ") + ex.what();
    return std::nullopt;
  }
}

std::shared_ptr<LeaderboardState> QueryService::Prepare(const std::string& leaderboard_id,
                                                        const std::optional<std::string>& key,
                                                        std::string& error_code, std::string& error_message) const {
  auto leaderboard = registry_->Resolve(leaderboard_id);
  if (!leaderboard) {
    error_code = errors::kLeaderboardNotFound;
    error_message = "리더보드를 찾을 수 없습니다";
    return nullptr;
  }
  if (limits_.require_key && (!key || !registry_->Authenticate(leaderboard_id, *key))) {
    error_code = errors::kAuthenticationFailed;
    error_message = "조회에 올바른 리더보드 키가 필요합니다";
    return nullptr;
  }
  try {
    return engine_->Acquire(*leaderboard);
  } catch (const DbException& ex) {
    error_code = errors::kStorageUnavailable;
    error_message = std::string("인덱스 복구 실패: ") + ex.what();
    if (observability_) {
      observability_->Log(LogContext{"", "index.recovery_failed", 0, leaderboard_id, std::nullopt, ex.what(),
                                     LogLevel::kError});
    }
    return nullptr;
  }
}

}  // namespace scoreboard
