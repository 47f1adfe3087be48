/*
 * 설명: 리더보드별 소유 상태(순위 인덱스 + 플레이어 잠금 스트라이프)를 관리하고,
 *       점수 저장소의 현재 엔트리 투영으로부터 인덱스를 복구/검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ranking_engine_test.cpp
 */
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "scoreboard/leaderboard.hpp"
#include "scoreboard/observability.hpp"
#include "scoreboard/rank_index.hpp"
#include "scoreboard/score_store.hpp"

namespace scoreboard {

class LeaderboardState {
 public:
  static constexpr std::size_t kStripeCount = 64;

  LeaderboardState(std::string leaderboard_id, Ordering ordering);

  const std::string& Id() const { return id_; }
  RankIndex& Index() { return index_; }
  const RankIndex& Index() const { return index_; }

  // 같은 플레이어의 저장 + 인덱스 갱신을 직렬화하는 잠금.
  std::mutex& StripeFor(const std::string& player_id);

  bool IsReady() const { return ready_.load() && !needs_rebuild_.load(); }
  void MarkForRebuild() { needs_rebuild_.store(true); }

 private:
  friend class RankingEngine;

  std::string id_;
  RankIndex index_;
  std::array<std::mutex, kStripeCount> stripes_;
  std::mutex rebuild_mutex_;
  std::atomic<bool> ready_{false};
  std::atomic<bool> needs_rebuild_{false};
};

struct ConsistencyReport {
  std::size_t store_entries{0};
  std::size_t index_entries{0};
  std::size_t missing_in_index{0};
  std::size_t orphaned_in_index{0};
  std::size_t mismatched{0};
  bool rebuilt{false};

  bool Consistent() const { return missing_in_index == 0 && orphaned_in_index == 0 && mismatched == 0; }
};

IndexRecord ToIndexRecord(const std::string& display_name, const ScoreEntry& entry);

class RankingEngine {
 public:
  RankingEngine(std::shared_ptr<ScoreStore> store, std::shared_ptr<Observability> observability);

  // 상태가 없거나 재구성이 필요하면 저장소에서 복구한 뒤 돌려준다. 저장소 장애 시 DbException을 던진다.
  std::shared_ptr<LeaderboardState> Acquire(const Leaderboard& leaderboard);
  std::shared_ptr<LeaderboardState> Peek(const std::string& leaderboard_id) const;

  void Rebuild(const Leaderboard& leaderboard);
  ConsistencyReport Verify(const Leaderboard& leaderboard);
  std::size_t RecoverAll(const std::vector<Leaderboard>& leaderboards);

  std::vector<std::pair<std::string, std::size_t>> IndexSizes() const;

 private:
  using StripeLocks = std::vector<std::unique_lock<std::mutex>>;

  std::shared_ptr<LeaderboardState> GetOrCreate(const Leaderboard& leaderboard);
  StripeLocks LockAllStripes(LeaderboardState& state) const;
  void RebuildLocked(LeaderboardState& state, const std::vector<PlayerScore>& entries, const std::string& reason);

  std::shared_ptr<ScoreStore> store_;
  std::shared_ptr<Observability> observability_;
  std::unordered_map<std::string, std::shared_ptr<LeaderboardState>> states_;
  mutable std::shared_mutex mutex_;
};

}  // namespace scoreboard
