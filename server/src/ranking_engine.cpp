/*
 * 설명: 리더보드 상태 테이블, 인덱스 복구, 저장소-인덱스 정합성 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ranking_engine_test.cpp
 */
#include "scoreboard/ranking_engine.hpp"

#include <functional>

namespace scoreboard {

LeaderboardState::LeaderboardState(std::string leaderboard_id, Ordering ordering)
    : id_(std::move(leaderboard_id)), index_(ordering) {}

std::mutex& LeaderboardState::StripeFor(const std::string& player_id) {
  return stripes_[std::hash<std::string>{}(player_id) % kStripeCount];
}

IndexRecord ToIndexRecord(const std::string& display_name, const ScoreEntry& entry) {
  return IndexRecord{entry.player_id, display_name, RankKey{entry.value, entry.timestamp_ms}, entry.metadata};
}

RankingEngine::RankingEngine(std::shared_ptr<ScoreStore> store, std::shared_ptr<Observability> observability)
    : store_(std::move(store)), observability_(std::move(observability)) {}

std::shared_ptr<LeaderboardState> RankingEngine::GetOrCreate(const Leaderboard& leaderboard) {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = states_.find(leaderboard.id);
    if (it != states_.end()) {
      return it->second;
    }
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto& slot = states_[leaderboard.id];
  if (!slot) {
    slot = std::make_shared<LeaderboardState>(leaderboard.id, leaderboard.ordering);
  }
  return slot;
}

std::shared_ptr<LeaderboardState> RankingEngine::Acquire(const Leaderboard& leaderboard) {
  auto state = GetOrCreate(leaderboard);
  if (state->IsReady()) {
    return state;
  }
  std::lock_guard<std::mutex> rebuild_lock(state->rebuild_mutex_);
  if (state->IsReady()) {
    return state;
  }
  auto locks = LockAllStripes(*state);
  const char* reason = state->ready_.load() ? "inconsistency" : "recovery";
  RebuildLocked(*state, store_->CurrentEntries(leaderboard.id), reason);
  return state;
}

std::shared_ptr<LeaderboardState> RankingEngine::Peek(const std::string& leaderboard_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = states_.find(leaderboard_id);
  if (it == states_.end()) {
    return nullptr;
  }
  return it->second;
}

void RankingEngine::Rebuild(const Leaderboard& leaderboard) {
  auto state = GetOrCreate(leaderboard);
  std::lock_guard<std::mutex> rebuild_lock(state->rebuild_mutex_);
  auto locks = LockAllStripes(*state);
  RebuildLocked(*state, store_->CurrentEntries(leaderboard.id), "manual");
}

ConsistencyReport RankingEngine::Verify(const Leaderboard& leaderboard) {
  auto state = Acquire(leaderboard);
  std::lock_guard<std::mutex> rebuild_lock(state->rebuild_mutex_);
  auto locks = LockAllStripes(*state);

  // 모든 스트라이프를 잡은 상태라 이 리더보드에 대한 쓰기는 멈춰 있다.
  auto entries = store_->CurrentEntries(leaderboard.id);
  auto snapshot = state->Index().Snapshot();

  ConsistencyReport report;
  report.store_entries = entries.size();
  report.index_entries = snapshot.size();

  std::unordered_map<std::string, RankKey> indexed;
  indexed.reserve(snapshot.size());
  for (const auto& ranked : snapshot) {
    indexed.emplace(ranked.player_id, RankKey{ranked.value, ranked.timestamp_ms});
  }
  for (const auto& player : entries) {
    auto it = indexed.find(player.entry.player_id);
    if (it == indexed.end()) {
      ++report.missing_in_index;
      continue;
    }
    if (it->second != RankKey{player.entry.value, player.entry.timestamp_ms}) {
      ++report.mismatched;
    }
    indexed.erase(it);
  }
  report.orphaned_in_index = indexed.size();

  if (!report.Consistent()) {
    if (observability_) {
      observability_->IncrementInconsistency();
      observability_->Log(LogContext{"", "index.inconsistency", 0, leaderboard.id, std::nullopt,
                                     "missing=" + std::to_string(report.missing_in_index) +
                                         " orphaned=" + std::to_string(report.orphaned_in_index) +
                                         " mismatched=" + std::to_string(report.mismatched),
                                     LogLevel::kWarn});
    }
    RebuildLocked(*state, entries, "inconsistency");
    report.rebuilt = true;
  }
  return report;
}

std::size_t RankingEngine::RecoverAll(const std::vector<Leaderboard>& leaderboards) {
  std::size_t recovered = 0;
  for (const auto& leaderboard : leaderboards) {
    Acquire(leaderboard);
    ++recovered;
  }
  return recovered;
}

std::vector<std::pair<std::string, std::size_t>> RankingEngine::IndexSizes() const {
  std::vector<std::shared_ptr<LeaderboardState>> states;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    states.reserve(states_.size());
    for (const auto& entry : states_) {
      states.push_back(entry.second);
    }
  }
  std::vector<std::pair<std::string, std::size_t>> sizes;
  sizes.reserve(states.size());
  for (const auto& state : states) {
    sizes.emplace_back(state->Id(), state->Index().Size());
  }
  return sizes;
}

RankingEngine::StripeLocks RankingEngine::LockAllStripes(LeaderboardState& state) const {
  StripeLocks locks;
  locks.reserve(LeaderboardState::kStripeCount);
  for (auto& stripe : state.stripes_) {
    locks.emplace_back(stripe);
  }
  return locks;
}

void RankingEngine::RebuildLocked(LeaderboardState& state, const std::vector<PlayerScore>& entries,
                                  const std::string& reason) {
  std::vector<IndexRecord> records;
  records.reserve(entries.size());
  for (const auto& player : entries) {
    records.push_back(ToIndexRecord(player.display_name, player.entry));
  }
  state.Index().Rebuild(records);
  state.needs_rebuild_.store(false);
  state.ready_.store(true);
  if (observability_) {
    observability_->IncrementIndexRebuild();
    observability_->Log(LogContext{"", "index.rebuilt", 0, state.Id(), std::nullopt,
                                   "reason=" + reason + " entries=" + std::to_string(records.size()),
                                   LogLevel::kInfo});
  }
}

}  // namespace scoreboard
