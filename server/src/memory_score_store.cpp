/*
 * 설명: 메모리 기반 점수 저장소를 구현한다. 갱신 정책 적용과 장애 주입을 지원한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_score_store_test.cpp, server/tests/unit/submission_gateway_test.cpp
 */
#include "scoreboard/memory_score_store.hpp"

#include "scoreboard/storage_error.hpp"

namespace scoreboard {

PutResult MemoryScoreStore::Put(const Leaderboard& leaderboard, const PutRequest& request) {
  std::size_t call = put_calls_.fetch_add(1) + 1;
  std::lock_guard<std::mutex> lock(mutex_);
  if (transient_injector_ && transient_injector_(call)) {
    throw StorageUnavailable("주입된 일시 오류");
  }

  ScoreEntry candidate{request.player_id, request.value, request.timestamp_ms, request.metadata, 0};
  RecordKey key{leaderboard.id, request.player_id};
  auto it = records_.find(key);
  std::optional<ScoreEntry> current;
  if (it != records_.end() && !it->second.entries.empty()) {
    current = it->second.entries[it->second.current];
  }

  PutResult result;
  result.previous = current;
  result.decision = DecideUpdate(leaderboard.update_policy, leaderboard.ordering, current, candidate);

  PlayerRecord& record = it == records_.end() ? records_[key] : it->second;
  if (!request.display_name.empty()) {
    record.display_name = request.display_name;
  } else if (record.display_name.empty()) {
    record.display_name = request.player_id;
  }

  switch (result.decision) {
    case UpdateDecision::kReplace:
      candidate.sequence = next_sequence_++;
      record.entries.assign(1, candidate);
      record.current = 0;
      result.changed = true;
      break;
    case UpdateDecision::kAppendAndReplace:
      candidate.sequence = next_sequence_++;
      record.entries.push_back(candidate);
      record.current = record.entries.size() - 1;
      result.changed = true;
      break;
    case UpdateDecision::kAppendAndRetain:
      candidate.sequence = next_sequence_++;
      record.entries.push_back(candidate);
      result.changed = false;
      break;
    case UpdateDecision::kRetain:
      result.changed = false;
      break;
  }

  result.current = record.entries[record.current];
  result.display_name = record.display_name;
  if (commit_loss_injector_ && commit_loss_injector_(call)) {
    throw CommitOutcomeUnknown("주입된 커밋 응답 유실");
  }
  return result;
}

std::optional<ScoreEntry> MemoryScoreStore::GetCurrent(const std::string& leaderboard_id,
                                                       const std::string& player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(RecordKey{leaderboard_id, player_id});
  if (it == records_.end() || it->second.entries.empty()) {
    return std::nullopt;
  }
  return it->second.entries[it->second.current];
}

std::vector<ScoreEntry> MemoryScoreStore::History(const std::string& leaderboard_id,
                                                  const std::string& player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(RecordKey{leaderboard_id, player_id});
  if (it == records_.end()) {
    return {};
  }
  return it->second.entries;
}

std::vector<PlayerScore> MemoryScoreStore::CurrentEntries(const std::string& leaderboard_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PlayerScore> out;
  for (auto it = records_.lower_bound(RecordKey{leaderboard_id, ""});
       it != records_.end() && it->first.first == leaderboard_id; ++it) {
    if (it->second.entries.empty()) {
      continue;
    }
    out.push_back(PlayerScore{it->second.display_name, it->second.entries[it->second.current]});
  }
  return out;
}

std::optional<std::string> MemoryScoreStore::DisplayName(const std::string& leaderboard_id,
                                                         const std::string& player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(RecordKey{leaderboard_id, player_id});
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second.display_name;
}

void MemoryScoreStore::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  transient_injector_ = injector;
}

void MemoryScoreStore::SetCommitLossInjector(const std::function<bool(std::size_t)>& injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  commit_loss_injector_ = injector;
}

void MemoryScoreStore::OverwriteCurrentForTesting(const std::string& leaderboard_id, const ScoreEntry& entry,
                                                  const std::string& display_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& record = records_[RecordKey{leaderboard_id, entry.player_id}];
  record.display_name = display_name;
  ScoreEntry stored = entry;
  stored.sequence = next_sequence_++;
  record.entries.assign(1, stored);
  record.current = 0;
}

}  // namespace scoreboard
