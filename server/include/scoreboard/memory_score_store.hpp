/*
 * 설명: 프로세스 내부 메모리에 점수 이력을 보관하는 저장소. 테스트와 STORE_BACKEND=memory에서 사용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_score_store_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "scoreboard/score_store.hpp"

namespace scoreboard {

class MemoryScoreStore : public ScoreStore {
 public:
  MemoryScoreStore() = default;

  PutResult Put(const Leaderboard& leaderboard, const PutRequest& request) override;
  std::optional<ScoreEntry> GetCurrent(const std::string& leaderboard_id,
                                       const std::string& player_id) const override;
  std::vector<ScoreEntry> History(const std::string& leaderboard_id, const std::string& player_id) const override;
  std::vector<PlayerScore> CurrentEntries(const std::string& leaderboard_id) const override;
  std::optional<std::string> DisplayName(const std::string& leaderboard_id,
                                         const std::string& player_id) const override;

  // 호출 번호(1부터)를 받아 true를 돌려주면 해당 Put이 StorageUnavailable로 실패한다.
  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);
  // true를 돌려주면 쓰기를 반영한 뒤 CommitOutcomeUnknown을 던진다.
  void SetCommitLossInjector(const std::function<bool(std::size_t)>& injector);
  std::size_t PutCalls() const { return put_calls_.load(); }

  // 복구 경로 검증용: 현재 엔트리를 정책을 거치지 않고 직접 덮어쓴다.
  void OverwriteCurrentForTesting(const std::string& leaderboard_id, const ScoreEntry& entry,
                                  const std::string& display_name);

 private:
  struct PlayerRecord {
    std::string display_name;
    std::vector<ScoreEntry> entries;
    std::size_t current{0};
  };
  using RecordKey = std::pair<std::string, std::string>;

  std::map<RecordKey, PlayerRecord> records_;
  std::uint64_t next_sequence_{1};
  std::function<bool(std::size_t)> transient_injector_;
  std::function<bool(std::size_t)> commit_loss_injector_;
  std::atomic<std::size_t> put_calls_{0};
  mutable std::mutex mutex_;
};

}  // namespace scoreboard
