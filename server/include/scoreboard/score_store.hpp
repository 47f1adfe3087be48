/*
 * 설명: (leaderboard_id, player_id) → 점수 이력을 보관하는 저장소 계약과 공용 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_score_store_test.cpp, server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "scoreboard/leaderboard.hpp"
#include "scoreboard/update_policy.hpp"

namespace scoreboard {

struct PutRequest {
  std::string player_id;
  std::string display_name;
  double value{0.0};
  std::int64_t timestamp_ms{0};
  std::optional<std::string> metadata;
};

struct PutResult {
  ScoreEntry current;
  std::optional<ScoreEntry> previous;  // 호출 전 현재 엔트리
  std::string display_name;
  UpdateDecision decision{UpdateDecision::kRetain};
  bool changed{false};  // 현재 엔트리가 바뀌었는지
};

// 구현체는 Put이 반환되기 전에 영속화를 마쳐야 한다. 일시 장애는 StorageUnavailable로 던진다.
class ScoreStore {
 public:
  virtual ~ScoreStore() = default;

  virtual PutResult Put(const Leaderboard& leaderboard, const PutRequest& request) = 0;
  virtual std::optional<ScoreEntry> GetCurrent(const std::string& leaderboard_id,
                                               const std::string& player_id) const = 0;
  virtual std::vector<ScoreEntry> History(const std::string& leaderboard_id, const std::string& player_id) const = 0;
  virtual std::vector<PlayerScore> CurrentEntries(const std::string& leaderboard_id) const = 0;
  virtual std::optional<std::string> DisplayName(const std::string& leaderboard_id,
                                                 const std::string& player_id) const = 0;
};

}  // namespace scoreboard
