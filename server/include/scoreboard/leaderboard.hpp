/*
 * 설명: 리더보드, 점수 엔트리 등 코어 데이터 모델과 정렬/갱신 정책 열거형을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/update_policy_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace scoreboard {

enum class Ordering { kHigherIsBetter, kLowerIsBetter };

enum class UpdatePolicy { kKeepBest, kKeepLatest, kKeepAll };

struct Leaderboard {
  std::string id;
  std::string secret;
  std::string name;
  Ordering ordering{Ordering::kHigherIsBetter};
  UpdatePolicy update_policy{UpdatePolicy::kKeepBest};
  bool deleted{false};
  std::chrono::system_clock::time_point created_at{};
};

struct ScoreEntry {
  std::string player_id;
  double value{0.0};
  std::int64_t timestamp_ms{0};
  std::optional<std::string> metadata;
  std::uint64_t sequence{0};
};

// 플레이어 표시 이름과 현재 엔트리의 묶음. 복구 시 랭크 인덱스 재구성에 사용한다.
struct PlayerScore {
  std::string display_name;
  ScoreEntry entry;
};

std::string_view ToString(Ordering ordering);
std::string_view ToString(UpdatePolicy policy);
std::optional<Ordering> ParseOrdering(std::string_view text);
std::optional<UpdatePolicy> ParseUpdatePolicy(std::string_view text);

}  // namespace scoreboard
