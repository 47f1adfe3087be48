/*
 * 설명: 정렬 정책에 따른 비교와 갱신 정책 판정을 순수 함수로 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/update_policy_test.cpp
 */
#pragma once

#include <optional>

#include "scoreboard/leaderboard.hpp"

namespace scoreboard {

enum class UpdateDecision {
  kReplace,           // 새 엔트리가 현재 엔트리를 대체한다
  kRetain,            // 기존 현재 엔트리를 유지하고 새 엔트리는 버린다
  kAppendAndReplace,  // keep-all: 이력에 추가하고 현재 엔트리로 삼는다
  kAppendAndRetain,   // keep-all: 이력에만 추가한다
};

bool IsStrictlyBetter(Ordering ordering, double candidate, double current);

// 점수 → 타임스탬프(이른 쪽) → player_id 순의 전순서에서 a가 b보다 앞서는지 판정한다.
bool RanksBefore(Ordering ordering, const ScoreEntry& a, const ScoreEntry& b);

UpdateDecision DecideUpdate(UpdatePolicy policy, Ordering ordering, const std::optional<ScoreEntry>& current,
                            const ScoreEntry& candidate);

inline bool AppendsHistory(UpdateDecision decision) {
  return decision == UpdateDecision::kAppendAndReplace || decision == UpdateDecision::kAppendAndRetain;
}

inline bool ReplacesCurrent(UpdateDecision decision) {
  return decision == UpdateDecision::kReplace || decision == UpdateDecision::kAppendAndReplace;
}

}  // namespace scoreboard
