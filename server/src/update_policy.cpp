/*
 * 설명: 갱신 정책(keep-best/keep-latest/keep-all) 판정 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/update_policy_test.cpp
 */
#include "scoreboard/update_policy.hpp"

namespace scoreboard {

bool IsStrictlyBetter(Ordering ordering, double candidate, double current) {
  return ordering == Ordering::kHigherIsBetter ? candidate > current : candidate < current;
}

bool RanksBefore(Ordering ordering, const ScoreEntry& a, const ScoreEntry& b) {
  if (a.value != b.value) {
    return IsStrictlyBetter(ordering, a.value, b.value);
  }
  if (a.timestamp_ms != b.timestamp_ms) {
    return a.timestamp_ms < b.timestamp_ms;
  }
  return a.player_id < b.player_id;
}

UpdateDecision DecideUpdate(UpdatePolicy policy, Ordering ordering, const std::optional<ScoreEntry>& current,
                            const ScoreEntry& candidate) {
  switch (policy) {
    case UpdatePolicy::kKeepBest:
      if (!current || IsStrictlyBetter(ordering, candidate.value, current->value)) {
        return UpdateDecision::kReplace;
      }
      return UpdateDecision::kRetain;
    case UpdatePolicy::kKeepLatest:
      // 동일한 (점수, 타임스탬프) 재전송은 현재 엔트리를 건드리지 않는다.
      if (current && current->value == candidate.value && current->timestamp_ms == candidate.timestamp_ms &&
          current->metadata == candidate.metadata) {
        return UpdateDecision::kRetain;
      }
      return UpdateDecision::kReplace;
    case UpdatePolicy::kKeepAll:
      if (!current || RanksBefore(ordering, candidate, *current)) {
        return UpdateDecision::kAppendAndReplace;
      }
      return UpdateDecision::kAppendAndRetain;
  }
  return UpdateDecision::kRetain;
}

}  // namespace scoreboard
