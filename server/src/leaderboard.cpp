/*
 * 설명: 정렬/갱신 정책 열거형의 문자열 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/update_policy_test.cpp
 */
#include "scoreboard/leaderboard.hpp"

namespace scoreboard {

std::string_view ToString(Ordering ordering) {
  switch (ordering) {
    case Ordering::kHigherIsBetter:
      return "higher_is_better";
    case Ordering::kLowerIsBetter:
      return "lower_is_better";
  }
  return "higher_is_better";
}

std::string_view ToString(UpdatePolicy policy) {
  switch (policy) {
    case UpdatePolicy::kKeepBest:
      return "keep_best";
    case UpdatePolicy::kKeepLatest:
      return "keep_latest";
    case UpdatePolicy::kKeepAll:
      return "keep_all";
  }
  return "keep_best";
}

std::optional<Ordering> ParseOrdering(std::string_view text) {
  if (text == "higher_is_better" || text == "desc") {
    return Ordering::kHigherIsBetter;
  }
  if (text == "lower_is_better" || text == "asc") {
    return Ordering::kLowerIsBetter;
  }
  return std::nullopt;
}

std::optional<UpdatePolicy> ParseUpdatePolicy(std::string_view text) {
  if (text == "keep_best") {
    return UpdatePolicy::kKeepBest;
  }
  if (text == "keep_latest") {
    return UpdatePolicy::kKeepLatest;
  }
  if (text == "keep_all") {
    return UpdatePolicy::kKeepAll;
  }
  return std::nullopt;
}

}  // namespace scoreboard
