/*
 * 설명: 지수 백오프 재시도 정책과 지연 계산을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/submission_gateway_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>

namespace scoreboard {

struct RetryPolicy {
  std::size_t max_attempts{3};
  std::chrono::milliseconds base_delay{50};
  std::chrono::milliseconds max_delay{1000};
  std::chrono::milliseconds max_jitter{25};
};

// attempt는 1부터 시작한다. base * 2^(attempt-1) + jitter, 상한 max_delay.
std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, std::size_t attempt);
void SleepBackoff(const RetryPolicy& policy, std::size_t attempt);

}  // namespace scoreboard
