/*
 * 설명: 재시도 백오프 지연을 계산하고 대기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "scoreboard/retry_policy.hpp"

#include <algorithm>
#include <random>
#include <thread>

namespace scoreboard {

std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, std::size_t attempt) {
  std::size_t shift = std::min<std::size_t>(attempt == 0 ? 0 : attempt - 1, 16);
  std::chrono::milliseconds base(policy.base_delay.count() << shift);
  std::chrono::milliseconds jitter(0);
  if (policy.max_jitter.count() > 0) {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<std::chrono::milliseconds::rep> dist(0, policy.max_jitter.count());
    jitter = std::chrono::milliseconds(dist(gen));
  }
  return std::min<std::chrono::milliseconds>(base + jitter, policy.max_delay);
}

void SleepBackoff(const RetryPolicy& policy, std::size_t attempt) {
  std::this_thread::sleep_for(BackoffDelay(policy, attempt));
}

}  // namespace scoreboard
