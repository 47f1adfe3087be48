/*
 * 설명: 구조화 로그와 제출/조회/복구 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_api_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace scoreboard {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::optional<LogLevel> ParseLogLevel(std::string_view text);

struct LogContext {
  std::string trace_id;
  std::string name;
  long latency_ms{0};
  std::optional<std::string> leaderboard_id;
  std::optional<std::string> player_id;
  std::optional<std::string> detail;
  LogLevel level{LogLevel::kInfo};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t submissions_accepted{0};
  std::uint64_t submissions_rejected{0};
  std::uint64_t submissions_failed{0};
  std::uint64_t storage_retries{0};
  std::uint64_t index_rebuilds{0};
  std::uint64_t index_inconsistencies{0};
  std::uint64_t queries_served{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementAccepted();
  void IncrementRejected();
  void IncrementFailed();
  void IncrementStorageRetry();
  void IncrementIndexRebuild();
  void IncrementInconsistency();
  void IncrementQuery();
  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> submissions_accepted_{0};
  std::atomic<std::uint64_t> submissions_rejected_{0};
  std::atomic<std::uint64_t> submissions_failed_{0};
  std::atomic<std::uint64_t> storage_retries_{0};
  std::atomic<std::uint64_t> index_rebuilds_{0};
  std::atomic<std::uint64_t> index_inconsistencies_{0};
  std::atomic<std::uint64_t> queries_served_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace scoreboard
