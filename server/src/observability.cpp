/*
 * 설명: 구조화 로그 출력과 메트릭 카운터를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "scoreboard/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace scoreboard {
namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "info") {
    return LogLevel::kInfo;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

Observability::Observability(LogLevel min_level) : min_level_(min_level) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementAccepted() { submissions_accepted_.fetch_add(1); }

void Observability::IncrementRejected() { submissions_rejected_.fetch_add(1); }

void Observability::IncrementFailed() { submissions_failed_.fetch_add(1); }

void Observability::IncrementStorageRetry() { storage_retries_.fetch_add(1); }

void Observability::IncrementIndexRebuild() { index_rebuilds_.fetch_add(1); }

void Observability::IncrementInconsistency() { index_inconsistencies_.fetch_add(1); }

void Observability::IncrementQuery() { queries_served_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.submissions_accepted = submissions_accepted_.load();
  snapshot.submissions_rejected = submissions_rejected_.load();
  snapshot.submissions_failed = submissions_failed_.load();
  snapshot.storage_retries = storage_retries_.load();
  snapshot.index_rebuilds = index_rebuilds_.load();
  snapshot.index_inconsistencies = index_inconsistencies_.load();
  snapshot.queries_served = queries_served_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.leaderboard_id) {
    log_json["leaderboardId"] = *ctx.leaderboard_id;
  }
  if (ctx.player_id) {
    log_json["playerId"] = *ctx.player_id;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << line << std::endl;
}

}  // namespace scoreboard
