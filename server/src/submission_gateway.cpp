/*
 * 설명: 제출 상태 기계(Received → Authenticating → ValidatingPolicy → Persisting → Indexing → Acknowledged)를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/submission_gateway_test.cpp, server/tests/unit/concurrent_submission_test.cpp
 */
#include "scoreboard/submission_gateway.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <mutex>

#include "scoreboard/credentials.hpp"
#include "scoreboard/errors.hpp"
#include "scoreboard/storage_error.hpp"

namespace scoreboard {
namespace {
// 9999-12-31T23:59:59Z. 밀리초 변환 시 int64 범위를 넘지 않는다.
constexpr std::uint64_t kMaxTimestampSeconds = 253402300799ULL;

std::int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool Cancelled(const CancellationToken* cancel) { return cancel && cancel->IsCancelled(); }
}  // namespace

std::string_view ToString(SubmissionStage stage) {
  switch (stage) {
    case SubmissionStage::kReceived:
      return "received";
    case SubmissionStage::kAuthenticating:
      return "authenticating";
    case SubmissionStage::kValidatingPolicy:
      return "validating_policy";
    case SubmissionStage::kPersisting:
      return "persisting";
    case SubmissionStage::kIndexing:
      return "indexing";
    case SubmissionStage::kAcknowledged:
      return "acknowledged";
  }
  return "received";
}

std::string_view ToString(SubmissionStatus status) {
  switch (status) {
    case SubmissionStatus::kAcknowledged:
      return "acknowledged";
    case SubmissionStatus::kRejected:
      return "rejected";
    case SubmissionStatus::kFailed:
      return "failed";
  }
  return "rejected";
}

bool CancellationToken::IsCancelled() const {
  if (cancelled_.load()) {
    return true;
  }
  if (probe_ && probe_()) {
    cancelled_.store(true);
    return true;
  }
  return false;
}

SubmissionGateway::SubmissionGateway(std::shared_ptr<LeaderboardRegistry> registry,
                                     std::shared_ptr<PlayerDirectory> players, std::shared_ptr<ScoreStore> store,
                                     std::shared_ptr<RankingEngine> engine,
                                     std::shared_ptr<Observability> observability, RetryPolicy retry_policy,
                                     SubmissionLimits limits)
    : registry_(std::move(registry)), players_(std::move(players)), store_(std::move(store)), engine_(std::move(engine)),
      observability_(std::move(observability)), retry_policy_(retry_policy), limits_(limits) {}

SubmissionOutcome SubmissionGateway::Submit(const ScoreSubmission& submission, const CancellationToken* cancel) {
  SubmissionOutcome outcome;
  std::string error_code;
  std::string error_message;

  outcome.stage = SubmissionStage::kReceived;
  if (Cancelled(cancel)) {
    return Finish(outcome, submission, SubmissionStatus::kRejected, errors::kCancelled, "요청이 취소되었습니다");
  }
  if (!ValidateShape(submission, error_code, error_message)) {
    return Finish(outcome, submission, SubmissionStatus::kRejected, error_code, error_message);
  }

  outcome.stage = SubmissionStage::kAuthenticating;
  if (Cancelled(cancel)) {
    return Finish(outcome, submission, SubmissionStatus::kRejected, errors::kCancelled, "요청이 취소되었습니다");
  }
  auto leaderboard = registry_->Resolve(submission.leaderboard_id);
  if (!leaderboard) {
    return Finish(outcome, submission, SubmissionStatus::kRejected, errors::kLeaderboardNotFound,
                  "리더보드를 찾을 수 없습니다");
  }
  std::string signed_name;
  if (!CheckCredential(*leaderboard, submission, signed_name, error_code, error_message)) {
    auto status = error_code == errors::kStorageUnavailable ? SubmissionStatus::kFailed : SubmissionStatus::kRejected;
    return Finish(outcome, submission, status, error_code, error_message);
  }

  outcome.stage = SubmissionStage::kValidatingPolicy;
  if (Cancelled(cancel)) {
    return Finish(outcome, submission, SubmissionStatus::kRejected, errors::kCancelled, "요청이 취소되었습니다");
  }
  std::shared_ptr<LeaderboardState> state;
  try {
    // 인덱싱 단계가 저장소를 건드리지 않도록 여기서 인덱스를 준비한다. 읽기 재시도는 저장소 계층이 맡는다.
    state = engine_->Acquire(*leaderboard);
  } catch (const DbException& ex) {
    return Finish(outcome, submission, SubmissionStatus::kFailed, errors::kSubmissionFailed,
                  std::string("인덱스 복구 실패: ") + ex.what());
  }

  PutRequest request;
  request.player_id = submission.player_id;
  request.display_name = submission.display_name.empty() ? signed_name : submission.display_name;
  request.value = submission.value;
  request.timestamp_ms = submission.timestamp_seconds
                             ? static_cast<std::int64_t>(*submission.timestamp_seconds) * 1000
                             : NowMillis();
  request.metadata = submission.metadata;

  {
    std::lock_guard<std::mutex> stripe(state->StripeFor(submission.player_id));
    if (Cancelled(cancel)) {
      return Finish(outcome, submission, SubmissionStatus::kRejected, errors::kCancelled, "요청이 취소되었습니다");
    }

    outcome.stage = SubmissionStage::kPersisting;
    outcome.attempts = 0;
    PutResult put;
    try {
      RunWithRetry([&]() { put = store_->Put(*leaderboard, request); }, outcome);
    } catch (const CommitOutcomeUnknown& ex) {
      // 쓰기가 반영되었을 수 있으므로 다시 보내지 않고 인덱스를 저장소 기준으로 다시 만든다.
      state->MarkForRebuild();
      if (observability_) {
        observability_->Log(LogContext{"", "storage.commit_unknown", 0, leaderboard->id, submission.player_id,
                                       ex.what(), LogLevel::kError});
      }
      return Finish(outcome, submission, SubmissionStatus::kFailed, errors::kSubmissionFailed,
                    std::string("저장 결과를 확인할 수 없습니다: ") + ex.what());
    } catch (const DbException& ex) {
      return Finish(outcome, submission, SubmissionStatus::kFailed, errors::kSubmissionFailed,
                    std::string("점수 저장 실패: ") + ex.what());
    }

    outcome.stage = SubmissionStage::kIndexing;
    outcome.current = put.current;
    outcome.display_name = put.display_name;
    outcome.changed = put.changed;

    std::optional<RankKey> expected_old;
    if (put.previous) {
      expected_old = RankKey{put.previous->value, put.previous->timestamp_ms};
    }
    try {
      auto update = state->Index().InsertOrUpdate(ToIndexRecord(put.display_name, put.current), expected_old);
      if (update == IndexUpdate::kInconsistent) {
        state->MarkForRebuild();
        if (observability_) {
          observability_->IncrementInconsistency();
          observability_->Log(LogContext{"", "index.inconsistency", 0, leaderboard->id, submission.player_id,
                                         "인덱스가 보유한 이전 키가 저장소와 다릅니다", LogLevel::kWarn});
        }
      } else {
        outcome.rank = state->Index().RankOf(submission.player_id);
      }
    } catch (const std::exception& ex) {
      state->MarkForRebuild();
      if (observability_) {
        observability_->IncrementInconsistency();
        observability_->Log(LogContext{"", "index.update_failed", 0, leaderboard->id, submission.player_id,
                                       ex.what(), LogLevel::kError});
      }
    }
  }

  if (!outcome.rank) {
    // 저장은 이미 커밋되었으므로 재구성 실패는 순위 누락으로만 반영한다.
    try {
      auto rebuilt = engine_->Acquire(*leaderboard);
      outcome.rank = rebuilt->Index().RankOf(submission.player_id);
    } catch (const DbException& ex) {
      if (observability_) {
        observability_->Log(LogContext{"", "index.rebuild_deferred", 0, leaderboard->id, submission.player_id,
                                       ex.what(), LogLevel::kWarn});
      }
    }
  }

  outcome.stage = SubmissionStage::kAcknowledged;
  return Finish(outcome, submission, SubmissionStatus::kAcknowledged, "", "");
}

bool SubmissionGateway::ValidateShape(const ScoreSubmission& submission, std::string& error_code,
                                      std::string& error_message) const {
  error_code = errors::kMalformedSubmission;
  if (submission.leaderboard_id.empty()) {
    error_message = "리더보드 ID가 필요합니다";
    return false;
  }
  if (submission.player_id.empty() || submission.player_id.size() > limits_.max_player_id_length) {
    error_message = "player 값이 비어 있거나 너무 깁니다";
    return false;
  }
  if (submission.display_name.size() > limits_.max_display_name_length) {
    error_message = "표시 이름이 너무 깁니다";
    return false;
  }
  if (!std::isfinite(submission.value)) {
    error_message = "점수는 유한한 숫자여야 합니다";
    return false;
  }
  if (submission.metadata && submission.metadata->size() > limits_.max_metadata_length) {
    error_message = "meta 값이 너무 깁니다";
    return false;
  }
  if (submission.timestamp_seconds && *submission.timestamp_seconds > kMaxTimestampSeconds) {
    error_message = "timestamp 값이 허용 범위를 벗어났습니다";
    return false;
  }
  if (submission.signature && !submission.key && !submission.timestamp_seconds) {
    error_message = "서명 제출에는 timestamp가 필요합니다";
    return false;
  }
  error_code.clear();
  return true;
}

bool SubmissionGateway::CheckCredential(const Leaderboard& leaderboard, const ScoreSubmission& submission,
                                        std::string& signed_name, std::string& error_code,
                                        std::string& error_message) const {
  error_code = errors::kAuthenticationFailed;
  if (submission.key) {
    if (!registry_->Authenticate(leaderboard.id, *submission.key)) {
      error_message = "리더보드 키가 올바르지 않습니다";
      return false;
    }
    error_code.clear();
    return true;
  }
  if (submission.signature) {
    std::uint64_t timestamp = *submission.timestamp_seconds;
    if (limits_.max_signature_skew_seconds > 0) {
      std::int64_t skew = NowSeconds() - static_cast<std::int64_t>(timestamp);
      if (std::llabs(skew) > limits_.max_signature_skew_seconds) {
        error_message = "서명 timestamp가 허용 오차를 벗어났습니다";
        return false;
      }
    }
    auto payload = BuildSignaturePayload(timestamp, leaderboard.secret, submission.player_id,
                                         static_cast<float>(submission.value), submission.metadata);
    if (!payload || !players_) {
      error_message = "서명 제출의 player는 발급된 플레이어 ID여야 합니다";
      return false;
    }
    std::optional<PlayerAccount> account;
    try {
      account = players_->Find(submission.player_id);
    } catch (const DbException& ex) {
      error_code = errors::kStorageUnavailable;
      error_message = std::string("플레이어 조회 실패: ") + ex.what();
      return false;
    }
    if (!account || !players_->VerifySignature(account->id, *payload, *submission.signature)) {
      error_message = "서명이 올바르지 않습니다";
      return false;
    }
    signed_name = account->name;
    error_code.clear();
    return true;
  }
  error_message = "key 또는 서명(k)이 필요합니다";
  return false;
}

void SubmissionGateway::RunWithRetry(const std::function<void()>& work, SubmissionOutcome& outcome) const {
  const std::size_t max_attempts = std::max<std::size_t>(1, retry_policy_.max_attempts);
  for (std::size_t attempt = 1;; ++attempt) {
    ++outcome.attempts;
    try {
      work();
      return;
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= max_attempts) {
        throw;
      }
      if (observability_) {
        observability_->IncrementStorageRetry();
        observability_->Log(LogContext{"", "storage.retry", 0, std::nullopt, std::nullopt,
                                       "attempt=" + std::to_string(attempt) + " " + ex.what(), LogLevel::kWarn});
      }
      SleepBackoff(retry_policy_, attempt);
    }
  }
}

SubmissionOutcome SubmissionGateway::Finish(SubmissionOutcome outcome, const ScoreSubmission& submission,
                                            SubmissionStatus status, const std::string& error_code,
                                            const std::string& error_message) const {
  outcome.status = status;
  outcome.error_code = error_code;
  outcome.error_message = error_message;
  if (observability_) {
    LogLevel level = LogLevel::kInfo;
    switch (status) {
      case SubmissionStatus::kAcknowledged:
        observability_->IncrementAccepted();
        break;
      case SubmissionStatus::kRejected:
        observability_->IncrementRejected();
        break;
      case SubmissionStatus::kFailed:
        observability_->IncrementFailed();
        level = LogLevel::kError;
        break;
    }
    std::string detail = "stage=" + std::string(ToString(outcome.stage));
    if (!error_code.empty()) {
      detail += " code=" + error_code;
    }
    observability_->Log(LogContext{"", "submission." + std::string(ToString(status)), 0, submission.leaderboard_id,
                                   submission.player_id, detail, level});
  }
  return outcome;
}

}  // namespace scoreboard
