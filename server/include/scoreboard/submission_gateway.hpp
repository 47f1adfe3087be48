/*
 * 설명: 점수 제출을 인증 → 정책 검증 → 영속화 → 인덱싱 단계로 처리하는 제출 게이트웨이.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/submission_gateway_test.cpp, server/tests/unit/concurrent_submission_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "scoreboard/leaderboard_registry.hpp"
#include "scoreboard/observability.hpp"
#include "scoreboard/player_directory.hpp"
#include "scoreboard/ranking_engine.hpp"
#include "scoreboard/retry_policy.hpp"
#include "scoreboard/score_store.hpp"

namespace scoreboard {

enum class SubmissionStage { kReceived, kAuthenticating, kValidatingPolicy, kPersisting, kIndexing, kAcknowledged };

enum class SubmissionStatus { kAcknowledged, kRejected, kFailed };

std::string_view ToString(SubmissionStage stage);
std::string_view ToString(SubmissionStatus status);

// 영속화 단계 진입 전까지만 확인된다. probe는 호출자(예: 끊긴 HTTP 연결)의 취소 여부를 알려준다.
class CancellationToken {
 public:
  CancellationToken() = default;
  explicit CancellationToken(std::function<bool()> probe) : probe_(std::move(probe)) {}

  void Cancel() { cancelled_.store(true); }
  bool IsCancelled() const;

 private:
  mutable std::atomic<bool> cancelled_{false};
  std::function<bool()> probe_;
};

struct ScoreSubmission {
  std::string leaderboard_id;
  std::optional<std::string> key;
  std::optional<std::string> signature;
  std::string player_id;
  std::string display_name;
  double value{0.0};
  std::optional<std::uint64_t> timestamp_seconds;
  std::optional<std::string> metadata;
};

struct SubmissionOutcome {
  SubmissionStatus status{SubmissionStatus::kRejected};
  SubmissionStage stage{SubmissionStage::kReceived};
  std::string error_code;
  std::string error_message;
  std::optional<ScoreEntry> current;
  std::string display_name;
  std::optional<std::size_t> rank;
  bool changed{false};
  std::size_t attempts{0};

  bool Acknowledged() const { return status == SubmissionStatus::kAcknowledged; }
};

struct SubmissionLimits {
  std::size_t max_player_id_length{128};
  std::size_t max_display_name_length{128};
  std::size_t max_metadata_length{4096};
  std::int64_t max_signature_skew_seconds{300};  // 0이면 검사하지 않는다
};

class SubmissionGateway {
 public:
  // players가 nullptr이면 서명 제출은 인증 실패로 거절된다.
  SubmissionGateway(std::shared_ptr<LeaderboardRegistry> registry, std::shared_ptr<PlayerDirectory> players,
                    std::shared_ptr<ScoreStore> store, std::shared_ptr<RankingEngine> engine, std::shared_ptr<Observability> observability,
                    RetryPolicy retry_policy, SubmissionLimits limits = {});

  SubmissionOutcome Submit(const ScoreSubmission& submission, const CancellationToken* cancel = nullptr);

 private:
  bool ValidateShape(const ScoreSubmission& submission, std::string& error_code, std::string& error_message) const;
  // 서명 제출에서 표시 이름이 비어 있으면 발급된 플레이어 이름을 signed_name에 채운다.
  bool CheckCredential(const Leaderboard& leaderboard, const ScoreSubmission& submission, std::string& signed_name,
                       std::string& error_code, std::string& error_message) const;
  // 재시도 가능한 저장소 오류는 백오프 후 다시 시도한다. 소진되면 마지막 예외를 다시 던진다.
  // CommitOutcomeUnknown은 재시도하지 않는다.
  void RunWithRetry(const std::function<void()>& work, SubmissionOutcome& outcome) const;
  SubmissionOutcome Finish(SubmissionOutcome outcome, const ScoreSubmission& submission, SubmissionStatus status,
                           const std::string& error_code, const std::string& error_message) const;

  std::shared_ptr<LeaderboardRegistry> registry_;
  std::shared_ptr<PlayerDirectory> players_;
  std::shared_ptr<ScoreStore> store_;
  std::shared_ptr<RankingEngine> engine_;
  std::shared_ptr<Observability> observability_;
  RetryPolicy retry_policy_;
  SubmissionLimits limits_;
};

}  // namespace scoreboard
