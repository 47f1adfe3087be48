/*
 * 설명: JSON 응답 엔벨로프와 리더보드/점수 JSON 표현을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "scoreboard/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>

#include "scoreboard/errors.hpp"

namespace scoreboard {
namespace {
std::string CurrentTimestamp() { return ToIsoTimestamp(std::chrono::system_clock::now()); }

nlohmann::json OptionalString(const std::optional<std::string>& value) {
  if (!value) {
    return nullptr;
  }
  return *value;
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

unsigned int HttpStatusForError(std::string_view code) {
  if (code == errors::kAuthenticationFailed || code == errors::kUnauthorized) {
    return 401;
  }
  if (code == errors::kLeaderboardNotFound || code == errors::kPlayerNotRanked || code == errors::kNotFound) {
    return 404;
  }
  if (code == errors::kMalformedSubmission || code == errors::kBadRequest) {
    return 400;
  }
  if (code == errors::kSubmissionFailed || code == errors::kStorageUnavailable) {
    return 503;
  }
  if (code == errors::kCancelled) {
    return 499;
  }
  return 500;
}

std::string ToIsoTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

std::string ToIsoTimestamp(std::int64_t timestamp_ms) {
  return ToIsoTimestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(timestamp_ms)));
}

nlohmann::json ToJson(const RankedEntry& entry) {
  return nlohmann::json{{"rank", entry.rank},
                        {"player", entry.player_id},
                        {"playerName", entry.display_name},
                        {"score", entry.value},
                        {"meta", OptionalString(entry.metadata)},
                        {"timestamp", ToIsoTimestamp(entry.timestamp_ms)}};
}

nlohmann::json ToJson(const ScoreEntry& entry) {
  return nlohmann::json{{"player", entry.player_id},
                        {"score", entry.value},
                        {"meta", OptionalString(entry.metadata)},
                        {"timestamp", ToIsoTimestamp(entry.timestamp_ms)},
                        {"sequence", entry.sequence}};
}

nlohmann::json ToJson(const Leaderboard& leaderboard, bool include_secret) {
  nlohmann::json j{{"id", leaderboard.id},
                   {"name", leaderboard.name},
                   {"ordering", ToString(leaderboard.ordering)},
                   {"updatePolicy", ToString(leaderboard.update_policy)},
                   {"createdAt", ToIsoTimestamp(leaderboard.created_at)}};
  if (include_secret) {
    j["key"] = leaderboard.secret;
    j["deleted"] = leaderboard.deleted;
  }
  return j;
}

}  // namespace scoreboard
