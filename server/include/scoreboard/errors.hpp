/*
 * 설명: API 엔벨로프의 error.code로 노출되는 오류 코드 상수를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

namespace scoreboard {
namespace errors {

inline constexpr char kAuthenticationFailed[] = "authentication_failed";
inline constexpr char kLeaderboardNotFound[] = "leaderboard_not_found";
inline constexpr char kMalformedSubmission[] = "malformed_submission";
inline constexpr char kSubmissionFailed[] = "submission_failed";
inline constexpr char kCancelled[] = "cancelled";
inline constexpr char kPlayerNotRanked[] = "player_not_ranked";
inline constexpr char kBadRequest[] = "bad_request";
inline constexpr char kUnauthorized[] = "unauthorized";
inline constexpr char kNotFound[] = "not_found";
inline constexpr char kStorageUnavailable[] = "storage_unavailable";

}  // namespace errors
}  // namespace scoreboard
