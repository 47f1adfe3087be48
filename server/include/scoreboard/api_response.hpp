/*
 * 설명: REST 응답 엔벨로프 생성과 도메인 타입의 JSON 변환, 오류 코드 → HTTP 상태 매핑을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "scoreboard/leaderboard.hpp"
#include "scoreboard/rank_index.hpp"

namespace scoreboard {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

// 알 수 없는 코드는 500으로 매핑한다.
unsigned int HttpStatusForError(std::string_view code);

std::string ToIsoTimestamp(std::int64_t timestamp_ms);
std::string ToIsoTimestamp(std::chrono::system_clock::time_point tp);

nlohmann::json ToJson(const RankedEntry& entry);
nlohmann::json ToJson(const ScoreEntry& entry);
// include_secret이 false이면 공개 메타데이터만 담는다.
nlohmann::json ToJson(const Leaderboard& leaderboard, bool include_secret);

}  // namespace scoreboard
