/*
 * 설명: 리더보드 식별자/비밀키 발급, 상수 시간 비교, HMAC 서명 검증 보조 함수를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/credentials_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace scoreboard {

std::string BytesToHex(const unsigned char* data, std::size_t len);
std::string RandomHex(std::size_t bytes);

// 128비트 난수를 8-4-4-4-12 형식의 소문자 UUID(v4) 문자열로 만든다.
std::string RandomUuid();

bool ConstantTimeEquals(const std::string& expected, const std::string& supplied);

std::string HmacSha256Hex(const std::string& key, const std::string& data);

// 하이픈 포함 36자 또는 32자 16진 UUID를 16바이트 원시 값으로 바꾼다. 형식이 틀리면 nullopt.
std::optional<std::string> UuidBytes(const std::string& text);

// 서명 대상: timestamp(u64 LE) || 리더보드 비밀키(16B) || player_id(16B) || score(f32 LE) || metadata
// 비밀키나 player_id가 UUID가 아니면 nullopt. HMAC 키는 플레이어 키의 16바이트 값이다.
std::optional<std::string> BuildSignaturePayload(std::uint64_t timestamp_seconds, const std::string& leaderboard_key,
                                                 const std::string& player_id, float score,
                                                 const std::optional<std::string>& metadata);

}  // namespace scoreboard
