/*
 * 설명: OpenSSL 기반 난수 식별자 생성과 HMAC-SHA256 서명 계산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/credentials_test.cpp
 */
#include "scoreboard/credentials.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace scoreboard {
namespace {
int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}
}  // namespace

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

std::string RandomUuid() {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);
  std::string hex = BytesToHex(bytes, sizeof(bytes));
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" +
         hex.substr(20, 12);
}

bool ConstantTimeEquals(const std::string& expected, const std::string& supplied) {
  if (expected.size() != supplied.size()) {
    return false;
  }
  return CRYPTO_memcmp(expected.data(), supplied.data(), expected.size()) == 0;
}

std::string HmacSha256Hex(const std::string& key, const std::string& data) {
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int out_len = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(), out, &out_len)) {
    throw std::runtime_error("HMAC 계산 실패");
  }
  return BytesToHex(out, out_len);
}

std::optional<std::string> UuidBytes(const std::string& text) {
  std::string hex;
  hex.reserve(32);
  if (text.size() == 36) {
    for (std::size_t i = 0; i < text.size(); ++i) {
      bool dash_slot = i == 8 || i == 13 || i == 18 || i == 23;
      if (dash_slot != (text[i] == '-')) {
        return std::nullopt;
      }
      if (!dash_slot) {
        hex.push_back(text[i]);
      }
    }
  } else if (text.size() == 32) {
    hex = text;
  } else {
    return std::nullopt;
  }

  std::string out;
  out.reserve(16);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    int hi = HexValue(hex[i]);
    int lo = HexValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

std::optional<std::string> BuildSignaturePayload(std::uint64_t timestamp_seconds, const std::string& leaderboard_key,
                                                 const std::string& player_id, float score,
                                                 const std::optional<std::string>& metadata) {
  auto key_bytes = UuidBytes(leaderboard_key);
  auto player_bytes = UuidBytes(player_id);
  if (!key_bytes || !player_bytes) {
    return std::nullopt;
  }
  std::string payload;
  for (int i = 0; i < 8; ++i) {
    payload.push_back(static_cast<char>((timestamp_seconds >> (8 * i)) & 0xFF));
  }
  payload += *key_bytes;
  payload += *player_bytes;
  std::uint32_t bits = 0;
  std::memcpy(&bits, &score, sizeof(bits));
  for (int i = 0; i < 4; ++i) {
    payload.push_back(static_cast<char>((bits >> (8 * i)) & 0xFF));
  }
  if (metadata) {
    payload += *metadata;
  }
  return payload;
}

}  // namespace scoreboard
