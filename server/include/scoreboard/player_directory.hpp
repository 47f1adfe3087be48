/*
 * 설명: 플레이어 ID/서명 키 발급과 서명 제출 검증을 담당하는 플레이어 디렉터리.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/player_directory_test.cpp, server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace scoreboard {

// key는 클라이언트가 서명 HMAC 키로 쓰는 UUID다. 발급 응답에서만 노출된다.
struct PlayerAccount {
  std::string id;
  std::string key;
  std::string name;
  std::chrono::system_clock::time_point created_at{};
};

class PlayerRepository {
 public:
  virtual ~PlayerRepository() = default;

  virtual std::optional<PlayerAccount> Find(const std::string& player_id) const = 0;
  virtual void Insert(const PlayerAccount& account) = 0;
};

// "Adjective Noun NNN" 형식
std::string RandomPlayerName();

class PlayerDirectory {
 public:
  // repository가 nullptr이면 메모리에만 보관한다.
  explicit PlayerDirectory(std::shared_ptr<PlayerRepository> repository = nullptr);

  PlayerAccount Issue(const std::optional<std::string>& requested_name);
  std::optional<PlayerAccount> Find(const std::string& player_id) const;

  // payload에 대한 HMAC-SHA256을 플레이어 키(16바이트)로 계산해 비교한다. 대소문자는 구분하지 않는다.
  bool VerifySignature(const std::string& player_id, const std::string& payload,
                       const std::string& supplied_mac_hex) const;

 private:
  std::shared_ptr<PlayerRepository> repository_;
  mutable std::unordered_map<std::string, PlayerAccount> accounts_;
  mutable std::shared_mutex mutex_;
};

}  // namespace scoreboard
