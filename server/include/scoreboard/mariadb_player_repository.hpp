/*
 * 설명: 발급한 플레이어 계정(ID, 서명 키, 이름)을 MariaDB player_accounts 테이블에 저장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "scoreboard/db_client.hpp"
#include "scoreboard/player_directory.hpp"

namespace scoreboard {

class MariaDbPlayerRepository : public PlayerRepository {
 public:
  explicit MariaDbPlayerRepository(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema() const;

  std::optional<PlayerAccount> Find(const std::string& player_id) const override;
  void Insert(const PlayerAccount& account) override;

  void ClearAll() const;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace scoreboard
