/*
 * 설명: 리더보드 레지스트리 레코드를 MariaDB leaderboards 테이블에 저장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "scoreboard/db_client.hpp"
#include "scoreboard/leaderboard_registry.hpp"

namespace scoreboard {

class MariaDbLeaderboardRepository : public LeaderboardRepository {
 public:
  explicit MariaDbLeaderboardRepository(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema() const;

  std::vector<Leaderboard> LoadAll() const override;
  void Insert(const Leaderboard& leaderboard) override;
  void Update(const Leaderboard& leaderboard) override;

  void ClearAll() const;

 private:
  Leaderboard BuildRecord(MYSQL_ROW row) const;
  std::string ToTimestamp(const std::chrono::system_clock::time_point& tp) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace scoreboard
