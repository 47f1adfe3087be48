/*
 * 설명: MariaDB에 점수 이력과 현재 엔트리 플래그를 저장하는 점수 저장소.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "scoreboard/db_client.hpp"
#include "scoreboard/score_store.hpp"

namespace scoreboard {

class MariaDbScoreStore : public ScoreStore {
 public:
  explicit MariaDbScoreStore(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema() const;

  PutResult Put(const Leaderboard& leaderboard, const PutRequest& request) override;
  std::optional<ScoreEntry> GetCurrent(const std::string& leaderboard_id,
                                       const std::string& player_id) const override;
  std::vector<ScoreEntry> History(const std::string& leaderboard_id, const std::string& player_id) const override;
  std::vector<PlayerScore> CurrentEntries(const std::string& leaderboard_id) const override;
  std::optional<std::string> DisplayName(const std::string& leaderboard_id,
                                         const std::string& player_id) const override;

  void ClearAll() const;

 private:
  std::optional<ScoreEntry> SelectCurrent(MYSQL* conn, const std::string& leaderboard_id,
                                          const std::string& player_id, bool for_update) const;
  std::uint64_t InsertEntry(MYSQL* conn, const std::string& leaderboard_id, const ScoreEntry& entry,
                            bool is_current) const;
  ScoreEntry BuildEntry(const std::string& player_id, MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace scoreboard
