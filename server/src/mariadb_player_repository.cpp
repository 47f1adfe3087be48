/*
 * 설명: 플레이어 계정의 MariaDB 저장/조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "scoreboard/mariadb_player_repository.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <mariadb/mysql.h>

namespace scoreboard {
namespace {
std::string ToTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::chrono::system_clock::time_point ParseTimestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}
}  // namespace

MariaDbPlayerRepository::MariaDbPlayerRepository(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

void MariaDbPlayerRepository::EnsureSchema() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Query(conn,
                      "CREATE TABLE IF NOT EXISTS player_accounts ("
                      "id VARCHAR(64) NOT NULL PRIMARY KEY, "
                      "player_key VARCHAR(64) NOT NULL, "
                      "name VARCHAR(128) NOT NULL, "
                      "created_at DATETIME NOT NULL) ENGINE=InnoDB;",
                      "player_accounts 테이블 생성 실패");
  });
}

std::optional<PlayerAccount> MariaDbPlayerRepository::Find(const std::string& player_id) const {
  std::optional<PlayerAccount> out;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    out.reset();
    auto res = db_client_->QueryResult(conn,
                                       "SELECT id, player_key, name, created_at FROM player_accounts WHERE id='" +
                                           db_client_->Escape(conn, player_id) + "';",
                                       "플레이어 조회 실패");
    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (row) {
      PlayerAccount account;
      account.id = row[0] ? row[0] : "";
      account.key = row[1] ? row[1] : "";
      account.name = row[2] ? row[2] : "";
      account.created_at = ParseTimestamp(row[3] ? row[3] : "1970-01-01 00:00:00");
      out = account;
    }
  });
  return out;
}

void MariaDbPlayerRepository::Insert(const PlayerAccount& account) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO player_accounts(id, player_key, name, created_at) VALUES ('"
        << db_client_->Escape(conn, account.id) << "', '" << db_client_->Escape(conn, account.key) << "', '"
        << db_client_->Escape(conn, account.name) << "', '" << ToTimestamp(account.created_at) << "');";
    db_client_->Query(conn, oss.str(), "플레이어 저장 실패");
  });
}

void MariaDbPlayerRepository::ClearAll() const {
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) { db_client_->Query(conn, "DELETE FROM player_accounts;", "플레이어 초기화 실패"); });
}

}  // namespace scoreboard
