/*
 * 설명: 리더보드 레코드의 MariaDB 저장/적재를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "scoreboard/mariadb_leaderboard_repository.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace scoreboard {
namespace {
std::chrono::system_clock::time_point ParseTimestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}
}  // namespace

MariaDbLeaderboardRepository::MariaDbLeaderboardRepository(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

void MariaDbLeaderboardRepository::EnsureSchema() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Query(conn,
                      "CREATE TABLE IF NOT EXISTS leaderboards ("
                      "id VARCHAR(64) NOT NULL PRIMARY KEY, "
                      "secret VARCHAR(64) NOT NULL, "
                      "name VARCHAR(128) NOT NULL, "
                      "ordering VARCHAR(32) NOT NULL, "
                      "update_policy VARCHAR(32) NOT NULL, "
                      "deleted TINYINT(1) NOT NULL DEFAULT 0, "
                      "created_at DATETIME NOT NULL) ENGINE=InnoDB;",
                      "leaderboards 테이블 생성 실패");
  });
}

std::vector<Leaderboard> MariaDbLeaderboardRepository::LoadAll() const {
  std::vector<Leaderboard> out;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    out.clear();
    auto res = db_client_->QueryResult(
        conn, "SELECT id, secret, name, ordering, update_policy, deleted, created_at FROM leaderboards;",
        "리더보드 적재 실패");
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res.get())) != nullptr) {
      out.push_back(BuildRecord(row));
    }
  });
  return out;
}

void MariaDbLeaderboardRepository::Insert(const Leaderboard& leaderboard) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO leaderboards(id, secret, name, ordering, update_policy, deleted, created_at) VALUES ('"
        << db_client_->Escape(conn, leaderboard.id) << "', '" << db_client_->Escape(conn, leaderboard.secret)
        << "', '" << db_client_->Escape(conn, leaderboard.name) << "', '" << ToString(leaderboard.ordering) << "', '"
        << ToString(leaderboard.update_policy) << "', " << (leaderboard.deleted ? 1 : 0) << ", '"
        << ToTimestamp(leaderboard.created_at) << "');";
    db_client_->Query(conn, oss.str(), "리더보드 저장 실패");
  });
}

void MariaDbLeaderboardRepository::Update(const Leaderboard& leaderboard) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE leaderboards SET secret='" << db_client_->Escape(conn, leaderboard.secret) << "', name='"
        << db_client_->Escape(conn, leaderboard.name) << "', deleted=" << (leaderboard.deleted ? 1 : 0)
        << " WHERE id='" << db_client_->Escape(conn, leaderboard.id) << "';";
    db_client_->Query(conn, oss.str(), "리더보드 갱신 실패");
  });
}

void MariaDbLeaderboardRepository::ClearAll() const {
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) { db_client_->Query(conn, "DELETE FROM leaderboards;", "리더보드 초기화 실패"); });
}

Leaderboard MariaDbLeaderboardRepository::BuildRecord(MYSQL_ROW row) const {
  Leaderboard leaderboard;
  leaderboard.id = row[0] ? row[0] : "";
  leaderboard.secret = row[1] ? row[1] : "";
  leaderboard.name = row[2] ? row[2] : "";
  leaderboard.ordering = ParseOrdering(row[3] ? row[3] : "").value_or(Ordering::kHigherIsBetter);
  leaderboard.update_policy = ParseUpdatePolicy(row[4] ? row[4] : "").value_or(UpdatePolicy::kKeepBest);
  leaderboard.deleted = row[5] && std::string(row[5]) != "0";
  leaderboard.created_at = ParseTimestamp(row[6] ? row[6] : "1970-01-01 00:00:00");
  return leaderboard;
}

std::string MariaDbLeaderboardRepository::ToTimestamp(const std::chrono::system_clock::time_point& tp) const {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

}  // namespace scoreboard
