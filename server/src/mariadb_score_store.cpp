/*
 * 설명: MariaDB 점수 저장소를 구현한다. Put은 플레이어 행 잠금 아래 단일 트랜잭션으로 커밋된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "scoreboard/mariadb_score_store.hpp"

#include <iomanip>
#include <limits>
#include <sstream>

namespace scoreboard {
namespace {
std::string FormatDouble(double value) {
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
  return oss.str();
}

double ToDouble(const char* value) { return value ? std::stod(value) : 0.0; }
std::int64_t ToInt64(const char* value) { return value ? std::stoll(value) : 0; }
std::uint64_t ToUint64(const char* value) { return value ? std::stoull(value) : 0; }
}  // namespace

MariaDbScoreStore::MariaDbScoreStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void MariaDbScoreStore::EnsureSchema() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Query(conn,
                      "CREATE TABLE IF NOT EXISTS players ("
                      "leaderboard_id VARCHAR(64) NOT NULL, "
                      "player_id VARCHAR(128) NOT NULL, "
                      "display_name VARCHAR(128) NOT NULL, "
                      "created_at DATETIME(6) NOT NULL, "
                      "PRIMARY KEY (leaderboard_id, player_id)) ENGINE=InnoDB;",
                      "players 테이블 생성 실패");
    db_client_->Query(conn,
                      "CREATE TABLE IF NOT EXISTS score_entries ("
                      "seq BIGINT UNSIGNED NOT NULL AUTO_INCREMENT PRIMARY KEY, "
                      "leaderboard_id VARCHAR(64) NOT NULL, "
                      "player_id VARCHAR(128) NOT NULL, "
                      "value DOUBLE NOT NULL, "
                      "ts_ms BIGINT NOT NULL, "
                      "metadata TEXT NULL, "
                      "is_current TINYINT(1) NOT NULL DEFAULT 0, "
                      "superseded TINYINT(1) NOT NULL DEFAULT 0, "
                      "KEY idx_player (leaderboard_id, player_id), "
                      "KEY idx_current (leaderboard_id, is_current)) ENGINE=InnoDB;",
                      "score_entries 테이블 생성 실패");
  });
}

PutResult MariaDbScoreStore::Put(const Leaderboard& leaderboard, const PutRequest& request) {
  PutResult result;
  db_client_->ExecuteTransaction([&](MYSQL* conn) {
    std::string lb = db_client_->Escape(conn, leaderboard.id);
    std::string player = db_client_->Escape(conn, request.player_id);
    std::string initial_name = request.display_name.empty() ? request.player_id : request.display_name;
    std::string name_expr = request.display_name.empty() ? "display_name" : "VALUES(display_name)";

    // 플레이어 행을 보장하고 잠가 같은 플레이어의 동시 Put을 직렬화한다.
    std::ostringstream upsert;
    upsert << "INSERT INTO players(leaderboard_id, player_id, display_name, created_at) VALUES ('" << lb << "', '"
           << player << "', '" << db_client_->Escape(conn, initial_name)
           << "', NOW(6)) ON DUPLICATE KEY UPDATE display_name = " << name_expr << ";";
    db_client_->Query(conn, upsert.str(), "플레이어 보장 실패");

    std::ostringstream lock_sql;
    lock_sql << "SELECT display_name FROM players WHERE leaderboard_id='" << lb << "' AND player_id='" << player
             << "' FOR UPDATE;";
    auto name_res = db_client_->QueryResult(conn, lock_sql.str(), "플레이어 잠금 실패");
    MYSQL_ROW name_row = mysql_fetch_row(name_res.get());
    result.display_name = name_row && name_row[0] ? name_row[0] : initial_name;

    result.previous = SelectCurrent(conn, leaderboard.id, request.player_id, true);
    ScoreEntry candidate{request.player_id, request.value, request.timestamp_ms, request.metadata, 0};
    result.decision = DecideUpdate(leaderboard.update_policy, leaderboard.ordering, result.previous, candidate);

    if (ReplacesCurrent(result.decision) && result.previous) {
      std::ostringstream demote;
      demote << "UPDATE score_entries SET is_current=0"
             << (AppendsHistory(result.decision) ? "" : ", superseded=1") << " WHERE leaderboard_id='" << lb
             << "' AND player_id='" << player << "' AND is_current=1;";
      db_client_->Query(conn, demote.str(), "현재 엔트리 강등 실패");
    }

    switch (result.decision) {
      case UpdateDecision::kReplace:
      case UpdateDecision::kAppendAndReplace:
        candidate.sequence = InsertEntry(conn, leaderboard.id, candidate, true);
        result.current = candidate;
        result.changed = true;
        break;
      case UpdateDecision::kAppendAndRetain:
        candidate.sequence = InsertEntry(conn, leaderboard.id, candidate, false);
        result.current = *result.previous;
        result.changed = false;
        break;
      case UpdateDecision::kRetain:
        result.current = *result.previous;
        result.changed = false;
        break;
    }
    return true;
  });
  return result;
}

std::optional<ScoreEntry> MariaDbScoreStore::GetCurrent(const std::string& leaderboard_id,
                                                        const std::string& player_id) const {
  std::optional<ScoreEntry> result;
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) { result = SelectCurrent(conn, leaderboard_id, player_id, false); });
  return result;
}

std::vector<ScoreEntry> MariaDbScoreStore::History(const std::string& leaderboard_id,
                                                   const std::string& player_id) const {
  std::vector<ScoreEntry> entries;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    entries.clear();
    std::ostringstream oss;
    oss << "SELECT seq, value, ts_ms, metadata FROM score_entries WHERE leaderboard_id='"
        << db_client_->Escape(conn, leaderboard_id) << "' AND player_id='" << db_client_->Escape(conn, player_id)
        << "' AND superseded=0 ORDER BY seq ASC;";
    auto res = db_client_->QueryResult(conn, oss.str(), "이력 조회 실패");
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res.get())) != nullptr) {
      entries.push_back(BuildEntry(player_id, row));
    }
  });
  return entries;
}

std::vector<PlayerScore> MariaDbScoreStore::CurrentEntries(const std::string& leaderboard_id) const {
  std::vector<PlayerScore> entries;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    entries.clear();
    std::ostringstream oss;
    oss << "SELECT e.seq, e.value, e.ts_ms, e.metadata, e.player_id, p.display_name FROM score_entries e "
        << "JOIN players p ON p.leaderboard_id = e.leaderboard_id AND p.player_id = e.player_id "
        << "WHERE e.leaderboard_id='" << db_client_->Escape(conn, leaderboard_id) << "' AND e.is_current=1;";
    auto res = db_client_->QueryResult(conn, oss.str(), "현재 엔트리 목록 조회 실패");
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res.get())) != nullptr) {
      std::string player_id = row[4] ? row[4] : "";
      std::string display_name = row[5] ? row[5] : player_id;
      entries.push_back(PlayerScore{display_name, BuildEntry(player_id, row)});
    }
  });
  return entries;
}

std::optional<std::string> MariaDbScoreStore::DisplayName(const std::string& leaderboard_id,
                                                          const std::string& player_id) const {
  std::optional<std::string> name;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT display_name FROM players WHERE leaderboard_id='" << db_client_->Escape(conn, leaderboard_id)
        << "' AND player_id='" << db_client_->Escape(conn, player_id) << "';";
    auto res = db_client_->QueryResult(conn, oss.str(), "표시 이름 조회 실패");
    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (row && row[0]) {
      name = std::string(row[0]);
    }
  });
  return name;
}

void MariaDbScoreStore::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Query(conn, "DELETE FROM score_entries;", "점수 초기화 실패");
    db_client_->Query(conn, "DELETE FROM players;", "플레이어 초기화 실패");
  });
}

std::optional<ScoreEntry> MariaDbScoreStore::SelectCurrent(MYSQL* conn, const std::string& leaderboard_id,
                                                           const std::string& player_id, bool for_update) const {
  std::ostringstream oss;
  oss << "SELECT seq, value, ts_ms, metadata FROM score_entries WHERE leaderboard_id='"
      << db_client_->Escape(conn, leaderboard_id) << "' AND player_id='" << db_client_->Escape(conn, player_id)
      << "' AND is_current=1" << (for_update ? " FOR UPDATE;" : ";");
  auto res = db_client_->QueryResult(conn, oss.str(), "현재 엔트리 조회 실패");
  MYSQL_ROW row = mysql_fetch_row(res.get());
  if (!row) {
    return std::nullopt;
  }
  return BuildEntry(player_id, row);
}

std::uint64_t MariaDbScoreStore::InsertEntry(MYSQL* conn, const std::string& leaderboard_id, const ScoreEntry& entry,
                                             bool is_current) const {
  std::ostringstream oss;
  oss << "INSERT INTO score_entries(leaderboard_id, player_id, value, ts_ms, metadata, is_current) VALUES ('"
      << db_client_->Escape(conn, leaderboard_id) << "', '" << db_client_->Escape(conn, entry.player_id) << "', "
      << FormatDouble(entry.value) << ", " << entry.timestamp_ms << ", ";
  if (entry.metadata) {
    oss << "'" << db_client_->Escape(conn, *entry.metadata) << "'";
  } else {
    oss << "NULL";
  }
  oss << ", " << (is_current ? 1 : 0) << ");";
  db_client_->Query(conn, oss.str(), "점수 저장 실패");
  return static_cast<std::uint64_t>(mysql_insert_id(conn));
}

ScoreEntry MariaDbScoreStore::BuildEntry(const std::string& player_id, MYSQL_ROW row) const {
  ScoreEntry entry;
  entry.player_id = player_id;
  entry.sequence = ToUint64(row[0]);
  entry.value = ToDouble(row[1]);
  entry.timestamp_ms = ToInt64(row[2]);
  if (row[3]) {
    entry.metadata = std::string(row[3]);
  }
  return entry;
}

}  // namespace scoreboard
