/*
 * 설명: MariaDB 연결과 트랜잭션/재시도 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "scoreboard/db_client.hpp"

#include <mariadb/errmsg.h>

namespace scoreboard {
namespace {
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config, const RetryPolicy& read_retry)
    : config_(config), read_retry_(read_retry) {}

MariaDbClient::ConnectionPtr MariaDbClient::Connect() const {
  ConnectionPtr conn(mysql_init(nullptr));
  if (!conn) {
    throw StorageUnavailable("MariaDB 초기화 실패");
  }
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  if (!mysql_real_connect(conn.get(), config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn.get(), "연결 실패");
  }
  Query(conn.get(), "SET SESSION innodb_lock_wait_timeout=2;", "락 대기 타임아웃 설정 실패");
  return conn;
}

bool MariaDbClient::ExecuteTransaction(const std::function<bool(MYSQL*)>& work) const {
  ConnectionPtr conn = Connect();
  try {
    mysql_autocommit(conn.get(), 0);
    if (transient_injector_ && transient_injector_(1)) {
      throw StorageUnavailable("주입된 일시 오류", kDeadlock);
    }
    bool commit = work(conn.get());
    if (commit) {
      if (mysql_commit(conn.get()) != 0) {
        throw CommitOutcomeUnknown(std::string("커밋 응답 없음: ") + mysql_error(conn.get()), mysql_errno(conn.get()));
      }
      if (commit_loss_injector_ && commit_loss_injector_()) {
        throw CommitOutcomeUnknown("주입된 커밋 응답 유실", CR_SERVER_LOST);
      }
    } else {
      mysql_rollback(conn.get());
    }
    return commit;
  } catch (...) {
    mysql_rollback(conn.get());
    throw;
  }
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  for (std::size_t attempt = 1; attempt <= read_retry_.max_attempts; ++attempt) {
    try {
      ConnectionPtr conn = Connect();
      if (transient_injector_ && transient_injector_(attempt)) {
        throw StorageUnavailable("주입된 일시 오류", kDeadlock);
      }
      work(conn.get());
      return;
    } catch (const DbException& ex) {
      if (ex.retryable && attempt < read_retry_.max_attempts) {
        SleepBackoff(read_retry_, attempt);
        continue;
      }
      throw;
    }
  }
}

void MariaDbClient::Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
}

ResultPtr MariaDbClient::QueryResult(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  Query(conn, sql, ctx);
  ResultPtr res(mysql_store_result(conn));
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  return res;
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  std::string message = ctx + ": " + mysql_error(conn);
  if (IsRetryable(code)) {
    throw StorageUnavailable(message, code);
  }
  throw DbException(message, code, false);
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_CONNECTION_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

void MariaDbClient::SetCommitLossInjector(const std::function<bool()>& injector) {
  commit_loss_injector_ = injector;
}

}  // namespace scoreboard
