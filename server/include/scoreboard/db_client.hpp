/*
 * 설명: MariaDB 연결, 단일 시도 트랜잭션 및 읽기 재시도 정책을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include <mariadb/mysql.h>

#include "scoreboard/retry_policy.hpp"
#include "scoreboard/storage_error.hpp"

namespace scoreboard {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

struct ResultDeleter {
  void operator()(MYSQL_RES* res) const { mysql_free_result(res); }
};
using ResultPtr = std::unique_ptr<MYSQL_RES, ResultDeleter>;

class MariaDbClient {
 public:
  MariaDbClient(const DbConfig& config, const RetryPolicy& read_retry);

  // 트랜잭션을 한 번만 시도한다. 실패 시 롤백 후 DbException(또는 StorageUnavailable)을 던진다.
  bool ExecuteTransaction(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  ResultPtr QueryResult(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);
  // true를 돌려주면 커밋이 끝난 뒤 응답을 잃어버린 것처럼 CommitOutcomeUnknown을 던진다.
  void SetCommitLossInjector(const std::function<bool()>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  struct ConnectionDeleter {
    void operator()(MYSQL* conn) const { mysql_close(conn); }
  };
  using ConnectionPtr = std::unique_ptr<MYSQL, ConnectionDeleter>;

  ConnectionPtr Connect() const;
  bool IsRetryable(unsigned int code) const;

  DbConfig config_;
  RetryPolicy read_retry_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
  std::function<bool()> commit_loss_injector_;
};

}  // namespace scoreboard
