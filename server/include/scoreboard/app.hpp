/*
 * 설명: 서버 전체 수명주기와 저장소/레지스트리/엔진/게이트웨이 구성을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_api_test.cpp, server/tests/e2e/admin_ops_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "scoreboard/config.hpp"
#include "scoreboard/db_client.hpp"
#include "scoreboard/leaderboard_registry.hpp"
#include "scoreboard/mariadb_player_repository.hpp"
#include "scoreboard/observability.hpp"
#include "scoreboard/player_directory.hpp"
#include "scoreboard/query_service.hpp"
#include "scoreboard/ranking_engine.hpp"
#include "scoreboard/score_store.hpp"
#include "scoreboard/submission_gateway.hpp"

namespace scoreboard {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  // 스키마 준비, 레지스트리 로드, 인덱스 복구 후 요청을 받기 시작한다. 종료될 때까지 반환하지 않는다.
  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<LeaderboardRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<PlayerDirectory> GetPlayers() { return players_; }
  std::shared_ptr<ScoreStore> GetStore() { return store_; }
  std::shared_ptr<RankingEngine> GetEngine() { return engine_; }
  std::shared_ptr<SubmissionGateway> GetGateway() { return gateway_; }
  std::shared_ptr<QueryService> GetQueryService() { return query_service_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void Initialize();
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<ScoreStore> store_;
  std::shared_ptr<LeaderboardRepository> repository_;
  std::shared_ptr<LeaderboardRegistry> registry_;
  std::shared_ptr<MariaDbPlayerRepository> player_repository_;
  std::shared_ptr<PlayerDirectory> players_;
  std::shared_ptr<RankingEngine> engine_;
  std::shared_ptr<SubmissionGateway> gateway_;
  std::shared_ptr<QueryService> query_service_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace scoreboard
