/*
 * 설명: 서버 수명주기, 저장소 백엔드 선택, 시작 시 인덱스 복구와 리스닝 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_api_test.cpp, server/tests/e2e/admin_ops_test.cpp
 */
#include "scoreboard/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "scoreboard/http_session.hpp"
#include "scoreboard/mariadb_leaderboard_repository.hpp"
#include "scoreboard/mariadb_score_store.hpp"
#include "scoreboard/memory_score_store.hpp"

namespace scoreboard {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<LeaderboardRegistry> registry, std::shared_ptr<PlayerDirectory> players,
           std::shared_ptr<SubmissionGateway> gateway, std::shared_ptr<QueryService> query_service,
           std::shared_ptr<RankingEngine> engine, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), registry_(std::move(registry)),
        players_(std::move(players)), gateway_(std::move(gateway)), query_service_(std::move(query_service)), engine_(std::move(engine)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->registry_, self->players_,
                                          self->gateway_, self->query_service_, self->engine_,
                                          self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<LeaderboardRegistry> registry_;
  std::shared_ptr<PlayerDirectory> players_;
  std::shared_ptr<SubmissionGateway> gateway_;
  std::shared_ptr<QueryService> query_service_;
  std::shared_ptr<RankingEngine> engine_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  auto level = ParseLogLevel(config.log_level);
  observability_ = std::make_shared<Observability>(level ? *level : LogLevel::kInfo);

  RetryPolicy retry;
  retry.max_attempts = std::max<std::size_t>(1, config.submit_retry_max_attempts);
  retry.base_delay = std::chrono::milliseconds(config.submit_retry_base_ms);
  retry.max_delay = std::chrono::milliseconds(std::max(config.submit_retry_max_ms, config.submit_retry_base_ms));

  if (config.store_backend == "memory") {
    store_ = std::make_shared<MemoryScoreStore>();
    registry_ = std::make_shared<LeaderboardRegistry>();
    players_ = std::make_shared<PlayerDirectory>();
  } else {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    db_client_ = std::make_shared<MariaDbClient>(db_config, retry);
    store_ = std::make_shared<MariaDbScoreStore>(db_client_);
    repository_ = std::make_shared<MariaDbLeaderboardRepository>(db_client_);
    registry_ = std::make_shared<LeaderboardRegistry>(repository_);
    player_repository_ = std::make_shared<MariaDbPlayerRepository>(db_client_);
    players_ = std::make_shared<PlayerDirectory>(player_repository_);
  }

  engine_ = std::make_shared<RankingEngine>(store_, observability_);

  SubmissionLimits limits;
  limits.max_signature_skew_seconds = config.signature_max_skew_seconds;
  gateway_ = std::make_shared<SubmissionGateway>(registry_, players_, store_, engine_, observability_, retry, limits);

  QueryLimits query_limits;
  query_limits.max_limit = std::max<std::size_t>(1, config.query_max_limit);
  query_limits.default_limit = std::min(query_limits.default_limit, query_limits.max_limit);
  query_limits.max_window = config.query_max_window;
  query_limits.default_window = std::min(query_limits.default_window, query_limits.max_window);
  query_limits.require_key = config.query_require_key;
  query_service_ = std::make_shared<QueryService>(registry_, store_, engine_, observability_, query_limits);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Initialize() {
  if (db_client_) {
    std::static_pointer_cast<MariaDbLeaderboardRepository>(repository_)->EnsureSchema();
    std::static_pointer_cast<MariaDbScoreStore>(store_)->EnsureSchema();
    player_repository_->EnsureSchema();
  }
  auto loaded = registry_->Load();
  auto recovered = engine_->RecoverAll(registry_->List(false));
  observability_->Log(LogContext{"", "server.recovered", 0, std::nullopt, std::nullopt,
                                 "leaderboards=" + std::to_string(loaded) + " indexes=" + std::to_string(recovered),
                                 LogLevel::kInfo});
}

void ServerApp::Run() {
  try {
    running_ = true;
    Initialize();
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, registry_, players_, gateway_, query_service_,
                                           engine_, observability_);
    listener_->Run();
    std::cout << "서버 시작: 포트 " << config_.port << " (저장소: " << config_.store_backend << ")\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.store_backend = get_env("STORE_BACKEND", "mariadb");
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ops_token = get_env("OPS_TOKEN", "");
  cfg.submit_retry_max_attempts = static_cast<std::size_t>(std::stoul(get_env("SUBMIT_RETRY_MAX_ATTEMPTS", "3")));
  cfg.submit_retry_base_ms = static_cast<std::size_t>(std::stoul(get_env("SUBMIT_RETRY_BASE_MS", "50")));
  cfg.submit_retry_max_ms = static_cast<std::size_t>(std::stoul(get_env("SUBMIT_RETRY_MAX_MS", "1000")));
  cfg.query_max_limit = static_cast<std::size_t>(std::stoul(get_env("QUERY_MAX_LIMIT", "100")));
  cfg.query_max_window = static_cast<std::size_t>(std::stoul(get_env("QUERY_MAX_WINDOW", "50")));
  cfg.query_require_key = get_env("QUERY_REQUIRE_KEY", "false") == "true";
  cfg.signature_max_skew_seconds = std::stoll(get_env("SIGNATURE_MAX_SKEW_SECONDS", "300"));
  return cfg;
}

}  // namespace scoreboard
