/*
 * 설명: HTTP 연결을 처리하고 점수 제출/조회/관리 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_api_test.cpp, server/tests/e2e/admin_ops_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "scoreboard/config.hpp"
#include "scoreboard/leaderboard_registry.hpp"
#include "scoreboard/observability.hpp"
#include "scoreboard/player_directory.hpp"
#include "scoreboard/query_service.hpp"
#include "scoreboard/ranking_engine.hpp"
#include "scoreboard/submission_gateway.hpp"

namespace scoreboard {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<LeaderboardRegistry> registry, std::shared_ptr<PlayerDirectory> players,
              std::shared_ptr<SubmissionGateway> gateway, std::shared_ptr<QueryService> query_service, std::shared_ptr<RankingEngine> engine,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;
  using QueryParams = std::unordered_map<std::string, std::string>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleSubmit(const std::string& leaderboard_id, std::shared_ptr<Response> res);
  void HandleScoreQuery(const std::vector<std::string>& segments, const QueryParams& params,
                        std::shared_ptr<Response> res);
  void HandleAdmin(const std::vector<std::string>& segments, const QueryParams& params,
                   std::shared_ptr<Response> res);
  void Reply(std::shared_ptr<Response> res, boost::beast::http::status status, const nlohmann::json& data);
  void ReplyError(std::shared_ptr<Response> res, std::string_view code, std::string_view message);
  void SendResponse(std::shared_ptr<Response> res);
  void Abandon();

  bool IsOperator() const;
  std::optional<std::string> ExtractLeaderboardKey() const;
  // 요청 본문을 모두 읽은 뒤 상대가 연결을 닫았는지 비차단 peek으로 확인한다.
  bool PeerClosed();
  std::string ParseBearer(const std::string& header_value) const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<LeaderboardRegistry> registry_;
  std::shared_ptr<PlayerDirectory> players_;
  std::shared_ptr<SubmissionGateway> gateway_;
  std::shared_ptr<QueryService> query_service_;
  std::shared_ptr<RankingEngine> engine_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<std::string> log_leaderboard_id_;
};

}  // namespace scoreboard
