/*
 * 설명: HTTP 요청을 처리하고 제출/조회/플레이어 발급/관리/운영 경로를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_api_test.cpp, server/tests/e2e/admin_ops_test.cpp
 */
#include "scoreboard/http_session.hpp"

#include <stdexcept>

#include <boost/beast/version.hpp>

#include "scoreboard/api_response.hpp"
#include "scoreboard/errors.hpp"
#include "scoreboard/storage_error.hpp"

namespace scoreboard {

namespace {
constexpr char kApiPrefix[] = "/api/v1/";

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos && eq + 1 <= pair.size()) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<std::size_t> ParsePositiveInt(const std::string& value) {
  if (value.empty() || value.front() == '-' || value.front() == '+') {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    auto parsed = std::stoul(value, &idx);
    if (idx != value.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos <= path.size()) {
    auto slash = path.find('/', pos);
    std::string segment = path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    if (!segment.empty()) {
      segments.push_back(segment);
    }
    if (slash == std::string::npos) {
      break;
    }
    pos = slash + 1;
  }
  return segments;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

// 허용되지 않는 매개변수 값은 invalid로 표시한다.
void ParseSizeParam(const std::unordered_map<std::string, std::string>& params, const std::string& key,
                    std::size_t& dest, bool& invalid) {
  auto it = params.find(key);
  if (it == params.end()) {
    return;
  }
  auto parsed = ParsePositiveInt(it->second);
  if (!parsed) {
    invalid = true;
    return;
  }
  dest = *parsed;
}

nlohmann::json ToJsonArray(const std::vector<RankedEntry>& entries) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& entry : entries) {
    out.push_back(ToJson(entry));
  }
  return out;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<LeaderboardRegistry> registry, std::shared_ptr<PlayerDirectory> players,
                         std::shared_ptr<SubmissionGateway> gateway, std::shared_ptr<QueryService> query_service,
                         std::shared_ptr<RankingEngine> engine, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), registry_(std::move(registry)), players_(std::move(players)),
      gateway_(std::move(gateway)),
      query_service_(std::move(query_service)), engine_(std::move(engine)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  log_leaderboard_id_.reset();
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "scoreboard-server");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }
  auto params = ParseQueryParams(query);

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return Reply(res, http::status::ok, payload);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"submissions",
                         {{"accepted", snapshot.submissions_accepted},
                          {"rejected", snapshot.submissions_rejected},
                          {"failed", snapshot.submissions_failed}}},
                        {"storage", {{"retries", snapshot.storage_retries}}},
                        {"index",
                         {{"rebuilds", snapshot.index_rebuilds},
                          {"inconsistencies", snapshot.index_inconsistencies}}},
                        {"queries", {{"served", snapshot.queries_served}}}};
    return Reply(res, http::status::ok, data);
  }

  if (req_.method() == http::verb::get && path == "/ops/status") {
    if (!IsOperator()) {
      return ReplyError(res, errors::kUnauthorized, "운영 토큰이 올바르지 않습니다");
    }
    auto snapshot = observability_->Snapshot();
    nlohmann::json sizes = nlohmann::json::object();
    for (const auto& entry : engine_->IndexSizes()) {
      sizes[entry.first] = entry.second;
    }
    nlohmann::json data{{"leaderboards", registry_->Size()},
                        {"indexSizes", sizes},
                        {"errorCount", snapshot.request_errors},
                        {"indexRebuilds", snapshot.index_rebuilds},
                        {"indexInconsistencies", snapshot.index_inconsistencies},
                        {"storageRetries", snapshot.storage_retries}};
    return Reply(res, http::status::ok, data);
  }

  if (!StartsWith(path, kApiPrefix)) {
    return ReplyError(res, errors::kNotFound, "지원되지 않는 경로입니다");
  }
  auto segments = SplitPath(path.substr(std::string(kApiPrefix).size()));

  if (req_.method() == http::verb::post && segments.size() == 1 && segments[0] == "players") {
    std::optional<std::string> requested_name;
    if (!req_.body().empty()) {
      try {
        auto body_json = nlohmann::json::parse(req_.body());
        if (body_json.contains("name") && !body_json["name"].is_null()) {
          if (!body_json["name"].is_string()) {
            return ReplyError(res, errors::kBadRequest, "name은 문자열이어야 합니다");
          }
          requested_name = body_json["name"].get<std::string>();
        }
      } catch (const nlohmann::json::exception&) {
        return ReplyError(res, errors::kBadRequest, "JSON 본문이 올바르지 않습니다");
      }
    }
    PlayerAccount player;
    try {
      player = players_->Issue(requested_name);
    } catch (const DbException& ex) {
      return ReplyError(res, errors::kStorageUnavailable, std::string("플레이어 저장 실패: ") + ex.what());
    }
    // key는 이 응답에서만 내려간다. 클라이언트는 이 값으로 제출에 서명한다.
    return Reply(res, http::status::created,
                 nlohmann::json{{"id", player.id}, {"key", player.key}, {"name", player.name}});
  }

  if (segments.size() >= 2 && segments[0] == "scores") {
    log_leaderboard_id_ = segments[1];
    if (req_.method() == http::verb::post && segments.size() == 2) {
      return HandleSubmit(segments[1], res);
    }
    if (req_.method() == http::verb::get) {
      return HandleScoreQuery(segments, params, res);
    }
  }

  if (req_.method() == http::verb::get && segments.size() == 2 && segments[0] == "leaderboards") {
    log_leaderboard_id_ = segments[1];
    std::string error_code;
    std::string error_message;
    auto summary = query_service_->Describe(segments[1], error_code, error_message);
    if (!summary) {
      return ReplyError(res, error_code, error_message);
    }
    auto data = ToJson(summary->leaderboard, false);
    data["players"] = summary->ranked_players;
    return Reply(res, http::status::ok, data);
  }

  if (segments.size() >= 2 && segments[0] == "admin" && segments[1] == "leaderboards") {
    return HandleAdmin(segments, params, res);
  }

  ReplyError(res, errors::kNotFound, "지원되지 않는 경로입니다");
}

void HttpSession::HandleSubmit(const std::string& leaderboard_id, std::shared_ptr<Response> res) {
  ScoreSubmission submission;
  submission.leaderboard_id = leaderboard_id;
  try {
    auto body_json = nlohmann::json::parse(req_.body());
    if (!body_json.is_object() || !body_json.contains("player") || !body_json["player"].is_string() ||
        !body_json.contains("score") || !body_json["score"].is_number()) {
      return ReplyError(res, errors::kMalformedSubmission, "player(문자열)와 score(숫자)가 필요합니다");
    }
    submission.player_id = body_json["player"].get<std::string>();
    submission.value = body_json["score"].get<double>();
    if (body_json.contains("playerName") && !body_json["playerName"].is_null()) {
      if (!body_json["playerName"].is_string()) {
        return ReplyError(res, errors::kMalformedSubmission, "playerName은 문자열이어야 합니다");
      }
      submission.display_name = body_json["playerName"].get<std::string>();
    }
    if (body_json.contains("meta") && !body_json["meta"].is_null()) {
      if (!body_json["meta"].is_string()) {
        return ReplyError(res, errors::kMalformedSubmission, "meta는 문자열이어야 합니다");
      }
      submission.metadata = body_json["meta"].get<std::string>();
    }
    if (body_json.contains("timestamp") && !body_json["timestamp"].is_null()) {
      if (!body_json["timestamp"].is_number_unsigned()) {
        return ReplyError(res, errors::kMalformedSubmission, "timestamp는 0 이상의 정수(초)여야 합니다");
      }
      submission.timestamp_seconds = body_json["timestamp"].get<std::uint64_t>();
    }
    if (body_json.contains("key") && body_json["key"].is_string()) {
      submission.key = body_json["key"].get<std::string>();
    }
    if (body_json.contains("k") && body_json["k"].is_string()) {
      submission.signature = body_json["k"].get<std::string>();
    }
  } catch (const nlohmann::json::exception&) {
    return ReplyError(res, errors::kMalformedSubmission, "JSON 본문이 올바르지 않습니다");
  }
  if (!submission.key) {
    submission.key = ExtractLeaderboardKey();
  }

  auto self = shared_from_this();
  CancellationToken cancel([self]() { return self->PeerClosed(); });
  auto outcome = gateway_->Submit(submission, &cancel);

  if (outcome.status == SubmissionStatus::kRejected && outcome.error_code == errors::kCancelled) {
    return Abandon();
  }
  if (!outcome.Acknowledged()) {
    return ReplyError(res, outcome.error_code, outcome.error_message);
  }

  nlohmann::json data{{"player", submission.player_id},
                      {"playerName", outcome.display_name},
                      {"changed", outcome.changed},
                      {"attempts", outcome.attempts}};
  if (outcome.current) {
    data["score"] = outcome.current->value;
    data["meta"] = outcome.current->metadata ? nlohmann::json(*outcome.current->metadata) : nlohmann::json(nullptr);
    data["timestamp"] = ToIsoTimestamp(outcome.current->timestamp_ms);
  }
  data["rank"] = outcome.rank ? nlohmann::json(*outcome.rank) : nlohmann::json(nullptr);
  Reply(res, boost::beast::http::status::ok, data);
}

void HttpSession::HandleScoreQuery(const std::vector<std::string>& segments, const QueryParams& params,
                                   std::shared_ptr<Response> res) {
  using boost::beast::http::status;
  const std::string& leaderboard_id = segments[1];
  auto key = ExtractLeaderboardKey();
  std::string error_code;
  std::string error_message;

  if (segments.size() == 2) {
    std::size_t limit = query_service_->Limits().default_limit;
    bool invalid = false;
    ParseSizeParam(params, "limit", limit, invalid);
    if (invalid) {
      return ReplyError(res, errors::kBadRequest, "limit 값이 올바르지 않습니다");
    }
    auto entries = query_service_->Top(leaderboard_id, limit, key, error_code, error_message);
    if (!entries) {
      return ReplyError(res, error_code, error_message);
    }
    return Reply(res, status::ok, nlohmann::json{{"limit", limit}, {"entries", ToJsonArray(*entries)}});
  }

  if (segments.size() == 4 && segments[2] == "around") {
    std::size_t window = query_service_->Limits().default_window;
    bool invalid = false;
    ParseSizeParam(params, "window", window, invalid);
    if (invalid) {
      return ReplyError(res, errors::kBadRequest, "window 값이 올바르지 않습니다");
    }
    auto entries = query_service_->Around(leaderboard_id, segments[3], window, key, error_code, error_message);
    if (!entries) {
      return ReplyError(res, error_code, error_message);
    }
    return Reply(res, status::ok,
                 nlohmann::json{{"player", segments[3]}, {"window", window}, {"entries", ToJsonArray(*entries)}});
  }

  if (segments.size() == 4 && segments[2] == "players") {
    auto standing = query_service_->Standing(leaderboard_id, segments[3], key, error_code, error_message);
    if (!standing) {
      return ReplyError(res, error_code, error_message);
    }
    auto data = ToJson(standing->entry);
    data["total"] = standing->total;
    return Reply(res, status::ok, data);
  }

  if (segments.size() == 5 && segments[2] == "players" && segments[4] == "history") {
    auto history = query_service_->History(leaderboard_id, segments[3], key, error_code, error_message);
    if (!history) {
      return ReplyError(res, error_code, error_message);
    }
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : *history) {
      entries.push_back(ToJson(entry));
    }
    return Reply(res, status::ok, nlohmann::json{{"player", segments[3]}, {"entries", entries}});
  }

  ReplyError(res, errors::kNotFound, "지원되지 않는 경로입니다");
}

void HttpSession::HandleAdmin(const std::vector<std::string>& segments, const QueryParams& params,
                              std::shared_ptr<Response> res) {
  using boost::beast::http::status;
  using boost::beast::http::verb;
  if (!IsOperator()) {
    return ReplyError(res, errors::kUnauthorized, "운영 토큰이 올바르지 않습니다");
  }

  try {
    if (segments.size() == 2 && req_.method() == verb::get) {
      auto it = params.find("includeDeleted");
      bool include_deleted = it != params.end() && it->second == "true";
      nlohmann::json list = nlohmann::json::array();
      for (const auto& leaderboard : registry_->List(include_deleted)) {
        list.push_back(ToJson(leaderboard, true));
      }
      return Reply(res, status::ok, nlohmann::json{{"leaderboards", list}});
    }

    if (segments.size() == 2 && req_.method() == verb::post) {
      std::string name;
      Ordering ordering = Ordering::kHigherIsBetter;
      UpdatePolicy policy = UpdatePolicy::kKeepBest;
      try {
        auto body_json = nlohmann::json::parse(req_.body());
        if (!body_json.contains("name") || !body_json["name"].is_string() ||
            body_json["name"].get<std::string>().empty()) {
          return ReplyError(res, errors::kBadRequest, "name이 필요합니다");
        }
        name = body_json["name"].get<std::string>();
        if (body_json.contains("ordering")) {
          auto parsed = body_json["ordering"].is_string()
                            ? ParseOrdering(body_json["ordering"].get<std::string>())
                            : std::nullopt;
          if (!parsed) {
            return ReplyError(res, errors::kBadRequest, "ordering 값이 올바르지 않습니다");
          }
          ordering = *parsed;
        }
        if (body_json.contains("updatePolicy")) {
          auto parsed = body_json["updatePolicy"].is_string()
                            ? ParseUpdatePolicy(body_json["updatePolicy"].get<std::string>())
                            : std::nullopt;
          if (!parsed) {
            return ReplyError(res, errors::kBadRequest, "updatePolicy 값이 올바르지 않습니다");
          }
          policy = *parsed;
        }
      } catch (const nlohmann::json::exception&) {
        return ReplyError(res, errors::kBadRequest, "JSON 본문이 올바르지 않습니다");
      }
      auto leaderboard = registry_->Provision(name, ordering, policy);
      log_leaderboard_id_ = leaderboard.id;
      return Reply(res, status::created, ToJson(leaderboard, true));
    }

    if (segments.size() == 4 && req_.method() == verb::post) {
      const std::string& leaderboard_id = segments[2];
      const std::string& action = segments[3];
      log_leaderboard_id_ = leaderboard_id;
      std::optional<Leaderboard> updated;
      if (action == "rotate") {
        updated = registry_->RotateKey(leaderboard_id);
      } else if (action == "rename") {
        std::string name;
        try {
          auto body_json = nlohmann::json::parse(req_.body());
          if (!body_json.contains("name") || !body_json["name"].is_string() ||
              body_json["name"].get<std::string>().empty()) {
            return ReplyError(res, errors::kBadRequest, "name이 필요합니다");
          }
          name = body_json["name"].get<std::string>();
        } catch (const nlohmann::json::exception&) {
          return ReplyError(res, errors::kBadRequest, "JSON 본문이 올바르지 않습니다");
        }
        updated = registry_->Rename(leaderboard_id, name);
      } else if (action == "delete") {
        updated = registry_->SoftDelete(leaderboard_id);
      } else if (action == "restore") {
        updated = registry_->Restore(leaderboard_id);
      } else if (action == "rebuild") {
        auto leaderboard = registry_->Resolve(leaderboard_id);
        if (!leaderboard) {
          return ReplyError(res, errors::kLeaderboardNotFound, "리더보드를 찾을 수 없습니다");
        }
        auto report = engine_->Verify(*leaderboard);
        nlohmann::json data{{"id", leaderboard_id},
                            {"storeEntries", report.store_entries},
                            {"indexEntries", report.index_entries},
                            {"missing", report.missing_in_index},
                            {"orphaned", report.orphaned_in_index},
                            {"mismatched", report.mismatched},
                            {"rebuilt", report.rebuilt}};
        return Reply(res, status::ok, data);
      } else {
        return ReplyError(res, errors::kNotFound, "지원되지 않는 관리 작업입니다");
      }
      if (!updated) {
        return ReplyError(res, errors::kLeaderboardNotFound, "리더보드를 찾을 수 없습니다");
      }
      return Reply(res, status::ok, ToJson(*updated, true));
    }
  } catch (const DbException& ex) {
    return ReplyError(res, errors::kStorageUnavailable, std::string("저장소 오류: ") + ex.what());
  }

  ReplyError(res, errors::kNotFound, "지원되지 않는 경로입니다");
}

void HttpSession::Reply(std::shared_ptr<Response> res, boost::beast::http::status status,
                        const nlohmann::json& data) {
  auto body = MakeSuccessEnvelope(data).dump();
  res->result(status);
  res->body() = body;
  res->content_length(body.size());
  SendResponse(res);
}

void HttpSession::ReplyError(std::shared_ptr<Response> res, std::string_view code, std::string_view message) {
  auto body = MakeErrorEnvelope(code, message).dump();
  res->result(HttpStatusForError(code));
  res->body() = body;
  res->content_length(body.size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    const unsigned int status = res->result_int();
    if (status >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{trace_id_, "http.request", static_cast<long>(latency), log_leaderboard_id_,
                                   std::nullopt,
                                   std::string(req_.method_string()) + " " + std::string(req_.target()) + " " +
                                       std::to_string(status),
                                   status >= 500 ? LogLevel::kError : LogLevel::kInfo});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::Abandon() {
  if (observability_) {
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{trace_id_, "http.cancelled", static_cast<long>(latency), log_leaderboard_id_,
                                   std::nullopt, std::string(req_.target()), LogLevel::kInfo});
  }
  boost::beast::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  stream_.socket().close(ec);
}

bool HttpSession::IsOperator() const {
  auto header_it = req_.base().find("X-Ops-Token");
  std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
  return !config_.ops_token.empty() && header_token == config_.ops_token;
}

std::optional<std::string> HttpSession::ExtractLeaderboardKey() const {
  auto key_it = req_.base().find("X-Leaderboard-Key");
  if (key_it != req_.base().end() && !key_it->value().empty()) {
    return std::string(key_it->value());
  }
  auto auth_it = req_.find(boost::beast::http::field::authorization);
  if (auth_it == req_.end()) {
    return std::nullopt;
  }
  auto token = ParseBearer(std::string(auth_it->value()));
  if (token.empty()) {
    return std::nullopt;
  }
  return token;
}

bool HttpSession::PeerClosed() {
  auto& socket = stream_.socket();
  boost::beast::error_code ec;
  if (!socket.is_open()) {
    return true;
  }
  socket.non_blocking(true, ec);
  if (ec) {
    return false;
  }
  char probe = 0;
  socket.receive(boost::asio::buffer(&probe, 1), boost::asio::socket_base::message_peek, ec);
  boost::beast::error_code restore_ec;
  socket.non_blocking(false, restore_ec);
  if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again) {
    return false;
  }
  // eof 또는 reset. 데이터가 남아 있으면(파이프라이닝) 아직 연결된 것으로 본다.
  return static_cast<bool>(ec);
}

std::string HttpSession::ParseBearer(const std::string& header_value) const {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

}  // namespace scoreboard
