/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_api_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace scoreboard {

struct AppConfig {
  unsigned short port{8080};
  std::string store_backend{"mariadb"};  // mariadb | memory
  std::string db_host{"mariadb"};
  unsigned short db_port{3306};
  std::string db_user{"app"};
  std::string db_password{"app_pass"};
  std::string db_name{"app_db"};
  std::string log_level{"info"};
  std::string ops_token;
  std::size_t submit_retry_max_attempts{3};
  std::size_t submit_retry_base_ms{50};
  std::size_t submit_retry_max_ms{1000};
  std::size_t query_max_limit{100};
  std::size_t query_max_window{50};
  bool query_require_key{false};
  std::int64_t signature_max_skew_seconds{300};
};

AppConfig LoadConfigFromEnv();

}  // namespace scoreboard
