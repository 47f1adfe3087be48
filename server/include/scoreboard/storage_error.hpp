/*
 * 설명: 저장소 계층 예외와 재시도 가능 여부를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/submission_gateway_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>

namespace scoreboard {

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

// 일시적 저장소 장애. 제출 게이트웨이가 백오프 후 재시도한다.
class StorageUnavailable : public DbException {
 public:
  explicit StorageUnavailable(const std::string& message, unsigned int code = 0) : DbException(message, code, true) {}
};

// 커밋 응답을 받지 못해 반영 여부를 알 수 없다. 다시 시도하면 같은 쓰기가 두 번 반영될 수 있으므로 재시도하지 않는다.
class CommitOutcomeUnknown : public DbException {
 public:
  explicit CommitOutcomeUnknown(const std::string& message, unsigned int code = 0)
      : DbException(message, code, false) {}
};

}  // namespace scoreboard
