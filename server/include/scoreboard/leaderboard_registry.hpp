/*
 * 설명: 공개 리더보드 ID → 비밀키/메타데이터/정책 매핑을 관리한다. 레코드 단위 잠금으로 읽기 위주 접근을 최적화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_registry_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "scoreboard/leaderboard.hpp"

namespace scoreboard {

class LeaderboardRepository {
 public:
  virtual ~LeaderboardRepository() = default;

  virtual std::vector<Leaderboard> LoadAll() const = 0;
  virtual void Insert(const Leaderboard& leaderboard) = 0;
  virtual void Update(const Leaderboard& leaderboard) = 0;
};

class LeaderboardRegistry {
 public:
  // repository가 nullptr이면 메모리에만 보관한다.
  explicit LeaderboardRegistry(std::shared_ptr<LeaderboardRepository> repository = nullptr);

  std::size_t Load();

  std::optional<Leaderboard> Resolve(const std::string& leaderboard_id) const;
  std::optional<Leaderboard> ResolveIncludingDeleted(const std::string& leaderboard_id) const;
  bool Authenticate(const std::string& leaderboard_id, const std::string& supplied_key) const;

  Leaderboard Provision(const std::string& name, Ordering ordering, UpdatePolicy update_policy);
  bool Register(const Leaderboard& leaderboard);
  std::optional<Leaderboard> RotateKey(const std::string& leaderboard_id);
  std::optional<Leaderboard> Rename(const std::string& leaderboard_id, const std::string& name);
  std::optional<Leaderboard> SoftDelete(const std::string& leaderboard_id);
  std::optional<Leaderboard> Restore(const std::string& leaderboard_id);

  std::vector<Leaderboard> List(bool include_deleted) const;
  std::size_t Size() const;

 private:
  struct Slot {
    explicit Slot(Leaderboard lb) : record(std::move(lb)) {}
    Leaderboard record;
    mutable std::shared_mutex mutex;
  };

  std::shared_ptr<Slot> FindSlot(const std::string& leaderboard_id) const;
  std::optional<Leaderboard> Modify(const std::string& leaderboard_id,
                                    const std::function<bool(Leaderboard&)>& mutate);

  std::shared_ptr<LeaderboardRepository> repository_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
  mutable std::shared_mutex mutex_;
};

}  // namespace scoreboard
