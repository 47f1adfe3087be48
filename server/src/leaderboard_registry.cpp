/*
 * 설명: 리더보드 레지스트리의 조회, 키 인증, 프로비저닝, 키 교체를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_registry_test.cpp
 */
#include "scoreboard/leaderboard_registry.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>

#include "scoreboard/credentials.hpp"

namespace scoreboard {

LeaderboardRegistry::LeaderboardRegistry(std::shared_ptr<LeaderboardRepository> repository)
    : repository_(std::move(repository)) {}

std::size_t LeaderboardRegistry::Load() {
  if (!repository_) {
    return 0;
  }
  auto loaded = repository_->LoadAll();
  std::unique_lock<std::shared_mutex> lock(mutex_);
  for (auto& leaderboard : loaded) {
    std::string id = leaderboard.id;
    slots_[id] = std::make_shared<Slot>(std::move(leaderboard));
  }
  return loaded.size();
}

std::shared_ptr<LeaderboardRegistry::Slot> LeaderboardRegistry::FindSlot(const std::string& leaderboard_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = slots_.find(leaderboard_id);
  if (it == slots_.end()) {
    return nullptr;
  }
  return it->second;
}

std::optional<Leaderboard> LeaderboardRegistry::Resolve(const std::string& leaderboard_id) const {
  auto found = ResolveIncludingDeleted(leaderboard_id);
  if (!found || found->deleted) {
    return std::nullopt;
  }
  return found;
}

std::optional<Leaderboard> LeaderboardRegistry::ResolveIncludingDeleted(const std::string& leaderboard_id) const {
  auto slot = FindSlot(leaderboard_id);
  if (!slot) {
    return std::nullopt;
  }
  std::shared_lock<std::shared_mutex> lock(slot->mutex);
  return slot->record;
}

bool LeaderboardRegistry::Authenticate(const std::string& leaderboard_id, const std::string& supplied_key) const {
  auto slot = FindSlot(leaderboard_id);
  if (!slot) {
    return false;
  }
  std::shared_lock<std::shared_mutex> lock(slot->mutex);
  if (slot->record.deleted) {
    return false;
  }
  return ConstantTimeEquals(slot->record.secret, supplied_key);
}

Leaderboard LeaderboardRegistry::Provision(const std::string& name, Ordering ordering, UpdatePolicy update_policy) {
  Leaderboard leaderboard;
  leaderboard.id = RandomUuid();
  leaderboard.secret = RandomUuid();
  leaderboard.name = name;
  leaderboard.ordering = ordering;
  leaderboard.update_policy = update_policy;
  leaderboard.created_at = std::chrono::system_clock::now();
  if (repository_) {
    repository_->Insert(leaderboard);
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  slots_[leaderboard.id] = std::make_shared<Slot>(leaderboard);
  return leaderboard;
}

bool LeaderboardRegistry::Register(const Leaderboard& leaderboard) {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (slots_.count(leaderboard.id) > 0) {
      return false;
    }
  }
  if (repository_) {
    repository_->Insert(leaderboard);
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return slots_.emplace(leaderboard.id, std::make_shared<Slot>(leaderboard)).second;
}

std::optional<Leaderboard> LeaderboardRegistry::Modify(const std::string& leaderboard_id,
                                                       const std::function<bool(Leaderboard&)>& mutate) {
  auto slot = FindSlot(leaderboard_id);
  if (!slot) {
    return std::nullopt;
  }
  // 해당 레코드만 배타적으로 잠근다. 저장 실패 시 메모리 상태는 바뀌지 않는다.
  std::unique_lock<std::shared_mutex> lock(slot->mutex);
  Leaderboard updated = slot->record;
  if (!mutate(updated)) {
    return std::nullopt;
  }
  if (repository_) {
    repository_->Update(updated);
  }
  slot->record = updated;
  return updated;
}

std::optional<Leaderboard> LeaderboardRegistry::RotateKey(const std::string& leaderboard_id) {
  return Modify(leaderboard_id, [](Leaderboard& lb) {
    lb.secret = RandomUuid();
    return true;
  });
}

std::optional<Leaderboard> LeaderboardRegistry::Rename(const std::string& leaderboard_id, const std::string& name) {
  return Modify(leaderboard_id, [&name](Leaderboard& lb) {
    lb.name = name;
    return true;
  });
}

std::optional<Leaderboard> LeaderboardRegistry::SoftDelete(const std::string& leaderboard_id) {
  return Modify(leaderboard_id, [](Leaderboard& lb) {
    lb.deleted = true;
    return true;
  });
}

std::optional<Leaderboard> LeaderboardRegistry::Restore(const std::string& leaderboard_id) {
  return Modify(leaderboard_id, [](Leaderboard& lb) {
    lb.deleted = false;
    return true;
  });
}

std::vector<Leaderboard> LeaderboardRegistry::List(bool include_deleted) const {
  std::vector<std::shared_ptr<Slot>> slots;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    slots.reserve(slots_.size());
    for (const auto& entry : slots_) {
      slots.push_back(entry.second);
    }
  }
  std::vector<Leaderboard> out;
  for (const auto& slot : slots) {
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    if (include_deleted || !slot->record.deleted) {
      out.push_back(slot->record);
    }
  }
  std::sort(out.begin(), out.end(),
            [](const Leaderboard& a, const Leaderboard& b) {
              return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
            });
  return out;
}

std::size_t LeaderboardRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return slots_.size();
}

}  // namespace scoreboard
