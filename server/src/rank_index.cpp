/*
 * 설명: 구간 폭을 유지하는 스킵 리스트 기반 순위 인덱스를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rank_index_test.cpp, server/tests/unit/concurrent_submission_test.cpp
 */
#include "scoreboard/rank_index.hpp"

#include <algorithm>
#include <array>
#include <mutex>

#include "scoreboard/update_policy.hpp"

namespace scoreboard {
namespace {
constexpr std::uint32_t kLevelProbabilityMask = 0xFFFF;
constexpr std::uint32_t kLevelThreshold = kLevelProbabilityMask / 4;

RankedEntry ToRanked(const std::string& player_id, const std::string& display_name, const RankKey& key,
                     const std::optional<std::string>& metadata, std::size_t rank) {
  return RankedEntry{player_id, display_name, key.value, key.timestamp_ms, metadata, rank};
}
}  // namespace

RankIndex::RankIndex(Ordering ordering)
    : ordering_(ordering), head_(std::make_unique<Node>("", "", RankKey{}, std::nullopt, kMaxLevel)),
      rng_(std::random_device{}()) {}

RankIndex::~RankIndex() = default;

IndexUpdate RankIndex::InsertOrUpdate(const IndexRecord& record, const std::optional<RankKey>& expected_old) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = nodes_.find(record.player_id);
  if (it == nodes_.end()) {
    InsertLocked(record);
    // 저장소에는 이전 현재 엔트리가 있는데 인덱스에는 없었던 경우
    return expected_old ? IndexUpdate::kInconsistent : IndexUpdate::kInserted;
  }

  Node* node = it->second.get();
  bool inconsistent = expected_old && *expected_old != node->key;
  node->display_name = record.display_name;
  node->metadata = record.metadata;
  if (node->key == record.key) {
    return inconsistent ? IndexUpdate::kInconsistent : IndexUpdate::kUnchanged;
  }

  // 노드를 떼어 낸 뒤 새 키로 같은 높이에 다시 연결한다.
  UnlinkLocked(node);
  node->key = record.key;
  LinkLocked(node);
  return inconsistent ? IndexUpdate::kInconsistent : IndexUpdate::kUpdated;
}

bool RankIndex::Remove(const std::string& player_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = nodes_.find(player_id);
  if (it == nodes_.end()) {
    return false;
  }
  UnlinkLocked(it->second.get());
  nodes_.erase(it);
  return true;
}

std::vector<RankedEntry> RankIndex::Top(std::size_t n) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return RangeLocked(1, n);
}

std::optional<std::size_t> RankIndex::RankOf(const std::string& player_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = nodes_.find(player_id);
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  std::size_t rank = RankLocked(it->second.get());
  if (rank == 0) {
    return std::nullopt;
  }
  return rank;
}

std::optional<RankedEntry> RankIndex::Find(const std::string& player_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = nodes_.find(player_id);
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  const Node* node = it->second.get();
  std::size_t rank = RankLocked(node);
  if (rank == 0) {
    return std::nullopt;
  }
  return ToRanked(node->player_id, node->display_name, node->key, node->metadata, rank);
}

std::vector<RankedEntry> RankIndex::Around(const std::string& player_id, std::size_t window) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = nodes_.find(player_id);
  if (it == nodes_.end()) {
    return {};
  }
  std::size_t rank = RankLocked(it->second.get());
  if (rank == 0) {
    return {};
  }
  std::size_t first = rank > window ? rank - window : 1;
  // rank + window가 넘치지 않도록 남은 길이와 비교한다.
  std::size_t last = window >= length_ - rank ? length_ : rank + window;
  return RangeLocked(first, last - first + 1);
}

std::vector<RankedEntry> RankIndex::Range(std::size_t first_rank, std::size_t count) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return RangeLocked(first_rank, count);
}

std::vector<RankedEntry> RankIndex::Snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return RangeLocked(1, length_);
}

void RankIndex::Rebuild(const std::vector<IndexRecord>& records) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ClearLocked();
  for (const auto& record : records) {
    auto it = nodes_.find(record.player_id);
    if (it != nodes_.end()) {
      UnlinkLocked(it->second.get());
      nodes_.erase(it);
    }
    InsertLocked(record);
  }
}

void RankIndex::Clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ClearLocked();
}

std::size_t RankIndex::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return length_;
}

bool RankIndex::Precedes(const RankKey& a, const std::string& pa, const RankKey& b, const std::string& pb) const {
  if (a.value != b.value) {
    return IsStrictlyBetter(ordering_, a.value, b.value);
  }
  if (a.timestamp_ms != b.timestamp_ms) {
    return a.timestamp_ms < b.timestamp_ms;
  }
  return pa < pb;
}

int RankIndex::RandomLevel() {
  int level = 1;
  while (level < kMaxLevel && (rng_() & kLevelProbabilityMask) < kLevelThreshold) {
    ++level;
  }
  return level;
}

void RankIndex::InsertLocked(const IndexRecord& record) {
  auto node = std::make_unique<Node>(record.player_id, record.display_name, record.key, record.metadata,
                                     RandomLevel());
  LinkLocked(node.get());
  nodes_.emplace(record.player_id, std::move(node));
}

void RankIndex::LinkLocked(Node* node) {
  std::array<Node*, kMaxLevel> update{};
  std::array<std::size_t, kMaxLevel> rank{};

  Node* x = head_.get();
  for (int i = level_ - 1; i >= 0; --i) {
    rank[i] = i == level_ - 1 ? 0 : rank[i + 1];
    while (x->links[i].forward &&
           Precedes(x->links[i].forward->key, x->links[i].forward->player_id, node->key, node->player_id)) {
      rank[i] += x->links[i].span;
      x = x->links[i].forward;
    }
    update[i] = x;
  }

  const int level = static_cast<int>(node->links.size());
  if (level > level_) {
    for (int i = level_; i < level; ++i) {
      rank[i] = 0;
      update[i] = head_.get();
      head_->links[i].span = length_;
    }
    level_ = level;
  }

  for (int i = 0; i < level; ++i) {
    node->links[i].forward = update[i]->links[i].forward;
    update[i]->links[i].forward = node;
    node->links[i].span = update[i]->links[i].span - (rank[0] - rank[i]);
    update[i]->links[i].span = (rank[0] - rank[i]) + 1;
  }
  for (int i = level; i < level_; ++i) {
    ++update[i]->links[i].span;
  }
  ++length_;
}

bool RankIndex::UnlinkLocked(const Node* node) {
  std::array<Node*, kMaxLevel> update{};
  Node* x = head_.get();
  for (int i = level_ - 1; i >= 0; --i) {
    while (x->links[i].forward &&
           Precedes(x->links[i].forward->key, x->links[i].forward->player_id, node->key, node->player_id)) {
      x = x->links[i].forward;
    }
    update[i] = x;
  }
  if (x->links[0].forward != node) {
    return false;
  }

  for (int i = 0; i < level_; ++i) {
    if (update[i]->links[i].forward == node) {
      update[i]->links[i].span += node->links[i].span - 1;
      update[i]->links[i].forward = node->links[i].forward;
    } else {
      --update[i]->links[i].span;
    }
  }
  while (level_ > 1 && head_->links[level_ - 1].forward == nullptr) {
    --level_;
  }
  --length_;
  return true;
}

std::size_t RankIndex::RankLocked(const Node* node) const {
  std::size_t rank = 0;
  const Node* x = head_.get();
  for (int i = level_ - 1; i >= 0; --i) {
    // forward가 대상 노드를 지나치기 전까지 전진한다.
    while (x->links[i].forward &&
           !Precedes(node->key, node->player_id, x->links[i].forward->key, x->links[i].forward->player_id)) {
      rank += x->links[i].span;
      x = x->links[i].forward;
    }
    if (x == node) {
      return rank;
    }
  }
  return 0;
}

const RankIndex::Node* RankIndex::NodeAtRankLocked(std::size_t rank) const {
  if (rank == 0 || rank > length_) {
    return nullptr;
  }
  std::size_t traversed = 0;
  const Node* x = head_.get();
  for (int i = level_ - 1; i >= 0; --i) {
    while (x->links[i].forward && traversed + x->links[i].span <= rank) {
      traversed += x->links[i].span;
      x = x->links[i].forward;
    }
    if (traversed == rank) {
      return x;
    }
  }
  return nullptr;
}

std::vector<RankedEntry> RankIndex::RangeLocked(std::size_t first_rank, std::size_t count) const {
  std::vector<RankedEntry> out;
  if (count == 0 || first_rank == 0 || first_rank > length_) {
    return out;
  }
  out.reserve(std::min(count, length_ - first_rank + 1));
  const Node* x = NodeAtRankLocked(first_rank);
  std::size_t rank = first_rank;
  while (x && out.size() < count) {
    out.push_back(ToRanked(x->player_id, x->display_name, x->key, x->metadata, rank));
    x = x->links[0].forward;
    ++rank;
  }
  return out;
}

void RankIndex::ClearLocked() {
  for (auto& link : head_->links) {
    link.forward = nullptr;
    link.span = 0;
  }
  nodes_.clear();
  level_ = 1;
  length_ = 0;
}

}  // namespace scoreboard
