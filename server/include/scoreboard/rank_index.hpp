/*
 * 설명: 리더보드별 순위 인덱스. 구간 폭(span)을 가진 스킵 리스트로 O(log n) 삽입/순위/구간 조회를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rank_index_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "scoreboard/leaderboard.hpp"

namespace scoreboard {

struct RankKey {
  double value{0.0};
  std::int64_t timestamp_ms{0};

  bool operator==(const RankKey& other) const {
    return value == other.value && timestamp_ms == other.timestamp_ms;
  }
  bool operator!=(const RankKey& other) const { return !(*this == other); }
};

struct IndexRecord {
  std::string player_id;
  std::string display_name;
  RankKey key;
  std::optional<std::string> metadata;
};

struct RankedEntry {
  std::string player_id;
  std::string display_name;
  double value{0.0};
  std::int64_t timestamp_ms{0};
  std::optional<std::string> metadata;
  std::size_t rank{0};
};

enum class IndexUpdate { kInserted, kUpdated, kUnchanged, kInconsistent };

class RankIndex {
 public:
  static constexpr int kMaxLevel = 32;

  explicit RankIndex(Ordering ordering);
  ~RankIndex();

  RankIndex(const RankIndex&) = delete;
  RankIndex& operator=(const RankIndex&) = delete;

  // expected_old가 주어졌는데 인덱스가 보유한 키와 다르면 kInconsistent를 돌려준다. 새 키는 그래도 반영된다.
  IndexUpdate InsertOrUpdate(const IndexRecord& record, const std::optional<RankKey>& expected_old);
  bool Remove(const std::string& player_id);

  std::vector<RankedEntry> Top(std::size_t n) const;
  std::optional<std::size_t> RankOf(const std::string& player_id) const;
  std::optional<RankedEntry> Find(const std::string& player_id) const;
  std::vector<RankedEntry> Around(const std::string& player_id, std::size_t window) const;
  std::vector<RankedEntry> Range(std::size_t first_rank, std::size_t count) const;
  std::vector<RankedEntry> Snapshot() const;

  void Rebuild(const std::vector<IndexRecord>& records);
  void Clear();

  std::size_t Size() const;
  Ordering GetOrdering() const { return ordering_; }

 private:
  struct Node;
  // 포인터는 소유하지 않는다. 노드는 nodes_가 소유한다.
  struct Link {
    Node* forward{nullptr};
    std::size_t span{0};
  };
  struct Node {
    Node(std::string player, std::string name, RankKey k, std::optional<std::string> meta, int level)
        : player_id(std::move(player)), display_name(std::move(name)), key(k), metadata(std::move(meta)),
          links(static_cast<std::size_t>(level)) {}
    std::string player_id;
    std::string display_name;
    RankKey key;
    std::optional<std::string> metadata;
    std::vector<Link> links;
  };

  bool Precedes(const RankKey& a, const std::string& pa, const RankKey& b, const std::string& pb) const;
  int RandomLevel();
  void InsertLocked(const IndexRecord& record);
  void LinkLocked(Node* node);
  bool UnlinkLocked(const Node* node);
  std::size_t RankLocked(const Node* node) const;
  const Node* NodeAtRankLocked(std::size_t rank) const;
  std::vector<RankedEntry> RangeLocked(std::size_t first_rank, std::size_t count) const;
  void ClearLocked();

  Ordering ordering_;
  std::unique_ptr<Node> head_;
  int level_{1};
  std::size_t length_{0};
  std::unordered_map<std::string, std::unique_ptr<Node>> nodes_;
  std::mt19937 rng_;
  mutable std::shared_mutex mutex_;
};

}  // namespace scoreboard
