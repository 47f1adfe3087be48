/*
 * 설명: 플레이어 계정 발급, 캐시 조회, 플레이어 키 기반 서명 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/player_directory_test.cpp
 */
#include "scoreboard/player_directory.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>
#include <random>

#include "scoreboard/credentials.hpp"

namespace scoreboard {
namespace {
constexpr std::array<const char*, 16> kAdjectives = {"Brave",  "Calm",   "Clever", "Eager", "Fierce", "Gentle",
                                                     "Happy",  "Jolly",  "Lucky",  "Mighty", "Nimble", "Quiet",
                                                     "Rapid",  "Swift",  "Witty",  "Zealous"};
constexpr std::array<const char*, 16> kNouns = {"Badger", "Comet",  "Dragon", "Falcon", "Fox",    "Golem",
                                                "Heron",  "Koala",  "Lynx",   "Otter",  "Panda",  "Raven",
                                                "Tiger",  "Walrus", "Wizard", "Yeti"};
}  // namespace

std::string RandomPlayerName() {
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<std::size_t> adjective(0, kAdjectives.size() - 1);
  std::uniform_int_distribution<std::size_t> noun(0, kNouns.size() - 1);
  std::uniform_int_distribution<int> number(0, 999);
  std::string suffix = std::to_string(number(gen));
  suffix.insert(0, 3 - suffix.size(), '0');
  return std::string(kAdjectives[adjective(gen)]) + " " + kNouns[noun(gen)] + " " + suffix;
}

PlayerDirectory::PlayerDirectory(std::shared_ptr<PlayerRepository> repository)
    : repository_(std::move(repository)) {}

PlayerAccount PlayerDirectory::Issue(const std::optional<std::string>& requested_name) {
  PlayerAccount account;
  account.id = RandomUuid();
  account.key = RandomUuid();
  account.name = requested_name && !requested_name->empty() ? *requested_name : RandomPlayerName();
  account.created_at = std::chrono::system_clock::now();
  // 저장에 실패하면 예외가 그대로 올라가고 캐시에는 남지 않는다.
  if (repository_) {
    repository_->Insert(account);
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  accounts_[account.id] = account;
  return account;
}

std::optional<PlayerAccount> PlayerDirectory::Find(const std::string& player_id) const {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = accounts_.find(player_id);
    if (it != accounts_.end()) {
      return it->second;
    }
  }
  if (!repository_) {
    return std::nullopt;
  }
  auto loaded = repository_->Find(player_id);
  if (loaded) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    accounts_.emplace(loaded->id, *loaded);
  }
  return loaded;
}

bool PlayerDirectory::VerifySignature(const std::string& player_id, const std::string& payload,
                                      const std::string& supplied_mac_hex) const {
  auto account = Find(player_id);
  if (!account) {
    return false;
  }
  auto key = UuidBytes(account->key);
  if (!key) {
    return false;
  }
  std::string supplied = supplied_mac_hex;
  std::transform(supplied.begin(), supplied.end(), supplied.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ConstantTimeEquals(HmacSha256Hex(*key, payload), supplied);
}

}  // namespace scoreboard
