#include <set>
#include <string>

#include <gtest/gtest.h>

#include "scoreboard/credentials.hpp"
#include "scoreboard/player_directory.hpp"

TEST(CredentialsTest, HmacMatchesRfc4231Vector) {
  EXPECT_EQ(scoreboard::HmacSha256Hex("Jefe", "what do ya want for nothing?"),
            "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(CredentialsTest, UuidHasCanonicalShapeAndVersion) {
  std::set<std::string> seen;
  for (int i = 0; i < 32; ++i) {
    auto id = scoreboard::RandomUuid();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_EQ(id[18], '-');
    EXPECT_EQ(id[23], '-');
    seen.insert(id);
  }
  EXPECT_EQ(seen.size(), 32u);
}

TEST(CredentialsTest, ConstantTimeEqualsComparesWholeValue) {
  EXPECT_TRUE(scoreboard::ConstantTimeEquals("abc", "abc"));
  EXPECT_FALSE(scoreboard::ConstantTimeEquals("abc", "abd"));
  EXPECT_FALSE(scoreboard::ConstantTimeEquals("abc", "abcd"));
}

TEST(CredentialsTest, UuidBytesParsesHyphenatedAndCompactForms) {
  auto hyphenated = scoreboard::UuidBytes("0f3c2b1a-9d8e-4f70-a6b5-c4d3e2f1a0b9");
  ASSERT_TRUE(hyphenated.has_value());
  ASSERT_EQ(hyphenated->size(), 16u);
  EXPECT_EQ(static_cast<unsigned char>((*hyphenated)[0]), 0x0F);
  EXPECT_EQ(static_cast<unsigned char>((*hyphenated)[15]), 0xB9);
  EXPECT_EQ(scoreboard::UuidBytes("0F3C2B1A9D8E4F70A6B5C4D3E2F1A0B9"), hyphenated);

  EXPECT_FALSE(scoreboard::UuidBytes("player-1").has_value());
  EXPECT_FALSE(scoreboard::UuidBytes("0f3c2b1a-9d8e-4f70-a6b5-c4d3e2f1a0bz").has_value());
  EXPECT_FALSE(scoreboard::UuidBytes("0f3c2b1a9-d8e-4f70-a6b5-c4d3e2f1a0b9").has_value());
}

TEST(CredentialsTest, SignaturePayloadLayout) {
  const std::string leaderboard_key = "0f3c2b1a-9d8e-4f70-a6b5-c4d3e2f1a0b9";
  const std::string player_id = "7e57d004-2b97-4e7a-b45f-5387367791cd";
  auto payload = scoreboard::BuildSignaturePayload(1, leaderboard_key, player_id, 1.0f, std::string("m"));
  ASSERT_TRUE(payload.has_value());
  // 8바이트 timestamp + 16바이트 비밀키 + 16바이트 player + 4바이트 f32 + "m"
  ASSERT_EQ(payload->size(), 8u + 16u + 16u + 4u + 1u);
  EXPECT_EQ((*payload)[0], '\x01');
  EXPECT_EQ(payload->substr(8, 16), *scoreboard::UuidBytes(leaderboard_key));
  EXPECT_EQ(payload->substr(24, 16), *scoreboard::UuidBytes(player_id));
  // 1.0f == 0x3F800000 (LE)
  EXPECT_EQ(static_cast<unsigned char>((*payload)[40]), 0x00);
  EXPECT_EQ(static_cast<unsigned char>((*payload)[42]), 0x80);
  EXPECT_EQ(static_cast<unsigned char>((*payload)[43]), 0x3F);
  EXPECT_EQ(payload->back(), 'm');

  EXPECT_EQ(scoreboard::BuildSignaturePayload(1, leaderboard_key, player_id, 1.0f, std::nullopt)->size(), 44u);
  EXPECT_FALSE(scoreboard::BuildSignaturePayload(1, "lb", player_id, 1.0f, std::nullopt).has_value());
  EXPECT_FALSE(scoreboard::BuildSignaturePayload(1, leaderboard_key, "p", 1.0f, std::nullopt).has_value());
}

// 게임 클라이언트가 보내는 서명과 같은 값이어야 한다: 플레이어 키 16바이트로 HMAC을 계산한다.
TEST(CredentialsTest, SignatureMatchesClientVector) {
  const std::string player_key = "6a1f5c0e-3b7d-4e2a-9c41-0d8e2f7b1a55";
  const std::string leaderboard_key = "0f3c2b1a-9d8e-4f70-a6b5-c4d3e2f1a0b9";
  const std::string player_id = "7e57d004-2b97-4e7a-b45f-5387367791cd";
  auto key_bytes = scoreboard::UuidBytes(player_key);
  ASSERT_TRUE(key_bytes.has_value());

  auto bare = scoreboard::BuildSignaturePayload(1700000000, leaderboard_key, player_id, 42.5f, std::nullopt);
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(scoreboard::HmacSha256Hex(*key_bytes, *bare),
            "c45a3eff90742f33088d5a0da1d90f871b3bbe51529b67f1c585170293514e0b");

  auto with_meta =
      scoreboard::BuildSignaturePayload(1700000000, leaderboard_key, player_id, 42.5f, std::string("level=3"));
  ASSERT_TRUE(with_meta.has_value());
  EXPECT_EQ(scoreboard::HmacSha256Hex(*key_bytes, *with_meta),
            "b28c4268144e700cb5ea94e34e842f4c5f5c6543f2e7e05cb928ecb55d617cf5");
}

TEST(PlayerNamesTest, RandomNameHasAdjectiveNounAndNumber) {
  auto name = scoreboard::RandomPlayerName();
  // "Adjective Noun NNN"
  auto first_space = name.find(' ');
  auto last_space = name.rfind(' ');
  ASSERT_NE(first_space, std::string::npos);
  ASSERT_NE(first_space, last_space);
  EXPECT_EQ(name.size() - last_space - 1, 3u);
}
