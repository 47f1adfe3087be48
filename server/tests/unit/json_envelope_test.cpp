#include <gtest/gtest.h>

#include "scoreboard/api_response.hpp"
#include "scoreboard/errors.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = scoreboard::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = scoreboard::MakeErrorEnvelope(scoreboard::errors::kMalformedSubmission, "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "malformed_submission");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, ErrorCodesMapToHttpStatus) {
  using namespace scoreboard;
  EXPECT_EQ(HttpStatusForError(errors::kAuthenticationFailed), 401u);
  EXPECT_EQ(HttpStatusForError(errors::kUnauthorized), 401u);
  EXPECT_EQ(HttpStatusForError(errors::kLeaderboardNotFound), 404u);
  EXPECT_EQ(HttpStatusForError(errors::kPlayerNotRanked), 404u);
  EXPECT_EQ(HttpStatusForError(errors::kMalformedSubmission), 400u);
  EXPECT_EQ(HttpStatusForError(errors::kBadRequest), 400u);
  EXPECT_EQ(HttpStatusForError(errors::kSubmissionFailed), 503u);
  EXPECT_EQ(HttpStatusForError(errors::kStorageUnavailable), 503u);
  EXPECT_EQ(HttpStatusForError(errors::kCancelled), 499u);
  EXPECT_EQ(HttpStatusForError("something_else"), 500u);
}

TEST(JsonEnvelopeTest, RankedEntryCarriesMetaAndIsoTimestamp) {
  scoreboard::RankedEntry entry{"p1", "Player One", 12.5, 1700000000123, std::string("lvl"), 3};
  auto j = scoreboard::ToJson(entry);
  EXPECT_EQ(j["rank"], 3);
  EXPECT_EQ(j["player"], "p1");
  EXPECT_EQ(j["playerName"], "Player One");
  EXPECT_DOUBLE_EQ(j["score"].get<double>(), 12.5);
  EXPECT_EQ(j["meta"], "lvl");
  EXPECT_EQ(j["timestamp"], "2023-11-14T22:13:20Z");
}

TEST(JsonEnvelopeTest, LeaderboardJsonHidesSecretUnlessRequested) {
  scoreboard::Leaderboard lb;
  lb.id = "id-1";
  lb.secret = "secret-1";
  lb.name = "public";
  auto pub = scoreboard::ToJson(lb, false);
  EXPECT_FALSE(pub.contains("key"));
  EXPECT_EQ(pub["ordering"], "higher_is_better");
  auto admin = scoreboard::ToJson(lb, true);
  EXPECT_EQ(admin["key"], "secret-1");
}
