#include <gtest/gtest.h>

#include "devpulse/core/json.hpp"
#include "devpulse/leetcode/client.hpp"
#include "devpulse/leetcode/instructions.hpp"
#include "devpulse/leetcode/normalize.hpp"
#include "fake_transport.hpp"

#include <chrono>
#include <memory>
#include <string>

using namespace std::chrono_literals;
using devpulse::core::ErrorKind;
using devpulse::leetcode::models::RawSubmissionStats;
using devpulse::leetcode::models::TierCount;
using devpulse::testing::FakeTransport;

namespace {

constexpr const char *GraphqlUrl = "https://leetcode.test/graphql";

constexpr const char *ProfileBody = R"({
  "data": {
    "matchedUser": {
      "username": "neo",
      "profile": {"ranking": 12345, "reputation": 17},
      "submitStats": {
        "acSubmissionNum": [
          {"difficulty": "All", "count": 120, "submissions": 150},
          {"difficulty": "Easy", "count": 60, "submissions": 70},
          {"difficulty": "Medium", "count": 40, "submissions": 55},
          {"difficulty": "Hard", "count": 20, "submissions": 25}
        ],
        "totalSubmissionNum": [
          {"difficulty": "All", "count": 130, "submissions": 200},
          {"difficulty": "Easy", "count": 62, "submissions": 80},
          {"difficulty": "Medium", "count": 45, "submissions": 80},
          {"difficulty": "Hard", "count": 23, "submissions": 40}
        ]
      }
    }
  }
})";

RawSubmissionStats sampleStats() {
  return RawSubmissionStats{
      .Username = "neo",
      .Ranking = 12345,
      .Reputation = 17,
      .Accepted =
          {
              {.Difficulty = "All", .Count = 120},
              {.Difficulty = "Easy", .Count = 60},
              {.Difficulty = "Medium", .Count = 40},
              {.Difficulty = "Hard", .Count = 20},
          },
      .Total = {{.Difficulty = "All", .Count = 130, .Submissions = 200}},
  };
}

} // namespace

TEST(LeetCodeNormalizeTest, ComputesAcceptanceRate) {
  auto Profile = devpulse::leetcode::normalize(sampleStats());

  EXPECT_EQ(Profile.Username, "neo");
  EXPECT_EQ(Profile.TotalSolved, 120);
  EXPECT_EQ(Profile.EasySolved, 60);
  EXPECT_EQ(Profile.MediumSolved, 40);
  EXPECT_EQ(Profile.HardSolved, 20);
  EXPECT_EQ(Profile.TotalSubmissions, 200);
  EXPECT_DOUBLE_EQ(Profile.AcceptanceRate, 60.0);
}

TEST(LeetCodeNormalizeTest, ZeroSubmissionsGiveZeroRate) {
  auto Stats = sampleStats();
  Stats.Total = {{.Difficulty = "All", .Count = 0, .Submissions = 0}};
  EXPECT_EQ(devpulse::leetcode::normalize(Stats).AcceptanceRate, 0.0);
  EXPECT_EQ(devpulse::leetcode::acceptanceRate(0, 0), 0.0);
  EXPECT_EQ(devpulse::leetcode::acceptanceRate(5, 0), 0.0);
}

TEST(LeetCodeNormalizeTest, MissingTiersDefaultToZero) {
  RawSubmissionStats Stats{
      .Username = "neo", .Accepted = {{.Difficulty = "Easy", .Count = 3}}
  };
  auto Profile = devpulse::leetcode::normalize(Stats);

  EXPECT_EQ(Profile.EasySolved, 3);
  EXPECT_EQ(Profile.MediumSolved, 0);
  EXPECT_EQ(Profile.HardSolved, 0);
  EXPECT_EQ(Profile.TotalSolved, 0);
  EXPECT_EQ(Profile.AcceptanceRate, 0.0);
}

TEST(LeetCodeNormalizeTest, TierNamesMatchExactly) {
  std::vector<TierCount> Tiers{
      {.Difficulty = "easy", .Count = 9}, {.Difficulty = "Easy ", .Count = 8}
  };
  EXPECT_EQ(devpulse::leetcode::tierCount(Tiers, "Easy"), 0);
}

TEST(LeetCodeNormalizeTest, RoundsToTwoDecimalsWithinBounds) {
  EXPECT_DOUBLE_EQ(devpulse::leetcode::acceptanceRate(1, 3), 33.33);
  EXPECT_DOUBLE_EQ(devpulse::leetcode::acceptanceRate(2, 3), 66.67);
  EXPECT_DOUBLE_EQ(devpulse::leetcode::acceptanceRate(7, 5), 100.0);
}

TEST(LeetCodeInstructionsTest, EmbedsFactsAndGrindPlan) {
  auto Profile = devpulse::leetcode::normalize(sampleStats());
  auto Text = devpulse::leetcode::buildInstructions(Profile);

  EXPECT_NE(Text.find("ranked #12345"), std::string::npos);
  EXPECT_NE(Text.find("solved 120 problems"), std::string::npos);
  EXPECT_NE(Text.find("60 easy, 40 medium, 20 hard"), std::string::npos);
  EXPECT_NE(Text.find("60.00%"), std::string::npos);
  EXPECT_NE(Text.find("\"Grind Plan\""), std::string::npos);
}

class LeetCodeClientTest : public ::testing::Test {
protected:
  void SetUp() override { Http = std::make_shared<FakeTransport>(); }

  devpulse::leetcode::Client
  makeClient(std::chrono::milliseconds Timeout = 2s) {
    return devpulse::leetcode::Client(
        Http, {.GraphqlUrl = GraphqlUrl, .Timeout = Timeout}
    );
  }

  std::shared_ptr<FakeTransport> Http;
};

TEST_F(LeetCodeClientTest, PostsQueryWithUsernameVariable) {
  Http->reply(GraphqlUrl, {.Body = ProfileBody});

  auto Result = makeClient().fetchProfile("neo");
  ASSERT_TRUE(Result) << Result.error().Message;

  auto Calls = Http->calls();
  ASSERT_EQ(Calls.size(), 1u);
  EXPECT_EQ(Calls[0].Method, "POST");
  EXPECT_EQ(Calls[0].Headers.at("Content-Type"), "application/json");

  auto Request = devpulse::core::json::parse(Calls[0].Body, "request");
  ASSERT_TRUE(Request);
  const auto *Variables = devpulse::core::json::field(*Request, "variables");
  ASSERT_NE(Variables, nullptr);
  EXPECT_EQ(
      devpulse::core::json::optionalString(*Variables, "username"), "neo"
  );
  auto Query = devpulse::core::json::optionalString(*Request, "query");
  ASSERT_TRUE(Query);
  EXPECT_NE(Query->find("matchedUser"), std::string::npos);
}

TEST_F(LeetCodeClientTest, DecodesSubmissionStats) {
  Http->reply(GraphqlUrl, {.Body = ProfileBody});

  auto Result = makeClient().fetchProfile("neo");
  ASSERT_TRUE(Result) << Result.error().Message;
  EXPECT_EQ(Result->Username, "neo");
  EXPECT_EQ(Result->Ranking, 12345);
  EXPECT_EQ(Result->Reputation, 17);
  ASSERT_EQ(Result->Accepted.size(), 4u);
  ASSERT_EQ(Result->Total.size(), 4u);

  auto Profile = devpulse::leetcode::normalize(*Result);
  EXPECT_DOUBLE_EQ(Profile.AcceptanceRate, 60.0);
}

TEST_F(LeetCodeClientTest, NullMatchedUserIsNotFound) {
  Http->reply(GraphqlUrl, {.Body = R"({
    "errors": [{"message": "That user does not exist."}],
    "data": {"matchedUser": null}
  })"});

  auto Result = makeClient().fetchProfile("ghost");
  ASSERT_FALSE(Result);
  EXPECT_EQ(Result.error().Kind, ErrorKind::NotFound);
  EXPECT_NE(Result.error().Message.find("ghost"), std::string::npos);
  EXPECT_NE(Result.error().Message.find("LeetCode"), std::string::npos);
}

TEST_F(LeetCodeClientTest, MissingDataIsUpstreamFailure) {
  Http->reply(GraphqlUrl, {.Body = R"({"errors":[{"message":"boom"}]})"});

  auto Result = makeClient().fetchProfile("neo");
  ASSERT_FALSE(Result);
  EXPECT_EQ(Result.error().Kind, ErrorKind::UpstreamFailure);
}

TEST_F(LeetCodeClientTest, MissingUsernameFailsClosed) {
  Http->reply(GraphqlUrl, {.Body = R"({
    "data": {"matchedUser": {"profile": {"ranking": 1}}}
  })"});

  auto Result = makeClient().fetchProfile("neo");
  ASSERT_FALSE(Result);
  EXPECT_EQ(Result.error().Kind, ErrorKind::UpstreamFailure);
}

TEST_F(LeetCodeClientTest, NonSuccessStatusIsUpstreamFailureWithStatus) {
  Http->reply(GraphqlUrl, {.Status = 429, .Body = "slow down"});

  auto Result = makeClient().fetchProfile("neo");
  ASSERT_FALSE(Result);
  EXPECT_EQ(Result.error().Kind, ErrorKind::UpstreamFailure);
  EXPECT_NE(Result.error().Message.find("429"), std::string::npos);
}

TEST_F(LeetCodeClientTest, UnparsableBodyIsUpstreamFailure) {
  Http->reply(GraphqlUrl, {.Body = "<html>maintenance</html>"});

  auto Result = makeClient().fetchProfile("neo");
  ASSERT_FALSE(Result);
  EXPECT_EQ(Result.error().Kind, ErrorKind::UpstreamFailure);
}

TEST_F(LeetCodeClientTest, ConnectionErrorIsUpstreamFailure) {
  Http->reply(
      GraphqlUrl, {.Failure = std::make_error_code(std::errc::timed_out)}
  );

  auto Result = makeClient().fetchProfile("neo");
  ASSERT_FALSE(Result);
  EXPECT_EQ(Result.error().Kind, ErrorKind::UpstreamFailure);
}

TEST_F(LeetCodeClientTest, HungRequestTimesOut) {
  Http->reply(GraphqlUrl, {.Hang = true});

  auto Result = makeClient(50ms).fetchProfile("neo");
  ASSERT_FALSE(Result);
  EXPECT_NE(Result.error().Message.find("timed out"), std::string::npos);
}
