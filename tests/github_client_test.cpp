#include <gtest/gtest.h>

#include "devpulse/github/client.hpp"
#include "fake_transport.hpp"

#include <chrono>
#include <memory>
#include <string>

using namespace std::chrono_literals;
using devpulse::core::ErrorKind;
using devpulse::testing::FakeReply;
using devpulse::testing::FakeTransport;

namespace {

constexpr const char *ProfileUrl = "https://api.test/users/octocat";
constexpr const char *ReposUrl =
    "https://api.test/users/octocat/repos?per_page=100";

constexpr const char *ProfileBody = R"({
  "login": "octocat",
  "name": "The Octocat",
  "bio": null,
  "followers": 42,
  "following": 7,
  "public_repos": 8,
  "created_at": "2011-01-25T18:44:36Z",
  "updated_at": "2024-01-01T00:00:00Z",
  "twitter_username": "octo"
})";

constexpr const char *ReposBody = R"([
  {"name": "a", "stargazers_count": 10, "fork": false, "language": "Go"},
  {"name": "b", "stargazers_count": 5, "fork": true, "language": null},
  {"name": "c", "fork": false, "language": "Rust"}
])";

FakeReply connectionRefused() {
  return {.Failure = std::make_error_code(std::errc::connection_refused)};
}

} // namespace

class GitHubClientTest : public ::testing::Test {
protected:
  void SetUp() override { Http = std::make_shared<FakeTransport>(); }

  devpulse::github::Client makeClient(std::chrono::milliseconds Timeout = 2s) {
    return devpulse::github::Client(
        Http,
        {
            .BaseUrl = "https://api.test",
            .Token = std::nullopt,
            .Timeout = Timeout,
        }
    );
  }

  std::shared_ptr<FakeTransport> Http;
};

TEST_F(GitHubClientTest, DecodesProfileAndRepositories) {
  Http->reply(ProfileUrl, {.Body = ProfileBody});
  Http->reply(ReposUrl, {.Body = ReposBody});

  auto Result = makeClient().fetchProfile("octocat");
  ASSERT_TRUE(Result) << Result.error().Message;

  const auto &Profile = Result->Profile;
  EXPECT_EQ(Profile.Login, "octocat");
  EXPECT_EQ(Profile.Name, "The Octocat");
  EXPECT_FALSE(Profile.Bio.has_value());
  EXPECT_EQ(Profile.Followers, 42);
  EXPECT_EQ(Profile.Following, 7);
  EXPECT_EQ(Profile.PublicRepos, 8);
  EXPECT_EQ(Profile.TwitterUsername, "octo");

  ASSERT_TRUE(Result->RepositoriesAvailable);
  ASSERT_EQ(Result->Repositories.size(), 3u);
  EXPECT_EQ(Result->Repositories[0].Stars, 10);
  EXPECT_TRUE(Result->Repositories[1].Fork);
  EXPECT_FALSE(Result->Repositories[1].Language.has_value());
  EXPECT_EQ(Result->Repositories[2].Stars, 0);
}

TEST_F(GitHubClientTest, SendsIdentifyingHeaders) {
  Http->reply(ProfileUrl, {.Body = ProfileBody});
  Http->reply(ReposUrl, {.Body = "[]"});

  ASSERT_TRUE(makeClient().fetchProfile("octocat"));

  auto Calls = Http->calls();
  ASSERT_EQ(Calls.size(), 2u);
  for (const auto &Call : Calls) {
    EXPECT_EQ(Call.Method, "GET");
    EXPECT_EQ(Call.Headers.at("User-Agent"), "devpulse");
    EXPECT_EQ(Call.Headers.at("Accept"), "application/vnd.github+json");
    EXPECT_FALSE(Call.Headers.contains("Authorization"));
  }
}

TEST_F(GitHubClientTest, AddsBearerTokenWhenConfigured) {
  Http->reply(ProfileUrl, {.Body = ProfileBody});
  devpulse::github::Client Client(
      Http,
      {.BaseUrl = "https://api.test", .Token = "ghp_secret", .Timeout = 2s}
  );

  ASSERT_TRUE(Client.fetchProfile("octocat"));
  EXPECT_EQ(
      Http->calls().front().Headers.at("Authorization"), "Bearer ghp_secret"
  );
}

TEST_F(GitHubClientTest, StartsBothRequestsBeforeEitherCompletes) {
  // Nothing is answered until both requests have been issued; a client that
  // awaited the profile before asking for repositories would time out here.
  Http->releaseAfter(2);
  Http->reply(ProfileUrl, {.Body = ProfileBody});
  Http->reply(ReposUrl, {.Body = ReposBody});

  auto Result = makeClient(500ms).fetchProfile("octocat");
  ASSERT_TRUE(Result) << Result.error().Message;
  EXPECT_TRUE(Result->RepositoriesAvailable);

  auto Calls = Http->calls();
  ASSERT_EQ(Calls.size(), 2u);
  EXPECT_EQ(Calls[0].Url, ProfileUrl);
  EXPECT_EQ(Calls[1].Url, ReposUrl);
}

TEST_F(GitHubClientTest, RepositoryFailureDoesNotFailTheCall) {
  Http->reply(ProfileUrl, {.Body = ProfileBody});
  Http->reply(ReposUrl, {.Status = 500, .Body = "oops"});

  auto Result = makeClient().fetchProfile("octocat");
  ASSERT_TRUE(Result) << Result.error().Message;
  EXPECT_FALSE(Result->RepositoriesAvailable);
  EXPECT_TRUE(Result->Repositories.empty());
}

TEST_F(GitHubClientTest, RepositoryConnectionErrorDoesNotFailTheCall) {
  Http->reply(ProfileUrl, {.Body = ProfileBody});
  Http->reply(ReposUrl, connectionRefused());

  auto Result = makeClient().fetchProfile("octocat");
  ASSERT_TRUE(Result) << Result.error().Message;
  EXPECT_TRUE(Result->Repositories.empty());
}

TEST_F(GitHubClientTest, MalformedRepositoryListIsTreatedAsUnavailable) {
  Http->reply(ProfileUrl, {.Body = ProfileBody});
  Http->reply(ReposUrl, {.Body = R"({"message": "API rate limit exceeded"})"});

  auto Result = makeClient().fetchProfile("octocat");
  ASSERT_TRUE(Result) << Result.error().Message;
  EXPECT_FALSE(Result->RepositoriesAvailable);
}

TEST_F(GitHubClientTest, MissingProfileIsNotFound) {
  Http->reply(ReposUrl, {.Body = "[]"});

  auto Result = makeClient().fetchProfile("octocat");
  ASSERT_FALSE(Result);
  EXPECT_EQ(Result.error().Kind, ErrorKind::NotFound);
  EXPECT_NE(Result.error().Message.find("octocat"), std::string::npos);
  EXPECT_NE(Result.error().Message.find("GitHub"), std::string::npos);
}

TEST_F(GitHubClientTest, ServerErrorIsUpstreamFailureWithStatus) {
  Http->reply(ProfileUrl, {.Status = 503, .Body = "unavailable"});
  Http->reply(ReposUrl, {.Body = "[]"});

  auto Result = makeClient().fetchProfile("octocat");
  ASSERT_FALSE(Result);
  EXPECT_EQ(Result.error().Kind, ErrorKind::UpstreamFailure);
  EXPECT_NE(Result.error().Message.find("503"), std::string::npos);
}

TEST_F(GitHubClientTest, ForbiddenIsUpstreamFailureNotNotFound) {
  Http->reply(ProfileUrl, {.Status = 403, .Body = "rate limited"});

  auto Result = makeClient().fetchProfile("octocat");
  ASSERT_FALSE(Result);
  EXPECT_EQ(Result.error().Kind, ErrorKind::UpstreamFailure);
  EXPECT_NE(Result.error().Message.find("403"), std::string::npos);
}

TEST_F(GitHubClientTest, ProfileConnectionErrorFailsTheCall) {
  Http->reply(ProfileUrl, connectionRefused());
  Http->reply(ReposUrl, {.Body = ReposBody});

  auto Result = makeClient().fetchProfile("octocat");
  ASSERT_FALSE(Result);
  EXPECT_EQ(Result.error().Kind, ErrorKind::UpstreamFailure);
}

TEST_F(GitHubClientTest, ProfileWithoutLoginFailsClosed) {
  Http->reply(ProfileUrl, {.Body = R"({"name": "Nobody", "followers": 3})"});
  Http->reply(ReposUrl, {.Body = "[]"});

  auto Result = makeClient().fetchProfile("octocat");
  ASSERT_FALSE(Result);
  EXPECT_EQ(Result.error().Kind, ErrorKind::UpstreamFailure);
  EXPECT_NE(Result.error().Message.find("login"), std::string::npos);
}

TEST_F(GitHubClientTest, OptionalFieldsOfUnexpectedTypeFallBackToDefaults) {
  Http->reply(ProfileUrl, {.Body = R"({
    "login": "octocat", "name": 17, "followers": "many", "following": -4
  })"});
  Http->reply(ReposUrl, {.Body = R"([
    {"stargazers_count": "x", "fork": "yes", "language": 3}, 5
  ])"});

  auto Result = makeClient().fetchProfile("octocat");
  ASSERT_TRUE(Result) << Result.error().Message;
  EXPECT_FALSE(Result->Profile.Name.has_value());
  EXPECT_EQ(Result->Profile.Followers, 0);
  EXPECT_EQ(Result->Profile.Following, 0);
  ASSERT_EQ(Result->Repositories.size(), 1u);
  EXPECT_EQ(Result->Repositories[0].Stars, 0);
  EXPECT_FALSE(Result->Repositories[0].Fork);
  EXPECT_FALSE(Result->Repositories[0].Language.has_value());
}

TEST_F(GitHubClientTest, HungProfileRequestTimesOut) {
  Http->reply(ProfileUrl, {.Hang = true});
  Http->reply(ReposUrl, {.Body = "[]"});

  auto Result = makeClient(50ms).fetchProfile("octocat");
  ASSERT_FALSE(Result);
  EXPECT_EQ(Result.error().Kind, ErrorKind::UpstreamFailure);
  EXPECT_NE(Result.error().Message.find("timed out"), std::string::npos);
}
