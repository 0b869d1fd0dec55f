#include "devpulse/github/client.hpp"

#include "devpulse/core/json.hpp"
#include "devpulse/core/logging.hpp"
#include "devpulse/github/responses.hpp"

#include <format>
#include <utility>

namespace devpulse::github {

static auto Log() { return core::logger("github"); }

namespace {

enum class Policy { Required, Optional };

// Turns a settled response into a decoded payload. A 404 on a required part
// is the handle not existing; any other non-2xx is an upstream failure.
template <typename Decoder>
auto interpret(
    std::expected<glz::response, core::Error> Outcome,
    Policy Part,
    std::string_view Handle,
    std::string_view What,
    Decoder &&Decode
) -> decltype(Decode(std::declval<const glz::generic &>())) {
  if (!Outcome) {
    return std::unexpected(Outcome.error());
  }

  auto Status = static_cast<int>(Outcome->status_code);
  if (Status == static_cast<int>(core::HttpStatus::NotFound) &&
      Part == Policy::Required) {
    return std::unexpected(
        core::notFound(std::format("GitHub user '{}' was not found", Handle))
    );
  }
  if (!core::isSuccess(Status)) {
    return std::unexpected(core::upstreamFailure(
        std::format("{} request returned HTTP status {}", What, Status)
    ));
  }

  auto Document = core::json::parse(Outcome->response_body, What);
  if (!Document) {
    return std::unexpected(Document.error());
  }
  return Decode(*Document);
}

} // namespace

ClientOptions ClientOptions::fromConfig(const core::Config &Cfg) {
  return ClientOptions{
      .BaseUrl = Cfg.GitHubApiUrl,
      .Token = Cfg.GitHubToken,
      .Timeout = Cfg.RequestTimeout,
  };
}

Client::Client(std::shared_ptr<core::Transport> Http, ClientOptions Options)
    : Http(std::move(Http)), Options(std::move(Options)) {}

core::Headers Client::requestHeaders() const {
  core::Headers Headers = {
      {"Accept", "application/vnd.github+json"},
      {"User-Agent", "devpulse"},
      {"X-GitHub-Api-Version", "2022-11-28"},
  };
  if (Options.Token) {
    Headers.emplace("Authorization", std::format("Bearer {}", *Options.Token));
  }
  return Headers;
}

std::expected<models::FetchedProfile, core::Error>
Client::fetchProfile(std::string_view Handle) const {
  if (!Http) {
    Log()->error("HTTP transport is null");
    return std::unexpected(
        core::Error{core::ErrorKind::Internal, "HTTP transport is null"}
    );
  }

  auto Headers = requestHeaders();
  auto ProfileUrl = std::format("{}/users/{}", Options.BaseUrl, Handle);
  auto ReposUrl = std::format(
      "{}/users/{}/repos?per_page=100", Options.BaseUrl, Handle
  );

  // Fan out: both requests are started before either is awaited.
  auto PendingProfile = Http->get(ProfileUrl, Headers);
  auto PendingRepos = Http->get(ReposUrl, Headers);

  // Fan in: both outcomes are collected as values before any is acted on.
  auto Deadline = std::chrono::steady_clock::now() + Options.Timeout;
  auto ProfileOutcome =
      core::settle(PendingProfile, Deadline, "GitHub profile");
  auto ReposOutcome =
      core::settle(PendingRepos, Deadline, "GitHub repositories");

  auto Profile = interpret(
      std::move(ProfileOutcome),
      Policy::Required,
      Handle,
      "GitHub profile",
      responses::decodeProfile
  );
  if (!Profile) {
    Log()->warn("GET {} failed: {}", ProfileUrl, Profile.error().Message);
    return std::unexpected(Profile.error());
  }

  models::FetchedProfile Fetched{.Profile = std::move(*Profile)};

  auto Repositories = interpret(
      std::move(ReposOutcome),
      Policy::Optional,
      Handle,
      "GitHub repositories",
      responses::decodeRepositories
  );
  if (Repositories) {
    Fetched.Repositories = std::move(*Repositories);
    Fetched.RepositoriesAvailable = true;
  } else {
    Log()->warn(
        "GET {} failed, continuing without repositories: {}",
        ReposUrl,
        Repositories.error().Message
    );
  }

  Log()->debug(
      "Fetched GitHub profile '{}' with {} repositories",
      Fetched.Profile.Login,
      Fetched.Repositories.size()
  );
  return Fetched;
}

} // namespace devpulse::github
