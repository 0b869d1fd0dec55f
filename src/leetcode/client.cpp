#include "devpulse/leetcode/client.hpp"

#include "devpulse/core/json.hpp"
#include "devpulse/core/logging.hpp"
#include "devpulse/leetcode/responses.hpp"

#include <format>
#include <glaze/json/write.hpp>
#include <utility>

namespace devpulse::leetcode {

static auto Log() { return core::logger("leetcode"); }

ClientOptions ClientOptions::fromConfig(const core::Config &Cfg) {
  return ClientOptions{
      .GraphqlUrl = Cfg.LeetCodeApiUrl,
      .Timeout = Cfg.RequestTimeout,
  };
}

Client::Client(std::shared_ptr<core::Transport> Http, ClientOptions Options)
    : Http(std::move(Http)), Options(std::move(Options)) {}

std::expected<models::RawSubmissionStats, core::Error>
Client::fetchProfile(std::string_view Handle) const {
  if (!Http) {
    Log()->error("HTTP transport is null");
    return std::unexpected(
        core::Error{core::ErrorKind::Internal, "HTTP transport is null"}
    );
  }

  responses::ProfileRequest Request{
      .query = std::string(responses::ProfileQuery),
      .variables = {.username = std::string(Handle)},
  };
  std::string Body;
  if (auto WriteError = glz::write_json(Request, Body)) {
    return std::unexpected(core::Error{
        core::ErrorKind::Internal,
        "Failed to serialize LeetCode GraphQL request"
    });
  }

  core::Headers Headers = {
      {"Content-Type", "application/json"},
      {"Referer", "https://leetcode.com"},
      {"User-Agent", "devpulse"},
  };

  auto Pending = Http->post(Options.GraphqlUrl, Body, Headers);
  auto Outcome = core::settle(
      Pending,
      std::chrono::steady_clock::now() + Options.Timeout,
      "LeetCode profile"
  );
  if (!Outcome) {
    Log()->warn(
        "POST {} failed: {}", Options.GraphqlUrl, Outcome.error().Message
    );
    return std::unexpected(Outcome.error());
  }

  auto Status = static_cast<int>(Outcome->status_code);
  if (!core::isSuccess(Status)) {
    auto Message = std::format(
        "LeetCode profile request returned HTTP status {}", Status
    );
    Log()->warn("POST {} failed: {}", Options.GraphqlUrl, Message);
    return std::unexpected(core::upstreamFailure(std::move(Message)));
  }

  auto Document =
      core::json::parse(Outcome->response_body, "LeetCode profile");
  if (!Document) {
    Log()->warn(
        "POST {} failed: {}", Options.GraphqlUrl, Document.error().Message
    );
    return std::unexpected(Document.error());
  }

  auto Stats = responses::decodeProfile(*Document, Handle);
  if (!Stats) {
    Log()->warn(
        "LeetCode profile for '{}': {}", Handle, Stats.error().Message
    );
    return std::unexpected(Stats.error());
  }

  Log()->debug("Fetched LeetCode profile '{}'", Stats->Username);
  return Stats;
}

} // namespace devpulse::leetcode
