#pragma once
#include "devpulse/core/config.hpp"
#include "devpulse/core/http.hpp"
#include "devpulse/core/result.hpp"
#include "devpulse/github/models.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace devpulse::github {

struct ClientOptions {
  std::string BaseUrl{"https://api.github.com"};
  std::optional<std::string> Token;
  std::chrono::steady_clock::duration Timeout{std::chrono::seconds(10)};

  static ClientOptions fromConfig(const core::Config &Cfg);
};

class Client {
public:
  Client(std::shared_ptr<core::Transport> Http, ClientOptions Options);

  // Fetches the account profile and up to 100 owned repositories. Both
  // requests are in flight at the same time and share one deadline.
  //
  // The profile is required: a 404 yields NotFound, any other failure
  // UpstreamFailure. The repository list is optional: when it fails the
  // result carries an empty list and RepositoriesAvailable is false.
  std::expected<models::FetchedProfile, core::Error>
  fetchProfile(std::string_view Handle) const;

private:
  core::Headers requestHeaders() const;

  std::shared_ptr<core::Transport> Http;
  ClientOptions Options;
};

} // namespace devpulse::github
