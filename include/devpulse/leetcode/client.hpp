#pragma once
#include "devpulse/core/config.hpp"
#include "devpulse/core/http.hpp"
#include "devpulse/core/result.hpp"
#include "devpulse/leetcode/models.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace devpulse::leetcode {

struct ClientOptions {
  std::string GraphqlUrl{"https://leetcode.com/graphql"};
  std::chrono::steady_clock::duration Timeout{std::chrono::seconds(10)};

  static ClientOptions fromConfig(const core::Config &Cfg);
};

class Client {
public:
  Client(std::shared_ptr<core::Transport> Http, ClientOptions Options);

  // One GraphQL round trip for profile and submission statistics.
  std::expected<models::RawSubmissionStats, core::Error>
  fetchProfile(std::string_view Handle) const;

private:
  std::shared_ptr<core::Transport> Http;
  ClientOptions Options;
};

} // namespace devpulse::leetcode
