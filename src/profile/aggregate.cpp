#include "devpulse/profile/aggregate.hpp"

#include "devpulse/core/logging.hpp"
#include "devpulse/github/instructions.hpp"
#include "devpulse/github/normalize.hpp"
#include "devpulse/leetcode/instructions.hpp"
#include "devpulse/leetcode/normalize.hpp"
#include "devpulse/profile/identifier.hpp"

#include <string>
#include <utility>

namespace devpulse::profile {

std::expected<github::models::GitHubProfile, core::Error> getGitHubProfileData(
    const github::Client &Client,
    std::string_view IdentifierOrUrl,
    core::Timestamp Now
) {
  auto Handle = resolveHandle(IdentifierOrUrl);
  if (!Handle) {
    return std::unexpected(Handle.error());
  }

  auto Start = std::chrono::steady_clock::now();
  auto Fetched = Client.fetchProfile(*Handle);
  if (!Fetched) {
    return std::unexpected(Fetched.error());
  }

  auto Profile = github::normalize(*Fetched, Now);
  Profile.Instructions = github::buildInstructions(Profile);

  auto Duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - Start
  );
  core::logger("github")->info(
      "Profile '{}' aggregated in {}ms ({} stars, {} repositories listed)",
      Profile.Username,
      Duration.count(),
      Profile.TotalStars,
      Fetched->Repositories.size()
  );
  return Profile;
}

std::expected<leetcode::models::LeetCodeProfile, core::Error>
getLeetCodeProfileData(
    const leetcode::Client &Client, std::string_view Handle
) {
  auto Trimmed = trim(Handle);
  if (Trimmed.empty()) {
    return std::unexpected(
        core::invalidInput("A LeetCode username is required")
    );
  }

  auto Stats = Client.fetchProfile(Trimmed);
  if (!Stats) {
    return std::unexpected(Stats.error());
  }

  auto Profile = leetcode::normalize(*Stats);
  Profile.Instructions = leetcode::buildInstructions(Profile);

  core::logger("leetcode")->info(
      "Profile '{}' aggregated ({} solved, {:.2f}% acceptance)",
      Profile.Username,
      Profile.TotalSolved,
      Profile.AcceptanceRate
  );
  return Profile;
}

} // namespace devpulse::profile
