#include "devpulse/github/normalize.hpp"

#include "devpulse/core/logging.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>

namespace devpulse::github {

static auto Log() { return core::logger("github"); }

static long long daysSince(
    const std::optional<std::string> &Raw,
    core::Timestamp Now,
    std::string_view Field
) {
  if (!Raw) {
    return 0;
  }
  auto Parsed = core::parseTimestamp(*Raw);
  if (!Parsed) {
    Log()->warn("Ignoring unparsable {} timestamp '{}'", Field, *Raw);
    return 0;
  }
  return core::daysBetween(*Parsed, Now);
}

// Counts are non-negative, so only the upper bound can be crossed.
static int64_t saturatingAdd(int64_t Lhs, int64_t Rhs) {
  constexpr auto Max = std::numeric_limits<int64_t>::max();
  return Rhs > Max - Lhs ? Max : Lhs + Rhs;
}

std::vector<std::string> topLanguages(
    const std::vector<models::RawRepository> &Repositories, std::size_t Limit
) {
  std::vector<std::pair<std::string, int>> Counts;
  for (const auto &Repository : Repositories) {
    if (!Repository.Language || Repository.Language->empty() ||
        *Repository.Language == "null") {
      continue;
    }
    auto It = std::ranges::find(
        Counts, *Repository.Language, &std::pair<std::string, int>::first
    );
    if (It == Counts.end()) {
      Counts.emplace_back(*Repository.Language, 1);
    } else {
      ++It->second;
    }
  }

  std::ranges::stable_sort(Counts, [](const auto &Lhs, const auto &Rhs) {
    return Lhs.second > Rhs.second;
  });

  std::vector<std::string> Top;
  for (auto &[Language, Count] : Counts) {
    if (Top.size() == Limit) {
      break;
    }
    Top.push_back(std::move(Language));
  }
  return Top;
}

models::GitHubProfile
normalize(const models::FetchedProfile &Fetched, core::Timestamp Now) {
  const auto &Profile = Fetched.Profile;

  int64_t TotalStars = 0;
  int64_t ForkedRepos = 0;
  for (const auto &Repository : Fetched.Repositories) {
    TotalStars = saturatingAdd(TotalStars, Repository.Stars);
    if (Repository.Fork) {
      ++ForkedRepos;
    }
  }

  return models::GitHubProfile{
      .Username = Profile.Login,
      .Name = Profile.Name,
      .Bio = Profile.Bio,
      .Followers = Profile.Followers,
      .Following = Profile.Following,
      .PublicRepos = Profile.PublicRepos,
      .TotalStars = TotalStars,
      .ForkedRepos = ForkedRepos,
      .AccountAgeDays = daysSince(Profile.CreatedAt, Now, "created_at"),
      .DaysSinceLastActivity =
          daysSince(Profile.UpdatedAt, Now, "updated_at"),
      .TopLanguages = topLanguages(Fetched.Repositories),
      .TwitterUsername = Profile.TwitterUsername,
  };
}

} // namespace devpulse::github
