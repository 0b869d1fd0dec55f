#include "devpulse/leetcode/normalize.hpp"

#include <algorithm>
#include <cmath>

namespace devpulse::leetcode {

static const models::TierCount *findTier(
    const std::vector<models::TierCount> &Tiers, std::string_view Difficulty
) {
  auto It =
      std::ranges::find(Tiers, Difficulty, &models::TierCount::Difficulty);
  return It == Tiers.end() ? nullptr : &*It;
}

int64_t tierCount(
    const std::vector<models::TierCount> &Tiers, std::string_view Difficulty
) {
  const auto *Tier = findTier(Tiers, Difficulty);
  return Tier ? Tier->Count : 0;
}

int64_t tierSubmissions(
    const std::vector<models::TierCount> &Tiers, std::string_view Difficulty
) {
  const auto *Tier = findTier(Tiers, Difficulty);
  return Tier ? Tier->Submissions : 0;
}

double acceptanceRate(int64_t Solved, int64_t Submissions) {
  if (Submissions <= 0 || Solved <= 0) {
    return 0.0;
  }
  auto Percent =
      static_cast<double>(Solved) / static_cast<double>(Submissions) * 100.0;
  return std::min(std::round(Percent * 100.0) / 100.0, 100.0);
}

models::LeetCodeProfile normalize(const models::RawSubmissionStats &Stats) {
  auto TotalSolved = tierCount(Stats.Accepted, models::TierAll);
  auto TotalSubmissions = tierSubmissions(Stats.Total, models::TierAll);

  return models::LeetCodeProfile{
      .Username = Stats.Username,
      .Ranking = Stats.Ranking,
      .Reputation = Stats.Reputation,
      .TotalSolved = TotalSolved,
      .EasySolved = tierCount(Stats.Accepted, models::TierEasy),
      .MediumSolved = tierCount(Stats.Accepted, models::TierMedium),
      .HardSolved = tierCount(Stats.Accepted, models::TierHard),
      .TotalSubmissions = TotalSubmissions,
      .AcceptanceRate = acceptanceRate(TotalSolved, TotalSubmissions),
  };
}

} // namespace devpulse::leetcode
