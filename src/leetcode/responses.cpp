#include "devpulse/leetcode/responses.hpp"

#include "devpulse/core/json.hpp"

#include <format>
#include <variant>
#include <vector>

namespace devpulse::leetcode::responses {

static std::vector<models::TierCount>
decodeTiers(const glz::generic *SubmitStats, std::string_view Key) {
  std::vector<models::TierCount> Tiers;
  if (SubmitStats == nullptr) {
    return Tiers;
  }
  const auto *Items = core::json::arrayField(*SubmitStats, Key);
  if (Items == nullptr) {
    return Tiers;
  }
  for (const auto &Item : *Items) {
    auto Difficulty = core::json::optionalString(Item, "difficulty");
    if (!Difficulty) {
      continue;
    }
    Tiers.push_back(models::TierCount{
        .Difficulty = *Difficulty,
        .Count = core::json::countOr(Item, "count"),
        .Submissions = core::json::countOr(Item, "submissions"),
    });
  }
  return Tiers;
}

std::expected<models::RawSubmissionStats, core::Error>
decodeProfile(const glz::generic &Document, std::string_view Handle) {
  if (core::json::objectField(Document, "data") == nullptr) {
    return std::unexpected(
        core::upstreamFailure("LeetCode response is missing the 'data' object")
    );
  }
  const auto &Data = *core::json::field(Document, "data");

  const auto *MatchedUser = core::json::field(Data, "matchedUser");
  if (MatchedUser == nullptr ||
      !std::holds_alternative<glz::generic::object_t>(MatchedUser->data)) {
    return std::unexpected(
        core::notFound(std::format("LeetCode user '{}' was not found", Handle))
    );
  }

  auto Username = core::json::requiredString(
      *MatchedUser, "username", "LeetCode profile"
  );
  if (!Username) {
    return std::unexpected(Username.error());
  }

  models::RawSubmissionStats Stats{.Username = *Username};
  if (const auto *Profile = core::json::field(*MatchedUser, "profile")) {
    Stats.Ranking = core::json::countOr(*Profile, "ranking");
    Stats.Reputation = core::json::countOr(*Profile, "reputation");
  }

  const auto *SubmitStats = core::json::field(*MatchedUser, "submitStats");
  Stats.Accepted = decodeTiers(SubmitStats, "acSubmissionNum");
  Stats.Total = decodeTiers(SubmitStats, "totalSubmissionNum");
  return Stats;
}

} // namespace devpulse::leetcode::responses
