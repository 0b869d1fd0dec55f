#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace devpulse::leetcode::models {

inline constexpr const char *TierAll = "All";
inline constexpr const char *TierEasy = "Easy";
inline constexpr const char *TierMedium = "Medium";
inline constexpr const char *TierHard = "Hard";

// One entry of acSubmissionNum / totalSubmissionNum.
struct TierCount {
  std::string Difficulty;
  int64_t Count{0};
  int64_t Submissions{0};
};

struct RawSubmissionStats {
  std::string Username;
  int64_t Ranking{0};
  int64_t Reputation{0};
  std::vector<TierCount> Accepted;
  std::vector<TierCount> Total;
};

struct LeetCodeProfile {
  std::string Username;
  int64_t Ranking{0};
  int64_t Reputation{0};
  int64_t TotalSolved{0};
  int64_t EasySolved{0};
  int64_t MediumSolved{0};
  int64_t HardSolved{0};
  int64_t TotalSubmissions{0};
  double AcceptanceRate{0.0};
  std::string Instructions;
};

} // namespace devpulse::leetcode::models
