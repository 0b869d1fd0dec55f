#include "devpulse/leetcode/instructions.hpp"

#include <format>

namespace devpulse::leetcode {

std::string buildInstructions(const models::LeetCodeProfile &Profile) {
  return std::format(
      "LeetCode user {} is ranked #{} and has solved {} problems "
      "({} easy, {} medium, {} hard) with an acceptance rate of {:.2f}% "
      "and a reputation of {}.\n"
      "Task: 1) Critique their problem-solving record honestly and with "
      "humour, based only on the numbers above. 2) Then add a section titled "
      "\"{}\" with a concrete weekly practice plan targeting their weakest "
      "difficulty tier.",
      Profile.Username,
      Profile.Ranking,
      Profile.TotalSolved,
      Profile.EasySolved,
      Profile.MediumSolved,
      Profile.HardSolved,
      Profile.AcceptanceRate,
      Profile.Reputation,
      GrindPlanTitle
  );
}

} // namespace devpulse::leetcode
